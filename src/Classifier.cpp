#include "Classifier.hpp"

#include "ConfigValidator.hpp"
#include "Logger.hpp"

Classifier::Classifier(const CategoryMap& categories) {
    rebuildLookup(categories);
}

void Classifier::rebuildLookup(const CategoryMap& categories) {
    m_extensionToCategory.clear();
    for (const auto& [name, extensions] : categories) {
        for (const auto& ext : extensions) {
            std::string normalized = validation::normalizeExtension(ext);
            if (normalized.empty()) {
                continue;
            }

            auto [it, inserted] = m_extensionToCategory.emplace(std::move(normalized), name);
            if (!inserted) {
                DS_LOG_WARN("Extension `." << it->first << "` is listed under both `" << it->second << "` and `"
                                           << name << "`; using `" << it->second << "`.");
            }
        }
    }
}

Classification Classifier::classify(const std::string& extension) const {
    const std::string normalized = validation::normalizeExtension(extension);
    if (!normalized.empty()) {
        auto it = m_extensionToCategory.find(normalized);
        if (it != m_extensionToCategory.end()) {
            return {it->second, true};
        }
    }
    return {kFallbackCategory, false};
}

Classification Classifier::classifyPath(const std::filesystem::path& file) const {
    if (!file.has_extension()) {
        return {kFallbackCategory, false};
    }
    return classify(file.extension().string());
}

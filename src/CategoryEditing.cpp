#include "CategoryEditing.hpp"

#include "ConfigValidator.hpp"
#include "Errors.hpp"

namespace editing {

namespace {

CategoryMap::iterator requireCategory(CategoryMap& categories, const std::string& category) {
    auto it = categories.find(category);
    if (it == categories.end()) {
        throw UnknownCategory("Category `" + category + "` does not exist.");
    }
    return it;
}

} // namespace

std::string addCategory(CategoryMap& categories, const std::string& rawName) {
    std::string name = validation::validateCategoryName(rawName);
    if (categories.count(name) != 0) {
        throw DuplicateCategory("Category `" + name + "` already exists.");
    }
    categories.emplace(name, std::set<std::string>{});
    return name;
}

std::string addExtension(CategoryMap& categories, const std::string& category, const std::string& rawExtension) {
    auto it = requireCategory(categories, category);
    std::string extension = validation::validateExtension(rawExtension);

    const std::string owner = findOwner(categories, extension);
    if (owner == category) {
        throw DuplicateExtension("Extension `." + extension + "` already exists in `" + category + "`.");
    }
    if (!owner.empty()) {
        throw DuplicateExtension("Extension `." + extension + "` is already mapped to `" + owner + "`.");
    }

    it->second.insert(extension);
    return extension;
}

std::string removeExtension(CategoryMap& categories, const std::string& category, const std::string& rawExtension) {
    auto it = requireCategory(categories, category);
    std::string extension = validation::validateExtension(rawExtension);

    // Stored sets may hold unnormalized spellings loaded from hand-edited files.
    for (auto ext = it->second.begin(); ext != it->second.end();) {
        if (validation::normalizeExtension(*ext) == extension) {
            ext = it->second.erase(ext);
        } else {
            ++ext;
        }
    }
    return extension;
}

void removeCategory(CategoryMap& categories, const std::string& name) {
    if (name == kFallbackCategory) {
        throw ProtectedCategory(std::string("The `") + kFallbackCategory + "` category cannot be deleted.");
    }
    categories.erase(requireCategory(categories, name));
}

std::string findOwner(const CategoryMap& categories, const std::string& extension) {
    const std::string wanted = validation::normalizeExtension(extension);
    if (wanted.empty()) {
        return {};
    }

    for (const auto& [name, extensions] : categories) {
        for (const auto& ext : extensions) {
            if (validation::normalizeExtension(ext) == wanted) {
                return name;
            }
        }
    }
    return {};
}

} // namespace editing

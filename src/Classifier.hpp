#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include "CategoryMap.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

struct Classification {
    std::string category;
    // False when the fallback category was chosen because nothing matched.
    bool found = false;
};

// Maps extensions to category names using a snapshot of the mapping taken at construction.
class Classifier {
public:
    explicit Classifier(const CategoryMap& categories);

    // Case-insensitive; a leading dot on the query is ignored.
    Classification classify(const std::string& extension) const;
    // Classifies by the final extension of the file name ("a.tar.gz" -> "gz").
    Classification classifyPath(const std::filesystem::path& file) const;

    std::size_t extensionCount() const { return m_extensionToCategory.size(); }

private:
    // Regenerate the extension-to-category table; the alphabetically first category wins duplicates.
    void rebuildLookup(const CategoryMap& categories);

    std::unordered_map<std::string, std::string> m_extensionToCategory;
};

#endif

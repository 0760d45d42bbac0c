#ifndef CATEGORY_STORE_HPP
#define CATEGORY_STORE_HPP

#include "CategoryMap.hpp"

#include <filesystem>

// Owns the two persisted category files inside a config folder:
// categories.json holds the built-in set, user_categories.json the user overlay.
class CategoryStore {
public:
    explicit CategoryStore(std::filesystem::path configDir);

    // Built-in mapping merged with the user overlay (whole categories replaced).
    // Writes categories.json with the defaults when it is missing.
    // Throws ConfigReadError when either file is malformed.
    CategoryMap loadCategories() const;

    // Only the built-in layer, creating categories.json like loadCategories().
    CategoryMap loadBuiltInCategories() const;

    // Atomically replaces user_categories.json. Throws ConfigWriteError.
    void saveUserCategories(const CategoryMap& categories) const;

    // Immutable default mapping used to seed categories.json.
    static CategoryMap builtInDefaults();

    const std::filesystem::path& configDir() const { return m_configDir; }
    std::filesystem::path builtInPath() const;
    std::filesystem::path userPath() const;

private:
    // Returns false when the file is missing and could not be created.
    bool ensureBuiltInFile() const;

    static CategoryMap readMappingFile(const std::filesystem::path& path);
    static void writeMappingFile(const std::filesystem::path& path, const CategoryMap& categories);

    std::filesystem::path m_configDir;
};

#endif

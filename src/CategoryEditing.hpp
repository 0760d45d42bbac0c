#ifndef CATEGORY_EDITING_HPP
#define CATEGORY_EDITING_HPP

#include "CategoryMap.hpp"

#include <string>

// In-memory edits a configuration front end applies before CategoryStore::saveUserCategories.
// Every function validates its input and returns the normalized value it stored or removed.
namespace editing {

// Throws EmptyCategoryName or DuplicateCategory.
std::string addCategory(CategoryMap& categories, const std::string& rawName);

// Throws UnknownCategory, EmptyExtension, InvalidExtensionFormat, or DuplicateExtension
// when the extension is already mapped under any category.
std::string addExtension(CategoryMap& categories, const std::string& category, const std::string& rawExtension);

// Throws UnknownCategory; removing an extension that is not present is a no-op.
std::string removeExtension(CategoryMap& categories, const std::string& category, const std::string& rawExtension);

// Throws ProtectedCategory for the fallback category and UnknownCategory for missing ones.
void removeCategory(CategoryMap& categories, const std::string& name);

// Name of the category currently holding the extension, or "" when unmapped.
std::string findOwner(const CategoryMap& categories, const std::string& extension);

} // namespace editing

#endif

#ifndef CATEGORY_MAP_HPP
#define CATEGORY_MAP_HPP

#include <map>
#include <set>
#include <string>

// Category name -> extensions (lower-case, no leading dot).
using CategoryMap = std::map<std::string, std::set<std::string>>;

// Catch-all category for files whose extension matches nothing; it always exists.
inline constexpr char kFallbackCategory[] = "Other";

#endif

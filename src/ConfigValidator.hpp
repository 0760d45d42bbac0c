#ifndef CONFIG_VALIDATOR_HPP
#define CONFIG_VALIDATOR_HPP

#include <string>

// Format checks applied to user-entered names before they reach the category store.
// Uniqueness is not checked here; callers holding the full mapping do that.
namespace validation {

// Trims, strips one leading dot and lower-cases. Throws EmptyExtension or InvalidExtensionFormat.
std::string validateExtension(const std::string& raw);

// Returns the trimmed name. Throws EmptyCategoryName when nothing is left.
std::string validateCategoryName(const std::string& raw);

// Lenient counterpart of validateExtension used for lookups: never throws, may return "".
std::string normalizeExtension(std::string extension);

std::string trim(const std::string& value);

} // namespace validation

#endif

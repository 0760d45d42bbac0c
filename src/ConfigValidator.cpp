#include "ConfigValidator.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <cctype>

namespace validation {

std::string trim(const std::string& value) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    auto first = std::find_if(value.begin(), value.end(), notSpace);
    auto last = std::find_if(value.rbegin(), value.rend(), notSpace).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string normalizeExtension(std::string extension) {
    extension = trim(extension);
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(extension.begin());
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

std::string validateExtension(const std::string& raw) {
    if (trim(raw).empty()) {
        throw EmptyExtension("Extension cannot be empty.");
    }

    std::string extension = normalizeExtension(raw);
    const bool alphanumeric = !extension.empty() && std::all_of(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0;
    });
    if (!alphanumeric) {
        throw InvalidExtensionFormat("Extension `" + trim(raw) + "` must be alphanumeric.");
    }
    return extension;
}

std::string validateCategoryName(const std::string& raw) {
    std::string name = trim(raw);
    if (name.empty()) {
        throw EmptyCategoryName("Category name cannot be empty.");
    }
    return name;
}

} // namespace validation

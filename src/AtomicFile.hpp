#ifndef ATOMIC_FILE_HPP
#define ATOMIC_FILE_HPP

#include <filesystem>
#include <string>

// Writes text to `<path>.tmp` and renames it over `path`, so readers see either the old
// or the new contents. Creates missing parent folders. Throws ConfigWriteError.
void writeFileAtomically(const std::filesystem::path& path, const std::string& contents);

#endif

#ifndef DROP_SCANNER_HPP
#define DROP_SCANNER_HPP

#include <filesystem>
#include <vector>

// One item waiting in the drop folder.
struct DropItem {
    std::filesystem::path path;
    // Directories are moved as a single unit rather than split by extension.
    bool isDirectory = false;
};

struct ScanOptions {
    // true: top-level files and folders are items, folders are not descended into.
    // false: every regular file below the root is an item and folders stay in place.
    bool moveFoldersWhole = true;
};

class DropScanner {
public:
    explicit DropScanner(ScanOptions options = {});

    // Snapshot of the drop folder sorted by path. Symlinks and special files are skipped.
    // Throws InvalidDirectory when the root is missing, not a directory, or unreadable.
    std::vector<DropItem> scan(const std::filesystem::path& root) const;

private:
    void scanTopLevel(const std::filesystem::path& root, std::vector<DropItem>& out) const;
    void scanRecursive(const std::filesystem::path& root, std::vector<DropItem>& out) const;

    ScanOptions m_options;
};

#endif

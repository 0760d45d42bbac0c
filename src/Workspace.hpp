#ifndef WORKSPACE_HPP
#define WORKSPACE_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Folder layout below a user-chosen workspace root.
class Workspace {
public:
    explicit Workspace(std::filesystem::path root);

    // Throws NoLocationFound when the root is empty or missing and InvalidDirectory when it is
    // not a directory; otherwise creates Drop/, Sorted/ and the config folder as needed.
    void ensure() const;

    const std::filesystem::path& root() const { return m_root; }
    std::filesystem::path dropDir() const;
    std::filesystem::path sortedDir() const;
    std::filesystem::path appDir() const;
    std::filesystem::path configDir() const;
    std::filesystem::path settingsPath() const;

private:
    std::filesystem::path m_root;
};

// Plain-text file holding a single absolute workspace path.
namespace marker {

// Returns the stored path when the file exists and names an existing directory.
std::optional<std::filesystem::path> load(const std::filesystem::path& markerFile);
// Throws ConfigWriteError.
void save(const std::filesystem::path& markerFile, const std::filesystem::path& workspace);

} // namespace marker

// Most-recent-first list of workspaces, one absolute path per line.
class RecentWorkspaces {
public:
    static constexpr std::size_t kMaxEntries = 5;

    explicit RecentWorkspaces(std::filesystem::path listFile);

    // A missing file yields an empty list; blank lines are ignored.
    std::vector<std::filesystem::path> load() const;
    // Moves the workspace to the front, drops duplicates, caps the list, and persists it.
    // Throws ConfigWriteError.
    std::vector<std::filesystem::path> add(const std::filesystem::path& workspace) const;

private:
    std::filesystem::path m_listFile;
};

#endif

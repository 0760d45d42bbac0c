#include "Workspace.hpp"

#include "AtomicFile.hpp"
#include "ConfigValidator.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {
constexpr char kDropFolderName[] = "Drop";
constexpr char kSortedFolderName[] = "Sorted";
constexpr char kAppFolderName[] = "DropSorter";
constexpr char kConfigFolderName[] = "config";
constexpr char kSettingsFileName[] = "settings.json";

fs::path absoluteOrSelf(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    return ec ? path : absolute.lexically_normal();
}
} // namespace

Workspace::Workspace(fs::path root) : m_root(std::move(root)) {}

fs::path Workspace::dropDir() const { return m_root / kDropFolderName; }
fs::path Workspace::sortedDir() const { return m_root / kSortedFolderName; }
fs::path Workspace::appDir() const { return m_root / kAppFolderName; }
fs::path Workspace::configDir() const { return appDir() / kConfigFolderName; }
fs::path Workspace::settingsPath() const { return configDir() / kSettingsFileName; }

void Workspace::ensure() const {
    if (m_root.empty()) {
        throw NoLocationFound("Please choose a workspace folder first.");
    }

    std::error_code ec;
    if (!fs::exists(m_root, ec)) {
        throw NoLocationFound("Workspace `" + m_root.string() + "` does not exist" +
                              (ec ? ": " + ec.message() : std::string(".")));
    }
    if (!fs::is_directory(m_root, ec)) {
        throw InvalidDirectory("`" + m_root.string() + "` is not a valid directory.");
    }

    for (const auto& dir : {dropDir(), sortedDir(), configDir()}) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw InvalidDirectory("Cannot create `" + dir.string() + "`: " + ec.message());
        }
    }
    DS_LOG_DEBUG("Workspace ready at " << m_root.string());
}

namespace marker {

std::optional<fs::path> load(const fs::path& markerFile) {
    std::ifstream in(markerFile);
    if (!in) {
        return std::nullopt;
    }

    std::string line;
    std::getline(in, line);
    line = validation::trim(line);
    if (line.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    if (!fs::is_directory(line, ec)) {
        DS_LOG_WARN("Stored workspace `" << line << "` in " << markerFile.string() << " is missing or invalid.");
        return std::nullopt;
    }
    return fs::path(line);
}

void save(const fs::path& markerFile, const fs::path& workspace) {
    writeFileAtomically(markerFile, absoluteOrSelf(workspace).string() + "\n");
}

} // namespace marker

RecentWorkspaces::RecentWorkspaces(fs::path listFile) : m_listFile(std::move(listFile)) {}

std::vector<fs::path> RecentWorkspaces::load() const {
    std::vector<fs::path> entries;
    std::ifstream in(m_listFile);
    if (!in) {
        return entries;
    }

    std::string line;
    while (std::getline(in, line) && entries.size() < kMaxEntries) {
        line = validation::trim(line);
        if (line.empty()) {
            continue;
        }
        fs::path entry(line);
        if (std::find(entries.begin(), entries.end(), entry) == entries.end()) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::vector<fs::path> RecentWorkspaces::add(const fs::path& workspace) const {
    const fs::path entry = absoluteOrSelf(workspace);

    std::vector<fs::path> entries = load();
    entries.erase(std::remove(entries.begin(), entries.end(), entry), entries.end());
    entries.insert(entries.begin(), entry);
    if (entries.size() > kMaxEntries) {
        entries.resize(kMaxEntries);
    }

    std::string contents;
    for (const auto& path : entries) {
        contents += path.string() + "\n";
    }
    writeFileAtomically(m_listFile, contents);
    return entries;
}

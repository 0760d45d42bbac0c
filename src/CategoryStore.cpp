#include "CategoryStore.hpp"

#include "AtomicFile.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr char kBuiltInFileName[] = "categories.json";
constexpr char kUserFileName[] = "user_categories.json";
} // namespace

CategoryStore::CategoryStore(std::filesystem::path configDir) : m_configDir(std::move(configDir)) {}

std::filesystem::path CategoryStore::builtInPath() const {
    return m_configDir / kBuiltInFileName;
}

std::filesystem::path CategoryStore::userPath() const {
    return m_configDir / kUserFileName;
}

CategoryMap CategoryStore::builtInDefaults() {
    return {
        {"Video", {"mp4", "mkv", "avi", "mov", "wmv", "flv", "webm", "m4v", "mpg", "mpeg", "3gp"}},
        {"Music", {"mp3", "wav", "flac", "aac", "ogg", "wma", "m4a", "aiff", "alac"}},
        {"Code", {"py", "js", "html", "css", "java", "c", "cpp", "h", "hpp", "cs", "php", "rb", "go", "swift",
                  "kt", "json", "xml", "yml", "yaml", "sh", "bat", "ps1", "md"}},
        {"Image", {"jpg", "jpeg", "png", "gif", "bmp", "tiff", "tif", "webp", "svg", "ico", "raw", "heif", "heic"}},
        {"Document", {"pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "txt", "rtf", "odt", "ods", "odp",
                      "csv", "epub", "mobi"}},
        {"Archive", {"zip", "rar", "7z", "tar", "gz", "bz2", "xz", "iso"}},
        {"Executable", {"exe", "msi", "dmg", "app", "deb", "rpm", "apk"}},
        {kFallbackCategory, {}},
    };
}

CategoryMap CategoryStore::loadBuiltInCategories() const {
    // Serve the defaults from memory when categories.json could not be created.
    return ensureBuiltInFile() ? readMappingFile(builtInPath()) : builtInDefaults();
}

CategoryMap CategoryStore::loadCategories() const {
    CategoryMap merged = loadBuiltInCategories();

    std::error_code ec;
    const auto overlayPath = userPath();
    if (std::filesystem::exists(overlayPath, ec)) {
        for (auto& [name, extensions] : readMappingFile(overlayPath)) {
            merged[name] = std::move(extensions);
        }
    } else if (ec) {
        throw ConfigReadError("Unable to check `" + overlayPath.string() + "`: " + ec.message());
    }

    merged.emplace(kFallbackCategory, std::set<std::string>{});
    return merged;
}

void CategoryStore::saveUserCategories(const CategoryMap& categories) const {
    writeMappingFile(userPath(), categories);
    DS_LOG_INFO("Saved " << categories.size() << " user categor" << (categories.size() == 1 ? "y" : "ies")
                         << " to " << userPath().string());
}

bool CategoryStore::ensureBuiltInFile() const {
    const auto path = builtInPath();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return true;
    }
    if (ec) {
        throw ConfigReadError("Unable to check `" + path.string() + "`: " + ec.message());
    }

    // Failing to materialize the defaults is not fatal; the next load retries.
    try {
        writeMappingFile(path, builtInDefaults());
        DS_LOG_INFO("Created default category file " << path.string());
        return true;
    } catch (const ConfigWriteError& e) {
        DS_LOG_WARN(e.what());
        return false;
    }
}

CategoryMap CategoryStore::readMappingFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigReadError("Failed to open category file `" + path.string() + "`.");
    }

    json data;
    try {
        in >> data;
    } catch (const json::parse_error& e) {
        throw ConfigReadError("Failed to parse category file `" + path.string() + "`: " + e.what());
    }

    if (!data.is_object()) {
        throw ConfigReadError("Category file `" + path.string() + "` must contain a JSON object.");
    }

    CategoryMap categories;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!it.value().is_array()) {
            throw ConfigReadError("Category `" + it.key() + "` in `" + path.string() + "` must be an array.");
        }

        auto& extensions = categories[it.key()];
        for (const auto& ext : it.value()) {
            if (!ext.is_string()) {
                throw ConfigReadError("Category `" + it.key() + "` in `" + path.string() +
                                      "` contains a non-string extension.");
            }
            extensions.insert(ext.get<std::string>());
        }
    }
    return categories;
}

void CategoryStore::writeMappingFile(const std::filesystem::path& path, const CategoryMap& categories) {
    json data = json::object();
    for (const auto& [name, extensions] : categories) {
        data[name] = std::vector<std::string>(extensions.begin(), extensions.end());
    }

    writeFileAtomically(path, data.dump(2) + "\n");
}

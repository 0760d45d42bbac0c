#ifndef SETTINGS_PARSER_HPP
#define SETTINGS_PARSER_HPP

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

// Runtime knobs read from settings.json in the workspace config folder.
struct Settings {
    int intervalSeconds = 5;
    // 0 selects the hardware concurrency.
    std::size_t workerThreads = 0;
    bool moveFoldersWhole = true;
    std::string logLevel = "info";
    std::string logFile;
};

class SettingsParser {
public:
    // A missing file keeps the defaults and succeeds. Returns false on parse or
    // validation errors, in which case every setting keeps its default.
    bool load(const std::filesystem::path& filePath);

    const Settings& settings() const { return m_settings; }

private:
    // Copy recognised keys into `out`, rejecting values of the wrong type or range.
    static bool parseSettings(const nlohmann::json& data, Settings& out);

    Settings m_settings;
};

#endif

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
};

// Process-wide logger. Info and below go to stdout, warnings and errors to stderr,
// and every line is mirrored to the optional log file.
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    // Appends to the given file; an empty path disables file output.
    bool setLogFile(const std::string& path);

    void log(LogLevel level, const std::string& message);

    // Accepts "trace", "debug", "info", "warn"/"warning" or "error" in any case.
    static std::optional<LogLevel> parseLevel(std::string name);

private:
    Logger() = default;

    static const char* levelName(LogLevel level);

    mutable std::mutex m_mutex;
    LogLevel m_level = LogLevel::Info;
    std::optional<std::ofstream> m_file;
};

#define DS_LOG(lvl, expr)                                          \
    do {                                                           \
        if (::Logger::instance().enabled(lvl)) {                   \
            std::ostringstream dsLogStream_;                       \
            dsLogStream_ << expr;                                  \
            ::Logger::instance().log(lvl, dsLogStream_.str());     \
        }                                                          \
    } while (false)

#define DS_LOG_TRACE(expr) DS_LOG(LogLevel::Trace, expr)
#define DS_LOG_DEBUG(expr) DS_LOG(LogLevel::Debug, expr)
#define DS_LOG_INFO(expr) DS_LOG(LogLevel::Info, expr)
#define DS_LOG_WARN(expr) DS_LOG(LogLevel::Warn, expr)
#define DS_LOG_ERROR(expr) DS_LOG(LogLevel::Error, expr)

#endif

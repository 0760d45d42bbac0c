#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "CategoryEditing.hpp"
#include "CategoryStore.hpp"
#include "CycleScheduler.hpp"
#include "DropWatcher.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "SettingsParser.hpp"
#include "SortEngine.hpp"
#include "Workspace.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

constexpr long long kMaxWorkerThreads = 1024;

void onSignal(int) {
    g_interrupted.store(true);
}

enum class EditAction {
    None,
    List,
    AddCategory,
    AddExtension,
    RemoveExtension,
    RemoveCategory,
};

struct CommandLine {
    std::filesystem::path workspace;
    bool once = false;
    bool watch = false;
    bool recursive = false;
    bool verbose = false;
    bool showRecent = false;
    bool showHelp = false;
    std::optional<int> intervalSeconds;
    std::optional<std::size_t> workerThreads;
    std::optional<std::string> logFile;
    EditAction edit = EditAction::None;
    std::vector<std::string> editArgs;
};

void printUsage(std::ostream& out) {
    out << "Usage: DropSorter [WORKSPACE] [options]\n"
           "\n"
           "Moves files dropped into WORKSPACE/Drop into category folders under WORKSPACE/Sorted.\n"
           "Without WORKSPACE the last used workspace is reopened.\n"
           "\n"
           "Sorting:\n"
           "  --once                       run a single cycle and exit\n"
           "  --watch                      also sort as soon as new items appear\n"
           "  --interval N                 seconds between cycles (default 5)\n"
           "  --threads N                  worker threads for moves (0 = all cores)\n"
           "  --recursive                  split folders into their files instead of moving them whole\n"
           "  --verbose                    log debug output\n"
           "  --log-file PATH              also append log lines to PATH\n"
           "\n"
           "Categories:\n"
           "  --list                       print the active categories\n"
           "  --add-category NAME\n"
           "  --add-extension CATEGORY EXT\n"
           "  --remove-extension CATEGORY EXT\n"
           "  --remove-category NAME\n"
           "\n"
           "  --recent                     print recently used workspaces\n"
           "  --help\n";
}

bool parseCount(const std::string& text, long long minimum, long long maximum, long long& out) {
    try {
        std::size_t used = 0;
        const long long value = std::stoll(text, &used);
        if (used != text.size() || value < minimum || value > maximum) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseArgs(int argc, char** argv, CommandLine& cmd, std::string& err) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto setEdit = [&](EditAction action, std::size_t& i, std::size_t operands) {
        if (cmd.edit != EditAction::None) {
            err = "only one category command can be given at a time";
            return false;
        }
        if (i + operands >= args.size()) {
            err = "`" + args[i] + "` expects " + std::to_string(operands) + " argument(s)";
            return false;
        }
        cmd.edit = action;
        for (std::size_t k = 0; k < operands; ++k) {
            cmd.editArgs.push_back(args[++i]);
        }
        return true;
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto needValue = [&]() -> const std::string* {
            if (i + 1 >= args.size()) {
                err = "`" + arg + "` expects a value";
                return nullptr;
            }
            return &args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cmd.showHelp = true;
        } else if (arg == "--once") {
            cmd.once = true;
        } else if (arg == "--watch") {
            cmd.watch = true;
        } else if (arg == "--recursive") {
            cmd.recursive = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--recent") {
            cmd.showRecent = true;
        } else if (arg == "--interval" || arg == "--threads") {
            const std::string* value = needValue();
            long long number = 0;
            if (value == nullptr) {
                return false;
            }
            const bool interval = arg == "--interval";
            const long long maximum = interval ? std::numeric_limits<int>::max() : kMaxWorkerThreads;
            if (!parseCount(*value, interval ? 1 : 0, maximum, number)) {
                err = "invalid value `" + *value + "` for `" + arg + "`";
                return false;
            }
            if (interval) {
                cmd.intervalSeconds = static_cast<int>(number);
            } else {
                cmd.workerThreads = static_cast<std::size_t>(number);
            }
        } else if (arg == "--log-file") {
            const std::string* value = needValue();
            if (value == nullptr) {
                return false;
            }
            cmd.logFile = *value;
        } else if (arg == "--list") {
            if (!setEdit(EditAction::List, i, 0)) return false;
        } else if (arg == "--add-category") {
            if (!setEdit(EditAction::AddCategory, i, 1)) return false;
        } else if (arg == "--add-extension") {
            if (!setEdit(EditAction::AddExtension, i, 2)) return false;
        } else if (arg == "--remove-extension") {
            if (!setEdit(EditAction::RemoveExtension, i, 2)) return false;
        } else if (arg == "--remove-category") {
            if (!setEdit(EditAction::RemoveCategory, i, 1)) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            err = "unknown option `" + arg + "`";
            return false;
        } else if (cmd.workspace.empty()) {
            cmd.workspace = arg;
        } else {
            err = "unexpected argument `" + arg + "`";
            return false;
        }
    }
    return true;
}

// Per-user folder remembering the last workspace and the recent list.
std::filesystem::path userStateDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "dropsorter";
    }
#ifdef _WIN32
    if (const char* appData = std::getenv("APPDATA"); appData != nullptr && *appData != '\0') {
        return std::filesystem::path(appData) / "DropSorter";
    }
#else
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".config" / "dropsorter";
    }
#endif
    return std::filesystem::current_path() / ".dropsorter";
}

void printCategories(const CategoryMap& categories) {
    for (const auto& [name, extensions] : categories) {
        std::cout << name << ":";
        for (const auto& ext : extensions) {
            std::cout << " ." << ext;
        }
        std::cout << "\n";
    }
}

int runEdit(const CommandLine& cmd, const CategoryStore& store) {
    CategoryMap categories = store.loadCategories();
    if (cmd.edit == EditAction::List) {
        printCategories(categories);
        return EXIT_SUCCESS;
    }

    const auto& a = cmd.editArgs;
    switch (cmd.edit) {
        case EditAction::AddCategory: {
            const std::string name = editing::addCategory(categories, a[0]);
            std::cout << "Added category " << name << std::endl;
            break;
        }
        case EditAction::AddExtension: {
            const std::string ext = editing::addExtension(categories, a[0], a[1]);
            std::cout << "Added ." << ext << " to " << a[0] << std::endl;
            break;
        }
        case EditAction::RemoveExtension: {
            const std::string ext = editing::removeExtension(categories, a[0], a[1]);
            std::cout << "Removed ." << ext << " from " << a[0] << std::endl;
            break;
        }
        case EditAction::RemoveCategory: {
            editing::removeCategory(categories, a[0]);
            // The overlay replaces whole categories, so a built-in one can only be emptied.
            if (store.loadBuiltInCategories().count(a[0]) != 0) {
                categories[a[0]].clear();
                std::cout << "Emptied built-in category " << a[0] << std::endl;
            } else {
                std::cout << "Deleted category " << a[0] << std::endl;
            }
            break;
        }
        default:
            break;
    }

    try {
        store.saveUserCategories(categories);
    } catch (const ConfigWriteError& e) {
        std::cerr << "Could not save categories: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    std::string parseErr;
    if (!parseArgs(argc, argv, cmd, parseErr)) {
        std::cerr << "DropSorter: " << parseErr << "\n\n";
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }
    if (cmd.showHelp) {
        printUsage(std::cout);
        return EXIT_SUCCESS;
    }

    const std::filesystem::path stateDir = userStateDir();
    const RecentWorkspaces recent(stateDir / "recent_workspaces.txt");
    if (cmd.showRecent) {
        for (const auto& path : recent.load()) {
            std::cout << path.string() << "\n";
        }
        return EXIT_SUCCESS;
    }

    if (cmd.workspace.empty()) {
        if (auto stored = marker::load(stateDir / "workspace.txt")) {
            cmd.workspace = *stored;
        }
    }

    Workspace workspace(cmd.workspace);
    try {
        workspace.ensure();
    } catch (const DropSorterError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    SettingsParser settingsParser;
    if (!settingsParser.load(workspace.settingsPath())) {
        std::cerr << "Ignoring invalid settings in " << workspace.settingsPath().string() << "." << std::endl;
    }
    Settings settings = settingsParser.settings();
    if (cmd.intervalSeconds) settings.intervalSeconds = *cmd.intervalSeconds;
    if (cmd.workerThreads) settings.workerThreads = *cmd.workerThreads;
    if (cmd.recursive) settings.moveFoldersWhole = false;
    if (cmd.verbose) settings.logLevel = "debug";
    if (cmd.logFile) settings.logFile = *cmd.logFile;

    Logger::instance().setLevel(Logger::parseLevel(settings.logLevel).value_or(LogLevel::Info));
    if (!settings.logFile.empty() && !Logger::instance().setLogFile(settings.logFile)) {
        std::cerr << "Cannot open log file `" << settings.logFile << "`; logging to the console only." << std::endl;
    }

    try {
        marker::save(stateDir / "workspace.txt", workspace.root());
        recent.add(workspace.root());
    } catch (const ConfigWriteError& e) {
        DS_LOG_WARN("Could not remember workspace: " << e.what());
    }

    const CategoryStore store(workspace.configDir());

    if (cmd.edit != EditAction::None) {
        try {
            return runEdit(cmd, store);
        } catch (const DropSorterError& e) {
            std::cerr << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    SortOptions sortOptions;
    sortOptions.workerThreads = settings.workerThreads;
    sortOptions.scan.moveFoldersWhole = settings.moveFoldersWhole;
    const SortEngine engine(store, sortOptions);

    if (cmd.once) {
        try {
            const SortReport report = engine.sortFolder(workspace.dropDir(), workspace.sortedDir());
            std::cout << report.summary() << std::endl;
            for (const auto& failure : report.failures) {
                std::cerr << "  " << failure.source.string() << ": " << failure.reason << std::endl;
            }
            return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
        } catch (const DropSorterError& e) {
            std::cerr << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    SchedulerOptions schedulerOptions;
    schedulerOptions.intervalTicks = settings.intervalSeconds;
    CycleScheduler scheduler(engine, schedulerOptions);
    scheduler.setProgressListener([](std::size_t completed, std::size_t total) {
        DS_LOG_DEBUG("Processed " << completed << "/" << total);
    });
    scheduler.setCycleListener([](const SortReport& report) {
        if (report.total > 0) {
            std::cout << "DropSorter: " << report.summary() << std::endl;
        }
    });

    scheduler.start(workspace.dropDir(), workspace.sortedDir());
    scheduler.runInBackground();

    DropWatcher watcher(workspace.dropDir(), [&scheduler]() { scheduler.triggerNow(); });
    if (cmd.watch && !watcher.start()) {
        DS_LOG_WARN("Falling back to polling every " << settings.intervalSeconds << " second(s).");
    }

    while (!g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    DS_LOG_INFO("Shutting down...");
    watcher.stop();
    scheduler.shutdown();
    return EXIT_SUCCESS;
}

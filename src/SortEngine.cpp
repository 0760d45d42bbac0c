#include "SortEngine.hpp"

#include "Classifier.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "ThreadPool.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <set>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#elif defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

#include <cerrno>
#endif

namespace fs = std::filesystem;

namespace {

#if defined(_WIN32) || defined(__APPLE__)
constexpr bool kCaseInsensitiveNames = true;
#else
constexpr bool kCaseInsensitiveNames = false;
#endif

// Key under which a target is claimed; folds case where the filesystem does.
std::string targetKey(const fs::path& target) {
    std::string key = target.lexically_normal().string();
    if (kCaseInsensitiveNames) {
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return key;
}

bool isAlreadyExists(const std::error_code& ec) {
#ifdef _WIN32
    if (ec.category() == std::system_category() &&
        (ec.value() == ERROR_ALREADY_EXISTS || ec.value() == ERROR_FILE_EXISTS)) {
        return true;
    }
#endif
    return ec == std::errc::file_exists || ec == std::errc::directory_not_empty;
}

bool isCrossDevice(const std::error_code& ec) {
#ifdef _WIN32
    if (ec.category() == std::system_category() && ec.value() == ERROR_NOT_SAME_DEVICE) {
        return true;
    }
#endif
    return ec == std::errc::cross_device_link;
}

// Renames `source` to `target`, failing with file_exists instead of replacing an existing entry.
std::error_code renameNoReplace(const fs::path& source, const fs::path& target) {
#ifdef _WIN32
    // without MOVEFILE_REPLACE_EXISTING the call refuses to touch an existing target
    if (!MoveFileExW(source.c_str(), target.c_str(), 0)) {
        return std::error_code(static_cast<int>(GetLastError()), std::system_category());
    }
    return {};
#elif defined(__linux__)
    if (::renameat2(AT_FDCWD, source.c_str(), AT_FDCWD, target.c_str(), RENAME_NOREPLACE) == 0) {
        return {};
    }
    const int renameErr = errno;
    if (renameErr != EINVAL && renameErr != ENOSYS) {
        return std::error_code(renameErr, std::generic_category());
    }

    // filesystem without RENAME_NOREPLACE support: link() refuses existing names for files
    std::error_code ec;
    const auto status = fs::symlink_status(source, ec);
    if (ec) {
        return ec;
    }
    if (!fs::is_regular_file(status)) {
        if (fs::exists(fs::symlink_status(target, ec))) {
            return std::make_error_code(std::errc::file_exists);
        }
        fs::rename(source, target, ec);
        return ec;
    }
    if (::link(source.c_str(), target.c_str()) != 0) {
        return std::error_code(errno, std::generic_category());
    }
    if (::unlink(source.c_str()) != 0) {
        const int unlinkErr = errno;
        ::unlink(target.c_str());
        return std::error_code(unlinkErr, std::generic_category());
    }
    return {};
#elif defined(__APPLE__)
    if (::renamex_np(source.c_str(), target.c_str(), RENAME_EXCL) != 0) {
        return std::error_code(errno, std::generic_category());
    }
    return {};
#else
    std::error_code ec;
    if (fs::exists(fs::symlink_status(target, ec))) {
        return std::make_error_code(std::errc::file_exists);
    }
    fs::rename(source, target, ec);
    return ec;
#endif
}

// True when `inner` equals `outer` or lies somewhere below it. Both paths must be normalized.
bool isWithin(const fs::path& inner, const fs::path& outer) {
    const fs::path relative = inner.lexically_relative(outer);
    return !relative.empty() && *relative.begin() != "..";
}

} // namespace

std::string SortReport::summary() const {
    std::ostringstream oss;
    if (total == 0) {
        oss << "Nothing to sort.";
    } else {
        oss << "Sorted " << moved << " of " << total << " item(s)";
        if (!failures.empty()) {
            oss << "; " << failures.size() << " failed";
        }
        oss << ".";
    }
    if (!configWarning.empty()) {
        oss << " Default categories were used.";
    }
    return oss.str();
}

SortEngine::SortEngine(const CategoryStore& store, SortOptions options)
    : m_store(store), m_options(std::move(options)) {}

SortReport SortEngine::sortFolder(const fs::path& sourceDir,
                                  const fs::path& destDir,
                                  const ProgressCallback& progress) const {
    const auto started = std::chrono::steady_clock::now();
    SortReport report;

    validateRoots(sourceDir, destDir);

    const CategoryMap categories = loadCategoriesForCycle(report);
    const Classifier classifier(categories);
    const std::vector<DropItem> items = DropScanner(m_options.scan).scan(sourceDir);
    report.total = items.size();

    std::size_t completed = 0;
    auto reportProgress = [&]() {
        if (progress) {
            progress(completed, report.total);
        }
    };
    auto recordFailure = [&](MoveFailure failure) {
        DS_LOG_ERROR("Failed to move `" << failure.source.string() << "`: " << failure.reason);
        report.failures.push_back(std::move(failure));
        ++completed;
        reportProgress();
    };

    // Group by category; an item whose target another item already claimed fails up front.
    std::map<std::string, std::vector<PlannedMove>> plan;
    std::set<std::string> claimedTargets;
    for (const auto& item : items) {
        const std::string category =
            item.isDirectory ? std::string(kFallbackCategory) : classifier.classifyPath(item.path).category;
        fs::path target = destDir / category / item.path.filename();

        if (!claimedTargets.insert(targetKey(target)).second) {
            recordFailure({item.path, target, "another item in this cycle is already moving to `" + target.string() + "`"});
            continue;
        }
        plan[category].push_back({item.path, std::move(target), category});
    }

    std::vector<PlannedMove> moves;
    for (auto& [category, planned] : plan) {
        const fs::path categoryDir = destDir / category;
        std::error_code mkdirErr;
        fs::create_directories(categoryDir, mkdirErr);
        if (mkdirErr) {
            for (auto& move : planned) {
                recordFailure({move.source, move.target,
                               "cannot create `" + categoryDir.string() + "`: " + mkdirErr.message()});
            }
            continue;
        }
        for (auto& move : planned) {
            moves.push_back(std::move(move));
        }
    }

    if (!moves.empty()) {
        std::size_t threads = m_options.workerThreads;
        if (threads == 0) {
            threads = std::max(1u, std::thread::hardware_concurrency());
        }
        ThreadPool pool(std::min(threads, moves.size()));

        std::vector<std::future<std::optional<std::string>>> pending;
        pending.reserve(moves.size());
        for (const auto& move : moves) {
            pending.push_back(pool.submit([this, &move]() {
                if (m_options.beforeMove) {
                    m_options.beforeMove(move.source);
                }
                return moveItem(move.source, move.target);
            }));
        }

        for (std::size_t i = 0; i < pending.size(); ++i) {
            std::optional<std::string> failure;
            try {
                failure = pending[i].get();
            } catch (const std::exception& e) {
                failure = e.what();
            }

            if (failure) {
                recordFailure({moves[i].source, moves[i].target, *failure});
                continue;
            }

            ++report.moved;
            ++report.movedPerCategory[moves[i].category];
            ++completed;
            reportProgress();
        }
    }

    if (report.total == 0) {
        reportProgress();
    }

    report.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - started).count();
    DS_LOG_INFO(report.summary() << " (" << report.elapsedMs << " ms)");
    return report;
}

CategoryMap SortEngine::loadCategoriesForCycle(SortReport& report) const {
    try {
        return m_store.loadCategories();
    } catch (const ConfigReadError& e) {
        report.configWarning = e.what();
        DS_LOG_WARN(e.what() << " Falling back to built-in categories for this cycle.");
        return CategoryStore::builtInDefaults();
    }
}

void SortEngine::validateRoots(const fs::path& sourceDir, const fs::path& destDir) {
    std::error_code ec;
    if (!fs::is_directory(destDir, ec) || ec) {
        throw InvalidDirectory("Sorted folder `" + destDir.string() + "` is not accessible: " +
                               (ec ? ec.message() : "not a directory"));
    }

    const fs::path source = fs::weakly_canonical(sourceDir, ec);
    if (ec) {
        throw InvalidDirectory("Cannot resolve drop folder `" + sourceDir.string() + "`: " + ec.message());
    }
    const fs::path dest = fs::weakly_canonical(destDir, ec);
    if (ec) {
        throw InvalidDirectory("Cannot resolve sorted folder `" + destDir.string() + "`: " + ec.message());
    }
    if (isWithin(dest, source)) {
        throw InvalidDirectory("Sorted folder `" + destDir.string() + "` must not be inside the drop folder `" +
                               sourceDir.string() + "`.");
    }
}

std::optional<std::string> SortEngine::moveItem(const fs::path& source, const fs::path& target) {
    // symlink_status so that a dangling link at the target still counts as taken
    std::error_code ec;
    const auto targetStatus = fs::symlink_status(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return "cannot check destination `" + target.string() + "`: " + ec.message();
    }
    if (fs::exists(targetStatus)) {
        return "destination `" + target.string() + "` already exists";
    }

    ec = renameNoReplace(source, target);
    if (isAlreadyExists(ec)) {
        return "destination `" + target.string() + "` already exists";
    }
    if (isCrossDevice(ec)) {
        return "cross-device move to `" + target.string() + "` is not supported";
    }
    if (ec) {
        return ec.message();
    }

    DS_LOG_INFO("Moved `" << source.string() << "` -> `" << target.string() << "`");
    return std::nullopt;
}

#ifndef SORT_ENGINE_HPP
#define SORT_ENGINE_HPP

#include "CategoryStore.hpp"
#include "DropScanner.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// (completed, total); the last call of a cycle always has completed == total.
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

struct MoveFailure {
    std::filesystem::path source;
    std::filesystem::path target;
    std::string reason;
};

// Aggregate outcome of one sort cycle.
struct SortReport {
    std::size_t total = 0;
    std::size_t moved = 0;
    std::vector<MoveFailure> failures;
    std::map<std::string, std::size_t> movedPerCategory;
    // Set when the category files were unreadable and the built-in defaults were used.
    std::string configWarning;
    long long elapsedMs = 0;

    std::size_t failed() const { return failures.size(); }
    bool ok() const { return failures.empty(); }
    // One line suitable for a status bar or a desktop notification.
    std::string summary() const;
};

struct SortOptions {
    // Worker threads used for moves; 0 selects the hardware concurrency.
    std::size_t workerThreads = 0;
    ScanOptions scan;
    // Called on a worker thread right before an item is moved.
    std::function<void(const std::filesystem::path&)> beforeMove;
};

// Moves everything in a drop folder into category folders under a destination root.
class SortEngine {
public:
    explicit SortEngine(const CategoryStore& store, SortOptions options = {});

    // Runs one full cycle and blocks until every move finished or failed.
    // Categories are re-read from the store on every call.
    // Throws InvalidDirectory when either root is unusable; per-item failures land in the report.
    SortReport sortFolder(const std::filesystem::path& sourceDir,
                          const std::filesystem::path& destDir,
                          const ProgressCallback& progress = {}) const;

    const SortOptions& options() const { return m_options; }

private:
    struct PlannedMove {
        std::filesystem::path source;
        std::filesystem::path target;
        std::string category;
    };

    CategoryMap loadCategoriesForCycle(SortReport& report) const;
    static void validateRoots(const std::filesystem::path& sourceDir, const std::filesystem::path& destDir);
    // Rename without overwriting; returns the failure reason, or nothing on success.
    static std::optional<std::string> moveItem(const std::filesystem::path& source, const std::filesystem::path& target);

    const CategoryStore& m_store;
    SortOptions m_options;
};

#endif

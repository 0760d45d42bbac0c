#ifndef CYCLE_SCHEDULER_HPP
#define CYCLE_SCHEDULER_HPP

#include "SortEngine.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class SchedulerState {
    Idle,
    Active,
    Running,
};

const char* toString(SchedulerState state);

struct SchedulerOptions {
    // Ticks between the end of one cycle and the start of the next.
    int intervalTicks = 5;
    // Wall-clock length of one tick for the background driver.
    std::chrono::milliseconds tickPeriod{1000};
};

// Fired once per completed cycle, e.g. to raise a desktop notification.
using CycleListener = std::function<void(const SortReport&)>;
// Fired when a cycle was skipped because of a structural error.
using CycleErrorListener = std::function<void(const std::string&)>;

// Runs the sort engine periodically.
//
//   Idle --start--> Active --countdown hits 0--> Running --cycle done--> Active
//   Active --stop--> Idle
//   Running --stop--> Running, then Idle once the cycle has finished
//
// tick() advances the countdown and runs a due cycle on the calling thread, so tests can
// drive any number of ticks without waiting. runInBackground() spawns a driver thread
// that ticks every tickPeriod. Cycles never overlap.
class CycleScheduler {
public:
    explicit CycleScheduler(const SortEngine& engine, SchedulerOptions options = {});
    ~CycleScheduler();

    CycleScheduler(const CycleScheduler&) = delete;
    CycleScheduler& operator=(const CycleScheduler&) = delete;

    // Idle -> Active with a full countdown; the first cycle runs one interval later.
    // Returns false when the scheduler is not idle.
    bool start(const std::filesystem::path& sourceDir, const std::filesystem::path& destDir);
    // Prevents further cycles. An in-flight cycle is never interrupted.
    void stop();
    void tick();
    // Makes the next tick run a cycle; used by the drop watcher.
    void triggerNow();

    void runInBackground();
    // Stops scheduling, waits for an in-flight cycle, and joins the driver thread.
    void shutdown();

    SchedulerState state() const;
    int ticksUntilNextCycle() const;
    std::size_t completedCycles() const;
    std::optional<std::string> lastError() const;
    std::optional<SortReport> lastReport() const;

    void setProgressListener(ProgressCallback listener);
    void setCycleListener(CycleListener listener);
    void setErrorListener(CycleErrorListener listener);

private:
    void runCycle(const std::filesystem::path& sourceDir, const std::filesystem::path& destDir);
    void driverLoop();

    const SortEngine& m_engine;
    SchedulerOptions m_options;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    SchedulerState m_state = SchedulerState::Idle;
    bool m_stopRequested = false;
    bool m_triggerAfterRun = false;
    int m_countdown = 0;
    std::filesystem::path m_sourceDir;
    std::filesystem::path m_destDir;
    std::size_t m_completedCycles = 0;
    std::optional<std::string> m_lastError;
    std::optional<SortReport> m_lastReport;

    ProgressCallback m_progressListener;
    CycleListener m_cycleListener;
    CycleErrorListener m_errorListener;

    std::thread m_driver;
    bool m_driverExit = false;
    bool m_driverWoken = false;
};

#endif

#include "CycleScheduler.hpp"

#include "Errors.hpp"
#include "Logger.hpp"

#include <utility>

const char* toString(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::Active: return "active";
        case SchedulerState::Running: return "running";
    }
    return "idle";
}

CycleScheduler::CycleScheduler(const SortEngine& engine, SchedulerOptions options)
    : m_engine(engine), m_options(options) {
    if (m_options.intervalTicks < 1) {
        m_options.intervalTicks = 1;
    }
}

CycleScheduler::~CycleScheduler() {
    shutdown();
}

bool CycleScheduler::start(const std::filesystem::path& sourceDir, const std::filesystem::path& destDir) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != SchedulerState::Idle) {
            DS_LOG_WARN("Sorting is already " << toString(m_state) << ".");
            return false;
        }

        m_sourceDir = sourceDir;
        m_destDir = destDir;
        m_countdown = m_options.intervalTicks;
        m_stopRequested = false;
        m_triggerAfterRun = false;
        m_state = SchedulerState::Active;
    }

    DS_LOG_INFO("Sorting started: `" << sourceDir.string() << "` -> `" << destDir.string() << "`, every "
                                     << m_options.intervalTicks << " tick(s).");
    return true;
}

void CycleScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == SchedulerState::Running) {
            m_stopRequested = true;
            DS_LOG_INFO("Stopping after the current cycle finishes.");
        } else if (m_state == SchedulerState::Active) {
            m_state = SchedulerState::Idle;
            DS_LOG_INFO("Sorting stopped.");
        }
    }
    m_wake.notify_all();
}

void CycleScheduler::tick() {
    std::filesystem::path sourceDir;
    std::filesystem::path destDir;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != SchedulerState::Active) {
            return;
        }
        if (--m_countdown > 0) {
            DS_LOG_TRACE("Next scan in " << m_countdown << " tick(s).");
            return;
        }

        m_state = SchedulerState::Running;
        sourceDir = m_sourceDir;
        destDir = m_destDir;
    }

    runCycle(sourceDir, destDir);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_completedCycles;
        if (m_stopRequested) {
            m_stopRequested = false;
            m_state = SchedulerState::Idle;
            DS_LOG_INFO("Sorting stopped.");
        } else {
            m_state = SchedulerState::Active;
            m_countdown = m_triggerAfterRun ? 1 : m_options.intervalTicks;
        }
        m_triggerAfterRun = false;
    }
    m_wake.notify_all();
}

void CycleScheduler::triggerNow() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == SchedulerState::Active) {
            m_countdown = 1;
            m_driverWoken = true;
        } else if (m_state == SchedulerState::Running) {
            m_triggerAfterRun = true;
        }
    }
    m_wake.notify_all();
}

void CycleScheduler::runInBackground() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_driver.joinable()) {
        return;
    }
    m_driverExit = false;
    m_driver = std::thread([this]() { driverLoop(); });
}

void CycleScheduler::shutdown() {
    stop();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_driverExit = true;
    }
    m_wake.notify_all();

    if (m_driver.joinable() && m_driver.get_id() != std::this_thread::get_id()) {
        m_driver.join();
    }
}

void CycleScheduler::driverLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_driverExit) {
        m_wake.wait_for(lock, m_options.tickPeriod, [this]() { return m_driverExit || m_driverWoken; });
        if (m_driverExit) {
            break;
        }
        m_driverWoken = false;

        lock.unlock();
        tick();
        lock.lock();
    }
}

void CycleScheduler::runCycle(const std::filesystem::path& sourceDir, const std::filesystem::path& destDir) {
    ProgressCallback progressListener;
    CycleListener cycleListener;
    CycleErrorListener errorListener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        progressListener = m_progressListener;
        cycleListener = m_cycleListener;
        errorListener = m_errorListener;
    }

    std::string error;
    try {
        DS_LOG_DEBUG("Scanning `" << sourceDir.string() << "`...");
        SortReport report = m_engine.sortFolder(sourceDir, destDir, progressListener);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastError.reset();
            m_lastReport = report;
        }
        if (cycleListener) {
            cycleListener(report);
        }
        return;
    } catch (const DropSorterError& e) {
        error = e.what();
    } catch (const std::exception& e) {
        error = std::string("Unexpected error during sort cycle: ") + e.what();
    }

    DS_LOG_ERROR("Sort cycle skipped: " << error << " Retrying on the next interval.");
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastError = error;
    }
    if (errorListener) {
        errorListener(error);
    }
}

SchedulerState CycleScheduler::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

int CycleScheduler::ticksUntilNextCycle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == SchedulerState::Active ? m_countdown : 0;
}

std::size_t CycleScheduler::completedCycles() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_completedCycles;
}

std::optional<std::string> CycleScheduler::lastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

std::optional<SortReport> CycleScheduler::lastReport() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastReport;
}

void CycleScheduler::setProgressListener(ProgressCallback listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_progressListener = std::move(listener);
}

void CycleScheduler::setCycleListener(CycleListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cycleListener = std::move(listener);
}

void CycleScheduler::setErrorListener(CycleErrorListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorListener = std::move(listener);
}

#include "ThreadPool.hpp"

ThreadPool::ThreadPool(std::size_t threadCount) {
    if (threadCount == 0) {
        threadCount = std::thread::hardware_concurrency();
    }
    if (threadCount == 0) {
        threadCount = 1;
    }

    m_workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        m_workers.emplace_back([this]() { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    bool expected = true;
    if (!m_accepting.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    m_queue.close();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

void ThreadPool::workerLoop() {
    // packaged_task stores exceptions in its future, so jobs never throw here.
    while (auto job = m_queue.pop()) {
        (*job)();
    }
}

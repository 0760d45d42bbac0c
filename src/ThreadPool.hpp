#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include "BlockingQueue.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

// Fixed-size worker pool. Tasks report results and exceptions through the returned future.
class ThreadPool {
public:
    // Zero selects std::thread::hardware_concurrency() (at least one worker).
    explicit ThreadPool(std::size_t threadCount);
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drains queued tasks and joins the workers.
    ~ThreadPool();

    template <class F, class... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using R = std::invoke_result_t<F, Args...>;

        if (!m_accepting.load(std::memory_order_acquire)) {
            throw std::runtime_error("ThreadPool is shutting down and does not accept new tasks");
        }

        auto task = std::make_shared<std::packaged_task<R()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<R> result = task->get_future();

        if (!m_queue.push([task]() { (*task)(); })) {
            throw std::runtime_error("ThreadPool queue is closed");
        }
        return result;
    }

    // Stops accepting tasks, runs what is queued, and joins. Safe to call more than once.
    void shutdown();

    std::size_t size() const { return m_workers.size(); }

private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    BlockingQueue<std::function<void()>> m_queue;
    std::atomic<bool> m_accepting{true};
};

#endif

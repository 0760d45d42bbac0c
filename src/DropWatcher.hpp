#ifndef DROP_WATCHER_HPP
#define DROP_WATCHER_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <thread>

// Watches the drop folder (non-recursively) and invokes a handler on its own thread
// whenever entries are created, moved in, or finish being written. Uses inotify on
// Linux and change notifications on Windows; start() fails elsewhere.
class DropWatcher {
public:
    using ChangeHandler = std::function<void()>;

    DropWatcher(std::filesystem::path folder, ChangeHandler onChange);
    ~DropWatcher();

    DropWatcher(const DropWatcher&) = delete;
    DropWatcher& operator=(const DropWatcher&) = delete;

    // Returns false when the platform is unsupported or the watch cannot be armed.
    bool start();
    void stop();
    bool running() const { return m_running.load(); }

private:
    void watchLoop();
    void releaseHandles();

    std::filesystem::path m_folder;
    ChangeHandler m_onChange;
    std::thread m_thread;
    std::atomic<bool> m_running{false};

#ifdef _WIN32
    void* m_changeHandle = nullptr;
    void* m_stopEvent = nullptr;
#else
    int m_inotifyFd = -1;
    int m_stopPipe[2] = {-1, -1};
#endif
};

#endif

#include "DropWatcher.hpp"

#include "Logger.hpp"

#include <utility>

#ifdef _WIN32
#include <windows.h>

#include <string>
#include <string_view>
#elif defined(__linux__)
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#endif

namespace {

#ifdef _WIN32
constexpr DWORD kWatchFilters = FILE_NOTIFY_CHANGE_FILE_NAME | FILE_NOTIFY_CHANGE_DIR_NAME | FILE_NOTIFY_CHANGE_SIZE |
                                FILE_NOTIFY_CHANGE_LAST_WRITE | FILE_NOTIFY_CHANGE_CREATION;

// Convert a Win32 error code into a trimmed UTF-8 description for logging.
std::string formatWindowsError(DWORD code) {
    LPWSTR messageBuffer = nullptr;
    const DWORD length = FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        code,
        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<LPWSTR>(&messageBuffer),
        0,
        nullptr);

    if (length == 0 || messageBuffer == nullptr) {
        return "Unknown error (" + std::to_string(code) + ")";
    }

    std::wstring_view wideMessage(messageBuffer, length);
    int utf8Length = WideCharToMultiByte(CP_UTF8, 0, wideMessage.data(), static_cast<int>(wideMessage.size()), nullptr, 0, nullptr, nullptr);
    std::string message(utf8Length, '\0');
    WideCharToMultiByte(CP_UTF8, 0, wideMessage.data(), static_cast<int>(wideMessage.size()), message.data(), utf8Length, nullptr, nullptr);
    LocalFree(messageBuffer);

    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }

    return message.empty() ? ("Unknown error (" + std::to_string(code) + ")") : message;
}
#endif

} // namespace

DropWatcher::DropWatcher(std::filesystem::path folder, ChangeHandler onChange)
    : m_folder(std::move(folder)), m_onChange(std::move(onChange)) {}

DropWatcher::~DropWatcher() {
    stop();
}

#ifdef _WIN32

bool DropWatcher::start() {
    if (m_running.load()) {
        return true;
    }

    HANDLE changeHandle = FindFirstChangeNotificationW(m_folder.wstring().c_str(), FALSE, kWatchFilters);
    if (changeHandle == INVALID_HANDLE_VALUE) {
        DS_LOG_ERROR("Failed to start change notification: " << formatWindowsError(GetLastError()));
        return false;
    }

    HANDLE stopEvent = CreateEventW(nullptr, TRUE, FALSE, nullptr);
    if (stopEvent == nullptr) {
        DS_LOG_ERROR("Failed to create stop event: " << formatWindowsError(GetLastError()));
        FindCloseChangeNotification(changeHandle);
        return false;
    }

    m_changeHandle = changeHandle;
    m_stopEvent = stopEvent;
    m_running.store(true);
    m_thread = std::thread([this]() { watchLoop(); });
    DS_LOG_INFO("Monitoring `" << m_folder.string() << "` for changes...");
    return true;
}

void DropWatcher::stop() {
    if (m_stopEvent != nullptr) {
        SetEvent(static_cast<HANDLE>(m_stopEvent));
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running.store(false);
    releaseHandles();
}

void DropWatcher::releaseHandles() {
    if (m_changeHandle != nullptr) {
        FindCloseChangeNotification(static_cast<HANDLE>(m_changeHandle));
        m_changeHandle = nullptr;
    }
    if (m_stopEvent != nullptr) {
        CloseHandle(static_cast<HANDLE>(m_stopEvent));
        m_stopEvent = nullptr;
    }
}

void DropWatcher::watchLoop() {
    HANDLE handles[] = {static_cast<HANDLE>(m_changeHandle), static_cast<HANDLE>(m_stopEvent)};

    while (true) {
        const DWORD waitStatus = WaitForMultipleObjects(2, handles, FALSE, INFINITE);
        if (waitStatus == WAIT_OBJECT_0) {
            m_onChange();
            if (!FindNextChangeNotification(handles[0])) {
                DS_LOG_ERROR("Failed to re-arm change notification: " << formatWindowsError(GetLastError()));
                break;
            }
        } else if (waitStatus == WAIT_OBJECT_0 + 1) {
            break;
        } else {
            DS_LOG_ERROR("WaitForMultipleObjects failed: " << formatWindowsError(GetLastError()));
            break;
        }
    }
    m_running.store(false);
}

#elif defined(__linux__)

bool DropWatcher::start() {
    if (m_running.load()) {
        return true;
    }

    m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotifyFd < 0) {
        DS_LOG_ERROR("Failed to initialise inotify: " << std::strerror(errno));
        return false;
    }

    if (inotify_add_watch(m_inotifyFd, m_folder.c_str(), IN_CREATE | IN_MOVED_TO | IN_CLOSE_WRITE) < 0) {
        DS_LOG_ERROR("Failed to watch `" << m_folder.string() << "`: " << std::strerror(errno));
        releaseHandles();
        return false;
    }

    if (pipe(m_stopPipe) != 0) {
        DS_LOG_ERROR("Failed to create watcher stop pipe: " << std::strerror(errno));
        releaseHandles();
        return false;
    }

    m_running.store(true);
    m_thread = std::thread([this]() { watchLoop(); });
    DS_LOG_INFO("Monitoring `" << m_folder.string() << "` for changes...");
    return true;
}

void DropWatcher::stop() {
    if (m_stopPipe[1] >= 0) {
        const char wake = 'x';
        if (write(m_stopPipe[1], &wake, 1) < 0) {
            DS_LOG_WARN("Failed to signal watcher thread: " << std::strerror(errno));
        }
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running.store(false);
    releaseHandles();
}

void DropWatcher::releaseHandles() {
    for (int* fd : {&m_inotifyFd, &m_stopPipe[0], &m_stopPipe[1]}) {
        if (*fd >= 0) {
            close(*fd);
            *fd = -1;
        }
    }
}

void DropWatcher::watchLoop() {
    alignas(inotify_event) char buffer[4096];
    pollfd fds[2] = {{m_inotifyFd, POLLIN, 0}, {m_stopPipe[0], POLLIN, 0}};

    while (true) {
        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            DS_LOG_ERROR("poll on `" << m_folder.string() << "` failed: " << std::strerror(errno));
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        // Drain every queued event; one notification per batch is enough to schedule a scan.
        bool changed = false;
        while (read(m_inotifyFd, buffer, sizeof(buffer)) > 0) {
            changed = true;
        }
        if (changed) {
            m_onChange();
        }
    }
    m_running.store(false);
}

#else

bool DropWatcher::start() {
    DS_LOG_ERROR("Watching folders is not supported on this platform; use polling instead.");
    return false;
}

void DropWatcher::stop() {}

void DropWatcher::releaseHandles() {}

void DropWatcher::watchLoop() {}

#endif

#include "watch/file_watch_restarter.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::watch {

using core::errors::ErrorKind;
using core::errors::WrapError;

namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM |
                                     IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB;

std::optional<WatchEvent> classify(const std::uint32_t mask) {
    if ((mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
        return WatchEvent::Created;
    }
    if ((mask & (IN_DELETE | IN_MOVED_FROM)) != 0) {
        return WatchEvent::Removed;
    }
    if ((mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) != 0) {
        return WatchEvent::Modified;
    }
    return std::nullopt;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

}  // namespace

FileWatchRestarter::FileWatchRestarter(std::filesystem::path target,
                                       supervisor::ProcessSupervisor& supervisor,
                                       const WatchTiming timing)
    : target_(std::move(target)), supervisor_(supervisor), timing_(timing) {}

FileWatchRestarter::~FileWatchRestarter() {
    stop();
}

core::errors::Status FileWatchRestarter::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (worker_.joinable()) {
        return core::errors::ok();
    }

    std::filesystem::path directory = target_.parent_path();
    if (directory.empty()) {
        directory = ".";
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        return WrapError{ErrorKind::Internal,
                         std::string("Failed to create file watcher: ") + std::strerror(errno),
                         "watch_failed"};
    }
    if (inotify_add_watch(inotify_fd_, directory.c_str(), kWatchMask) < 0) {
        const std::string reason = std::strerror(errno);
        close_fd(inotify_fd_);
        return WrapError{ErrorKind::Input,
                         "Failed to watch directory " + directory.string() + ": " + reason,
                         "watch_failed", "The directory of the wrapped binary must exist."};
    }
    stop_fd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (stop_fd_ < 0) {
        const std::string reason = std::strerror(errno);
        close_fd(inotify_fd_);
        return WrapError{ErrorKind::Internal, "Failed to create stop channel: " + reason,
                         "watch_failed"};
    }

    if (!target_exists()) {
        LOG_INFO("Binary file doesn't exist, waiting for it in " + directory.string());
    }
    LOG_INFO("Starting file watch for: " + target_.string());
    worker_ = std::thread([this] { run(); });
    return core::errors::ok();
}

void FileWatchRestarter::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!worker_.joinable()) {
        return;
    }
    const std::uint64_t one = 1;
    if (write(stop_fd_, &one, sizeof(one)) < 0) {
        LOG_WARN(std::string("Failed to signal file watcher: ") + std::strerror(errno));
    }
    worker_.join();
    close_fd(inotify_fd_);
    close_fd(stop_fd_);
    LOG_DEBUG("File watcher stopped");
}

bool FileWatchRestarter::target_exists() const {
    std::error_code ec;
    return std::filesystem::exists(target_, ec) && !ec;
}

void FileWatchRestarter::run() {
    FileWatchState state(target_exists(), timing_.debounce);

    while (true) {
        pollfd fds[2] = {};
        fds[0].fd = inotify_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = stop_fd_;
        fds[1].events = POLLIN;

        const int ready = poll(fds, 2, static_cast<int>(timing_.poll_interval.count()));
        if (ready < 0 && errno != EINTR) {
            LOG_ERROR(std::string("File watcher poll failed: ") + std::strerror(errno));
            return;
        }
        if (ready > 0 && (fds[1].revents & POLLIN) != 0) {
            return;
        }
        if (ready > 0 && (fds[0].revents & POLLIN) != 0) {
            drain_events(state);
        }

        if (const auto action =
                state.poll(target_exists(), FileWatchState::Clock::now())) {
            fire(*action);
        }
    }
}

void FileWatchRestarter::drain_events(FileWatchState& state) {
    const std::string name = target_.filename().string();
    alignas(inotify_event) char buffer[4096];

    while (true) {
        const ssize_t n = read(inotify_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_ERROR(std::string("Failed to read file events: ") + std::strerror(errno));
            }
            return;
        }
        if (n == 0) {
            return;
        }

        std::size_t offset = 0;
        while (offset < static_cast<std::size_t>(n)) {
            const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
            offset += sizeof(inotify_event) + event->len;

            if ((event->mask & IN_Q_OVERFLOW) != 0) {
                // Events were lost; assume the binary changed.
                state.on_event(WatchEvent::Modified, target_exists(),
                               FileWatchState::Clock::now());
                continue;
            }
            if (event->len == 0 || name != event->name) {
                continue;
            }
            if (const auto kind = classify(event->mask)) {
                LOG_DEBUG("File event on " + name + ": " + to_string(*kind));
                state.on_event(*kind, target_exists(), FileWatchState::Clock::now());
            }
        }
    }
}

void FileWatchRestarter::fire(const WatchAction action) {
    if (action == WatchAction::InitialStart) {
        LOG_INFO("Binary file now exists, performing initial start");
        auto started = supervisor_.start();
        if (core::errors::is_error(started)) {
            LOG_ERROR("Failed to start wrapped server: " +
                      core::errors::get_error(started).message);
            return;
        }
        LOG_INFO("Initial start completed (PID " +
                 std::to_string(core::errors::get_value(started)) + ")");
        supervisor_.notify_tools_changed();
        return;
    }

    LOG_INFO("Binary file change detected, triggering restart after debounce");
    auto restarted = supervisor_.restart();
    if (core::errors::is_error(restarted)) {
        LOG_ERROR("Failed to restart wrapped server: " +
                  core::errors::get_error(restarted).message);
        return;
    }
    const auto& outcome = core::errors::get_value(restarted);
    LOG_INFO("Automatic restart completed (PID " +
             (outcome.old_pid ? std::to_string(*outcome.old_pid) : std::string("none")) +
             " -> " + std::to_string(outcome.new_pid) + ")");
}

}  // namespace wrapmcp::watch

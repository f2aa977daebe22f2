#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <thread>
#include "core/errors/wrap_errors.hpp"
#include "supervisor/process_supervisor.hpp"
#include "watch/file_watch_state.hpp"

namespace wrapmcp::watch {

struct WatchTiming {
    std::chrono::milliseconds debounce{2000};
    std::chrono::milliseconds poll_interval{100};
};

// Watches the wrappee binary and starts or restarts the wrappee when it
// settles after a change. The watch is placed on the parent directory and
// filtered by file name, so it survives the binary being deleted or
// replaced by a rename.
class FileWatchRestarter {
public:
    FileWatchRestarter(std::filesystem::path target, supervisor::ProcessSupervisor& supervisor,
                       WatchTiming timing = {});
    ~FileWatchRestarter();

    FileWatchRestarter(const FileWatchRestarter&) = delete;
    FileWatchRestarter& operator=(const FileWatchRestarter&) = delete;

    // Fails when the parent directory cannot be watched.
    core::errors::Status start();
    // Idempotent; returns once the watch thread has exited.
    void stop();

    const std::filesystem::path& target() const { return target_; }

private:
    void run();
    void drain_events(FileWatchState& state);
    void fire(WatchAction action);
    bool target_exists() const;

    const std::filesystem::path target_;
    supervisor::ProcessSupervisor& supervisor_;
    const WatchTiming timing_;

    std::mutex lifecycle_mutex_;
    int inotify_fd_ = -1;
    int stop_fd_ = -1;
    std::thread worker_;
};

}  // namespace wrapmcp::watch

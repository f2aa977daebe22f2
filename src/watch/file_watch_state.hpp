#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace wrapmcp::watch {

enum class WatchEvent {
    Created,
    Modified,
    Removed
};

enum class WatchAction {
    InitialStart,
    Restart
};

enum class WatchPhase {
    AwaitingFirstCreation,
    Tracking
};

std::string to_string(WatchEvent event);
std::string to_string(WatchAction action);

// Debounce logic for the watched binary, free of any I/O: callers pass in
// the current time and whether the file exists.
//
// 1. Until the binary first appears nothing runs; its creation schedules an
//    initial start, exactly once.
// 2. After that, modifications and re-creations schedule restarts.
// 3. A removal cancels whatever was pending until the file comes back.
// 4. An action fires once `debounce` has passed since the last qualifying
//    event and the file exists at that moment.
class FileWatchState {
public:
    using Clock = std::chrono::steady_clock;

    explicit FileWatchState(bool file_exists,
                            std::chrono::milliseconds debounce = std::chrono::milliseconds(2000));

    void on_event(WatchEvent event, bool file_exists, Clock::time_point now);

    // The action to perform now, if any; firing clears it.
    std::optional<WatchAction> poll(bool file_exists, Clock::time_point now);

    WatchPhase phase() const { return phase_; }
    bool file_deleted() const { return file_deleted_; }
    std::optional<WatchAction> pending() const { return pending_; }

private:
    void schedule(WatchAction action, Clock::time_point now);

    const std::chrono::milliseconds debounce_;
    WatchPhase phase_;
    bool file_deleted_ = false;
    std::optional<WatchAction> pending_;
    Clock::time_point last_event_{};
};

}  // namespace wrapmcp::watch

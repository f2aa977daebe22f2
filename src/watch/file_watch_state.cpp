#include "watch/file_watch_state.hpp"

#include "core/logging/logger.hpp"

namespace wrapmcp::watch {

std::string to_string(const WatchEvent event) {
    switch (event) {
        case WatchEvent::Created:
            return "created";
        case WatchEvent::Modified:
            return "modified";
        case WatchEvent::Removed:
            return "removed";
        default:
            return "unknown";
    }
}

std::string to_string(const WatchAction action) {
    switch (action) {
        case WatchAction::InitialStart:
            return "initial_start";
        case WatchAction::Restart:
            return "restart";
        default:
            return "unknown";
    }
}

FileWatchState::FileWatchState(const bool file_exists, const std::chrono::milliseconds debounce)
    : debounce_(debounce),
      phase_(file_exists ? WatchPhase::Tracking : WatchPhase::AwaitingFirstCreation) {}

void FileWatchState::on_event(const WatchEvent event, const bool file_exists,
                              const Clock::time_point now) {
    switch (event) {
        case WatchEvent::Removed:
            LOG_INFO("Binary file removed, waiting for recreation");
            file_deleted_ = true;
            pending_.reset();
            return;

        case WatchEvent::Created:
            if (!file_exists) {
                return;
            }
            if (phase_ == WatchPhase::AwaitingFirstCreation) {
                LOG_INFO("Binary file created for the first time, scheduling initial start");
                phase_ = WatchPhase::Tracking;
                file_deleted_ = false;
                schedule(WatchAction::InitialStart, now);
                return;
            }
            if (file_deleted_) {
                LOG_INFO("Binary file recreated, scheduling restart");
                file_deleted_ = false;
                schedule(WatchAction::Restart, now);
                return;
            }
            // Renamed over an existing file: same as a modification.
            schedule(WatchAction::Restart, now);
            return;

        case WatchEvent::Modified:
            if (file_deleted_ || phase_ == WatchPhase::AwaitingFirstCreation) {
                return;
            }
            LOG_DEBUG("Binary file modified, scheduling restart");
            schedule(WatchAction::Restart, now);
            return;
    }
}

void FileWatchState::schedule(const WatchAction action, const Clock::time_point now) {
    // A pending initial start is never downgraded to a restart.
    if (pending_ != WatchAction::InitialStart) {
        pending_ = action;
    }
    last_event_ = now;
}

std::optional<WatchAction> FileWatchState::poll(const bool file_exists,
                                                const Clock::time_point now) {
    if (!pending_.has_value() || now - last_event_ < debounce_) {
        return std::nullopt;
    }
    if (!file_exists) {
        return std::nullopt;
    }
    const WatchAction action = *pending_;
    pending_.reset();
    return action;
}

}  // namespace wrapmcp::watch

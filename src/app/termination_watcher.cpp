#include "app/termination_watcher.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::app {

TerminationWatcher::TerminationWatcher(const sigset_t& signals, const int wake_signal,
                                       std::function<void(int)> on_signal)
    : signals_(signals), wake_signal_(wake_signal), on_signal_(std::move(on_signal)) {
    thread_ = std::thread([this] { run(); });
}

TerminationWatcher::~TerminationWatcher() {
    exiting_.store(true);
    const int rc = pthread_kill(thread_.native_handle(), wake_signal_);
    if (rc != 0 && rc != ESRCH) {
        LOG_WARN("TerminationWatcher: failed to wake signal thread: " +
                 std::string(std::strerror(rc)));
    }
    thread_.join();
}

void TerminationWatcher::run() {
    int received = 0;
    const int rc = sigwait(&signals_, &received);
    if (rc != 0) {
        LOG_ERROR("TerminationWatcher: sigwait failed: " + std::string(std::strerror(rc)));
        return;
    }
    if (exiting_.load()) {
        return;
    }
    on_signal_(received);
}

}  // namespace wrapmcp::app

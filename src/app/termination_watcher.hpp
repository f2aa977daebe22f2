#pragma once

#include <atomic>
#include <functional>
#include <signal.h>
#include <thread>

namespace wrapmcp::app {

// Waits on its own thread for one of `signals` and runs `on_signal` with it.
// The signals must already be blocked in every thread. Destruction sends
// `wake_signal` (a member of `signals`) to the thread and joins it, so the
// callback never runs after the watcher is gone.
class TerminationWatcher {
public:
    TerminationWatcher(const sigset_t& signals, int wake_signal,
                       std::function<void(int)> on_signal);
    ~TerminationWatcher();

    TerminationWatcher(const TerminationWatcher&) = delete;
    TerminationWatcher& operator=(const TerminationWatcher&) = delete;

private:
    void run();

    sigset_t signals_;
    int wake_signal_;
    std::function<void(int)> on_signal_;
    std::atomic_bool exiting_{false};
    std::thread thread_;
};

}  // namespace wrapmcp::app

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "logstore/log_store.hpp"

namespace wrapmcp::supervisor {

using StderrSource = std::function<std::optional<std::string>()>;

// Background thread moving wrappee stderr lines into the log store. It
// drains everything available, then idles for `idle_wait` before polling
// again.
class StderrMonitor {
public:
    StderrMonitor(StderrSource source, logstore::LogStore& store,
                  std::chrono::milliseconds idle_wait = std::chrono::milliseconds(100));
    ~StderrMonitor();

    StderrMonitor(const StderrMonitor&) = delete;
    StderrMonitor& operator=(const StderrMonitor&) = delete;

    void start();
    // Idempotent; returns once the thread has exited.
    void stop();
    bool running() const;

private:
    void run();

    StderrSource source_;
    logstore::LogStore& store_;
    const std::chrono::milliseconds idle_wait_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::thread worker_;
};

}  // namespace wrapmcp::supervisor

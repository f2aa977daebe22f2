#include "supervisor/stderr_monitor.hpp"

#include <cstddef>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::supervisor {

namespace {

// Stop requests are checked between batches.
constexpr std::size_t kMaxBatch = 100;

}  // namespace

StderrMonitor::StderrMonitor(StderrSource source, logstore::LogStore& store,
                             const std::chrono::milliseconds idle_wait)
    : source_(std::move(source)), store_(store), idle_wait_(idle_wait) {}

StderrMonitor::~StderrMonitor() {
    stop();
}

void StderrMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    worker_ = std::thread([this] { run(); });
}

void StderrMonitor::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    wake_.notify_all();
    if (worker.joinable()) {
        worker.join();
        LOG_DEBUG("Stderr monitor stopped");
    }
}

bool StderrMonitor::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable() && !stop_requested_;
}

void StderrMonitor::run() {
    LOG_DEBUG("Stderr monitor started");
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                return;
            }
        }

        bool drained_any = false;
        for (std::size_t i = 0; i < kMaxBatch; ++i) {
            auto line = source_();
            if (!line.has_value()) {
                break;
            }
            store_.add_stderr(*line);
            drained_any = true;
        }
        if (drained_any) {
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, idle_wait_, [this] { return stop_requested_; });
    }
}

}  // namespace wrapmcp::supervisor

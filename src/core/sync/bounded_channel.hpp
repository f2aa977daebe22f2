#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace wrapmcp::core::sync {

enum class RecvStatus {
    Item,
    Timeout,
    Closed
};

// Multi-producer queue with a fixed capacity. Senders block while the queue
// is full; close() wakes everybody. Receivers drain remaining items before
// they observe Closed.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Returns false when the channel was closed before the item fit.
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> try_recv() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        return pop_locked();
    }

    RecvStatus recv_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool ready = not_empty_.wait_for(
            lock, timeout, [this] { return closed_ || !items_.empty(); });
        if (!items_.empty()) {
            out = pop_locked();
            return RecvStatus::Item;
        }
        if (!ready) {
            return RecvStatus::Timeout;
        }
        return RecvStatus::Closed;
    }

    // Drops buffered items; returns how many were dropped.
    std::size_t discard() {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t dropped = items_.size();
        items_.clear();
        not_full_.notify_all();
        return dropped;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    T pop_locked() {
        T value = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace wrapmcp::core::sync

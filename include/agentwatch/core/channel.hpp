/**
 * @file channel.hpp
 * @brief Closable FIFO hand-off between producer and consumer threads.
 *
 * Producers block while a bounded channel is full; consumers block until a
 * value arrives, the channel is closed, or a deadline passes. Closing wakes
 * every waiter. Values already queued when the channel closes can still be
 * received.
 *
 * Copyright (c) 2024 agentwatch Contributors
 * License: MIT
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace agentwatch {
namespace core {

/**
 * @brief Statistics for a channel.
 */
struct ChannelStats {
    size_t current_depth = 0;
    size_t capacity = 0;
    uint64_t total_sent = 0;
    uint64_t total_received = 0;
    uint64_t rejected_closed = 0;
    size_t high_watermark = 0;
};

/**
 * @brief Thread-safe FIFO with close semantics.
 *
 * @tparam T Element type (moved in and out).
 */
template<typename T>
class Channel {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param capacity Maximum queued values (0 = unbounded).
     */
    explicit Channel(size_t capacity = 0)
        : capacity_(capacity)
    {}

    ~Channel() {
        close();
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Queue a value, blocking while the channel is full.
     * @return False if the channel was closed (the value is discarded).
     */
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (capacity_ > 0) {
            notFull_.wait(lock, [this]() {
                return closed_.load() || values_.size() < capacity_;
            });
        }

        if (closed_.load()) {
            stats_.rejected_closed++;
            return false;
        }

        values_.push_back(std::move(value));
        stats_.total_sent++;
        if (values_.size() > stats_.high_watermark) {
            stats_.high_watermark = values_.size();
        }

        lock.unlock();
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Take the next value, blocking until one arrives or the channel
     *        is closed and drained.
     */
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this]() {
            return closed_.load() || !values_.empty();
        });
        return popLocked(lock);
    }

    /**
     * @brief Like receive(), but gives up at the deadline.
     * @return nullopt on timeout or when closed and drained.
     */
    std::optional<T> receiveUntil(Clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait_until(lock, deadline, [this]() {
            return closed_.load() || !values_.empty();
        });
        return popLocked(lock);
    }

    /**
     * @brief Non-blocking receive.
     */
    std::optional<T> tryReceive() {
        std::unique_lock<std::mutex> lock(mutex_);
        return popLocked(lock);
    }

    /**
     * @brief Refuse further sends and wake every waiter. Idempotent.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_.store(true);
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool isClosed() const {
        return closed_.load();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.empty();
    }

    ChannelStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ChannelStats result = stats_;
        result.current_depth = values_.size();
        result.capacity = capacity_;
        return result;
    }

private:
    std::optional<T> popLocked(std::unique_lock<std::mutex>& lock) {
        if (values_.empty()) {
            return std::nullopt;
        }

        std::optional<T> value(std::move(values_.front()));
        values_.pop_front();
        stats_.total_received++;

        if (capacity_ > 0) {
            lock.unlock();
            notFull_.notify_one();
        }
        return value;
    }

    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> values_;
    std::atomic<bool> closed_{false};
    ChannelStats stats_;
};

}  // namespace core
}  // namespace agentwatch

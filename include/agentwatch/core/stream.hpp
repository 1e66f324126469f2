/**
 * @file stream.hpp
 * @brief Pull-based lazy sequences.
 *
 * A Stream produces its next element only when next() is called, so an
 * unconsumed stream performs no further work. cancel() may be called from
 * any thread and makes a pending or later next() return nullopt promptly.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/channel.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace agentwatch {
namespace core {

/**
 * @class Stream
 * @brief A finite, non-restartable, pull-based sequence.
 */
template<typename T>
class Stream {
public:
    virtual ~Stream() = default;

    /**
     * @brief Block until the next element is ready.
     * @return The element, or nullopt once the stream is exhausted or
     *         cancelled. After the first nullopt every call returns nullopt.
     */
    virtual std::optional<T> next() = 0;

    /**
     * @brief Request early termination. Idempotent and thread-safe.
     */
    virtual void cancel() = 0;
};

template<typename T>
using StreamPtr = std::unique_ptr<Stream<T>>;

/**
 * @brief Drain a stream into a vector.
 */
template<typename T>
std::vector<T> collect(Stream<T>& stream) {
    std::vector<T> result;
    while (auto value = stream.next()) {
        result.push_back(std::move(*value));
    }
    return result;
}

/**
 * @class VectorStream
 * @brief Replays a fixed list of values.
 */
template<typename T>
class VectorStream : public Stream<T> {
public:
    explicit VectorStream(std::vector<T> values)
        : values_(std::move(values))
    {}

    std::optional<T> next() override {
        if (cancelled_.load() || index_ >= values_.size()) {
            return std::nullopt;
        }
        return values_[index_++];
    }

    void cancel() override {
        cancelled_.store(true);
    }

private:
    std::vector<T> values_;
    size_t index_ = 0;
    std::atomic<bool> cancelled_{false};
};

/**
 * @class GeneratorStream
 * @brief Calls a producer once per pull until it returns nullopt.
 *
 * The producer runs on the consumer's thread; it is never invoked again
 * after it has returned nullopt or after cancel().
 */
template<typename T>
class GeneratorStream : public Stream<T> {
public:
    using Producer = std::function<std::optional<T>()>;

    explicit GeneratorStream(Producer producer, std::function<void()> onCancel = {})
        : producer_(std::move(producer))
        , onCancel_(std::move(onCancel))
    {}

    std::optional<T> next() override {
        if (done_ || cancelled_.load()) {
            return std::nullopt;
        }
        auto value = producer_();
        if (!value) {
            done_ = true;
        }
        return value;
    }

    void cancel() override {
        if (!cancelled_.exchange(true) && onCancel_) {
            onCancel_();
        }
    }

private:
    Producer producer_;
    std::function<void()> onCancel_;
    bool done_ = false;
    std::atomic<bool> cancelled_{false};
};

/**
 * @class ChannelStream
 * @brief Drains a channel fed by a background producer.
 *
 * Ends when the channel is closed and drained or when the deadline passes,
 * whichever comes first. Reaching the end, or cancel(), closes the channel
 * so the producer sees its sends rejected and stops.
 */
template<typename T>
class ChannelStream : public Stream<T> {
public:
    using Clock = std::chrono::steady_clock;

    ChannelStream(std::shared_ptr<Channel<T>> channel, Clock::time_point deadline)
        : channel_(std::move(channel))
        , deadline_(deadline)
    {}

    ~ChannelStream() override {
        channel_->close();
    }

    std::optional<T> next() override {
        if (cancelled_.load()) {
            return std::nullopt;
        }
        auto value = channel_->receiveUntil(deadline_);
        if (!value || cancelled_.load()) {
            cancelled_.store(true);
            channel_->close();
            return std::nullopt;
        }
        return value;
    }

    void cancel() override {
        cancelled_.store(true);
        channel_->close();
    }

private:
    std::shared_ptr<Channel<T>> channel_;
    Clock::time_point deadline_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace core
}  // namespace agentwatch

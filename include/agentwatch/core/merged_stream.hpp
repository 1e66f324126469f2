/**
 * @file merged_stream.hpp
 * @brief Fan-in of several streams into one, first-ready-wins.
 *
 * Each input stream gets a lane with its own worker thread. On every pull
 * the merger asks each active lane that has no request outstanding for its
 * next element, then waits for whichever lane answers first:
 *
 *   - a value is returned to the caller; its lane becomes idle and will be
 *     asked again on the next pull;
 *   - an end-of-stream removes the lane from the active set and the merger
 *     keeps waiting without yielding anything for it.
 *
 * The merged stream ends when no lane is active. A lane never has more than
 * one element in flight, so an input is pulled only as fast as the merged
 * stream is consumed, and each input's own order is preserved. Order across
 * inputs is arrival order.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/channel.hpp"
#include "agentwatch/core/stream.hpp"
#include "agentwatch/utils/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace agentwatch {
namespace core {

/**
 * @class MergedStream
 * @brief Stream over the union of its inputs, in arrival order.
 *
 * Usage:
 * @code
 * std::vector<StreamPtr<DiscoveredInstance>> inputs;
 * inputs.push_back(mdns.discover(timeout));
 * inputs.push_back(proc.discover(timeout));
 *
 * MergedStream<DiscoveredInstance> merged(std::move(inputs));
 * while (auto instance = merged.next()) {
 *     // ...
 * }
 * @endcode
 */
template<typename T>
class MergedStream : public Stream<T> {
public:
    explicit MergedStream(std::vector<StreamPtr<T>> inputs)
        : active_(inputs.size())
    {
        lanes_.reserve(inputs.size());
        for (auto& input : inputs) {
            auto lane = std::make_unique<Lane>();
            lane->stream = std::move(input);
            lanes_.push_back(std::move(lane));
        }
        // Workers capture lane indices, so start them only once lanes_ is final.
        for (size_t i = 0; i < lanes_.size(); ++i) {
            lanes_[i]->worker = std::thread(&MergedStream::laneLoop, this, i);
        }
        LOG_TRACE("Merger", "Merging {} streams", lanes_.size());
    }

    ~MergedStream() override {
        cancel();
        for (auto& lane : lanes_) {
            if (lane->worker.joinable()) {
                lane->worker.join();
            }
        }
    }

    MergedStream(const MergedStream&) = delete;
    MergedStream& operator=(const MergedStream&) = delete;

    std::optional<T> next() override {
        if (finished_ || cancelled_.load()) {
            return std::nullopt;
        }

        while (active_ > 0) {
            requestFromIdleLanes();

            auto completion = completions_.receive();
            if (!completion) {
                // Closed by cancel()
                finished_ = true;
                return std::nullopt;
            }

            Lane& lane = *lanes_[completion->lane];
            lane.inFlight = false;

            if (!completion->value) {
                lane.active = false;
                --active_;
                LOG_TRACE("Merger", "Lane {} finished, {} still active",
                          completion->lane, active_);
                continue;
            }
            return std::move(completion->value);
        }

        finished_ = true;
        return std::nullopt;
    }

    void cancel() override {
        if (cancelled_.exchange(true)) {
            return;
        }
        {
            // Pairs with the predicate check in laneLoop().
            std::lock_guard<std::mutex> lock(mutex_);
        }
        demand_.notify_all();
        for (auto& lane : lanes_) {
            lane->stream->cancel();
        }
        completions_.close();
    }

    /**
     * @brief Number of inputs that have not ended yet.
     */
    size_t activeCount() const { return active_; }

private:
    struct Completion {
        size_t lane;
        std::optional<T> value;
    };

    struct Lane {
        StreamPtr<T> stream;
        std::thread worker;
        bool requested = false;  // guarded by mutex_
        bool inFlight = false;   // consumer side only
        bool active = true;      // consumer side only
    };

    void requestFromIdleLanes() {
        bool issued = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& lane : lanes_) {
                if (lane->active && !lane->inFlight) {
                    lane->requested = true;
                    lane->inFlight = true;
                    issued = true;
                }
            }
        }
        if (issued) {
            demand_.notify_all();
        }
    }

    void laneLoop(size_t index) {
        Lane& lane = *lanes_[index];

        for (;;) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                demand_.wait(lock, [this, &lane]() {
                    return cancelled_.load() || lane.requested;
                });
                if (cancelled_.load()) {
                    return;
                }
                lane.requested = false;
            }

            auto value = lane.stream->next();
            bool ended = !value.has_value();
            if (!completions_.send(Completion{index, std::move(value)}) || ended) {
                return;
            }
        }
    }

    std::vector<std::unique_ptr<Lane>> lanes_;
    size_t active_;
    bool finished_ = false;

    std::mutex mutex_;
    std::condition_variable demand_;
    Channel<Completion> completions_;
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Merge streams; an empty input list yields an empty stream.
 */
template<typename T>
StreamPtr<T> mergeStreams(std::vector<StreamPtr<T>> inputs) {
    return std::make_unique<MergedStream<T>>(std::move(inputs));
}

}  // namespace core
}  // namespace agentwatch

/**
 * @file cancellation.hpp
 * @brief Stop flags shared between a source and its running discoveries.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace agentwatch {
namespace sources {

using StopFlag = std::shared_ptr<std::atomic<bool>>;

/**
 * @class CancellationSet
 * @brief Hands out one stop flag per discovery run; cancelAll() raises them.
 *
 * Only weak references are kept, so finished runs are forgotten.
 */
class CancellationSet {
public:
    StopFlag add() {
        auto flag = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(mutex_);
        flags_.erase(std::remove_if(flags_.begin(), flags_.end(),
                                    [](const std::weak_ptr<std::atomic<bool>>& f) {
                                        return f.expired();
                                    }),
                     flags_.end());
        flags_.push_back(flag);
        return flag;
    }

    void cancelAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& weak : flags_) {
            if (auto flag = weak.lock()) {
                flag->store(true);
            }
        }
        flags_.clear();
    }

private:
    std::mutex mutex_;
    std::vector<std::weak_ptr<std::atomic<bool>>> flags_;
};

}  // namespace sources
}  // namespace agentwatch

/**
 * @file instance_cache.cpp
 * @brief InstanceCache implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/core/instance_cache.hpp"
#include "agentwatch/core/merged_stream.hpp"
#include "agentwatch/utils/logger.hpp"

#include <atomic>

namespace agentwatch {
namespace core {

/**
 * Replays the snapshot taken when discover() was called, then drains the
 * merged live sources through InstanceCache::admit(). Must not outlive the
 * cache that created it.
 */
class CachedDiscoveryStream : public InstanceStream {
public:
    CachedDiscoveryStream(InstanceCache& cache,
                          std::vector<DiscoveredInstance> replay,
                          std::chrono::milliseconds timeout)
        : cache_(cache)
        , replay_(std::move(replay))
        , timeout_(timeout)
    {}

    std::optional<DiscoveredInstance> next() override {
        if (cancelled_.load()) {
            return std::nullopt;
        }

        if (replayIndex_ < replay_.size()) {
            return replay_[replayIndex_++];
        }

        Stream<DiscoveredInstance>* live = openLive();
        if (!live) {
            return std::nullopt;
        }

        while (auto instance = live->next()) {
            if (cache_.admit(*instance)) {
                return instance;
            }
            LOG_DEBUG("Cache", "Dropping duplicate {}", instance->identity());
        }
        return std::nullopt;
    }

    void cancel() override {
        cancelled_.store(true);
        std::lock_guard<std::mutex> lock(liveMutex_);
        if (live_) {
            live_->cancel();
        }
    }

private:
    Stream<DiscoveredInstance>* openLive() {
        std::lock_guard<std::mutex> lock(liveMutex_);
        if (!live_ && !cancelled_.load()) {
            live_ = mergeStreams(cache_.openSources(timeout_));
        }
        return live_.get();
    }

    InstanceCache& cache_;
    std::vector<DiscoveredInstance> replay_;
    size_t replayIndex_ = 0;
    std::chrono::milliseconds timeout_;

    std::mutex liveMutex_;
    InstanceStreamPtr live_;
    std::atomic<bool> cancelled_{false};
};

InstanceCache::InstanceCache(std::vector<DiscoverySourcePtr> sources)
    : sources_(std::move(sources))
{
    LOG_DEBUG("Cache", "Wrapping {} discovery sources", sources_.size());
}

InstanceStreamPtr InstanceCache::discover(std::chrono::milliseconds timeout) {
    std::vector<DiscoveredInstance> replay = instances();
    LOG_DEBUG("Cache", "Replaying {} cached instances", replay.size());
    return std::make_unique<CachedDiscoveryStream>(*this, std::move(replay), timeout);
}

void InstanceCache::stop() {
    for (const auto& source : sources_) {
        source->stop();
    }
}

std::vector<DiscoveredInstance> InstanceCache::instances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_;
}

bool InstanceCache::admit(const DiscoveredInstance& instance) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (instance.pid()) {
        if (!seenPids_.insert(*instance.pid()).second) {
            return false;
        }
    }

    instances_.push_back(instance);
    LOG_INFO("Cache", "New instance {} via {}",
             instance.identity(), instanceOriginToString(instance.origin()));
    return true;
}

std::vector<InstanceStreamPtr> InstanceCache::openSources(std::chrono::milliseconds timeout) {
    std::vector<InstanceStreamPtr> streams;
    streams.reserve(sources_.size());
    for (const auto& source : sources_) {
        streams.push_back(source->discover(timeout));
    }
    return streams;
}

}  // namespace core
}  // namespace agentwatch

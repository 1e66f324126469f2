/**
 * @file instance_cache.hpp
 * @brief Deduplicating, replaying wrapper around a set of discovery sources.
 *
 * The InstanceCache remembers every instance it has ever emitted. Each
 * discover() call first replays those instances instantly, in their original
 * order, then merges fresh discovery from every wrapped source and emits
 * only instances it has not seen before. Repeated discovery (for example on
 * every status refresh) therefore returns known hosts without waiting out
 * each source's timeout again, while new hosts still surface.
 *
 * Deduplication is keyed on the process id alone. Instances without a pid
 * are never treated as duplicates of one another.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/discovery_source.hpp"
#include "agentwatch/core/export.hpp"

#include <chrono>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace agentwatch {
namespace core {

/**
 * @class InstanceCache
 * @brief DiscoverySource composite that replays and deduplicates.
 *
 * Thread-safe: the cached list and the seen-pid set are guarded by one
 * mutex, since merger lanes and several discover() streams may be alive at
 * the same time.
 *
 * Usage:
 * @code
 * InstanceCache cache({std::make_shared<MdnsSource>(),
 *                      std::make_shared<ProcessSource>()});
 *
 * auto first = cache.discover(std::chrono::seconds(5));
 * while (auto instance = first->next()) { ... }   // live results
 *
 * auto again = cache.discover(std::chrono::seconds(5));
 * while (auto instance = again->next()) { ... }   // replay, then new ones
 * @endcode
 */
class AGENTWATCH_CORE_API InstanceCache : public DiscoverySource {
public:
    explicit InstanceCache(std::vector<DiscoverySourcePtr> sources);

    ~InstanceCache() override = default;

    InstanceCache(const InstanceCache&) = delete;
    InstanceCache& operator=(const InstanceCache&) = delete;

    /**
     * @brief Replay cached instances, then stream newly discovered ones.
     *
     * Wrapped sources are invoked only once the replay has been consumed.
     */
    InstanceStreamPtr discover(std::chrono::milliseconds timeout) override;

    /**
     * @brief Forward cancellation to every wrapped source.
     */
    void stop() override;

    const char* name() const override { return "cache"; }

    /**
     * @brief Snapshot of every instance emitted so far, in discovery order.
     */
    std::vector<DiscoveredInstance> instances() const;

    size_t sourceCount() const { return sources_.size(); }

private:
    friend class CachedDiscoveryStream;

    /**
     * @brief Record a live instance.
     * @return False if its pid is already known (drop it).
     */
    bool admit(const DiscoveredInstance& instance);

    std::vector<InstanceStreamPtr> openSources(std::chrono::milliseconds timeout);

    const std::vector<DiscoverySourcePtr> sources_;

    mutable std::mutex mutex_;
    std::vector<DiscoveredInstance> instances_;
    std::unordered_set<int> seenPids_;
};

}  // namespace core
}  // namespace agentwatch

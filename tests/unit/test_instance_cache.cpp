/**
 * @file test_instance_cache.cpp
 * @brief Unit tests for InstanceCache
 *
 * Tests cover:
 * - Replay of earlier results before fresh discovery
 * - Deduplication by pid, and never for pid-less instances
 * - Sources are opened only once the replay is consumed
 * - stop() forwarding
 */

#include <gtest/gtest.h>
#include <agentwatch/core/instance_cache.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace agentwatch::core;
using namespace std::chrono_literals;

namespace {

/**
 * Source that returns a scripted batch per discover() call. Once the script
 * runs out the last batch is repeated.
 */
class ScriptedSource : public DiscoverySource {
public:
    explicit ScriptedSource(std::vector<std::vector<DiscoveredInstance>> batches)
        : batches_(std::move(batches))
    {}

    InstanceStreamPtr discover(std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t index = std::min(calls_, batches_.size() - 1);
        ++calls_;
        return std::make_unique<VectorStream<DiscoveredInstance>>(batches_[index]);
    }

    void stop() override { stops_.fetch_add(1); }

    const char* name() const override { return "scripted"; }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    int stops() const { return stops_.load(); }

private:
    std::vector<std::vector<DiscoveredInstance>> batches_;
    mutable std::mutex mutex_;
    size_t calls_ = 0;
    std::atomic<int> stops_{0};
};

/**
 * Source whose first discover() yields one record after a delay; later
 * calls yield nothing.
 */
class DelayedOnceSource : public DiscoverySource {
public:
    DelayedOnceSource(DiscoveredInstance record, std::chrono::milliseconds delay)
        : record_(std::move(record))
        , delay_(delay)
    {}

    InstanceStreamPtr discover(std::chrono::milliseconds) override {
        if (used_.exchange(true)) {
            return std::make_unique<VectorStream<DiscoveredInstance>>(
                std::vector<DiscoveredInstance>{});
        }
        auto pending = std::make_shared<std::optional<DiscoveredInstance>>(record_);
        auto delay = delay_;
        return std::make_unique<GeneratorStream<DiscoveredInstance>>(
            [pending, delay]() -> std::optional<DiscoveredInstance> {
                if (!*pending) {
                    return std::nullopt;
                }
                std::this_thread::sleep_for(delay);
                auto value = std::move(*pending);
                pending->reset();
                return value;
            });
    }

    const char* name() const override { return "delayed"; }

private:
    DiscoveredInstance record_;
    std::chrono::milliseconds delay_;
    std::atomic<bool> used_{false};
};

DiscoveredInstance proc(int pid, uint16_t port) {
    return DiscoveredInstance::fromProcess(pid, port, std::nullopt);
}

}  // namespace

class InstanceCacheTest : public ::testing::Test {};

// =============================================================================
// Replay
// =============================================================================

TEST_F(InstanceCacheTest, FirstDiscoveryPassesThrough) {
    auto source = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{proc(1, 4096), proc(2, 4097)}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{source});

    auto stream = cache.discover(1s);
    auto found = collect(*stream);

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(cache.instances().size(), 2u);
    EXPECT_EQ(source->calls(), 1u);
}

TEST_F(InstanceCacheTest, ReplaysBeforeNewResults) {
    auto source = std::make_shared<ScriptedSource>(std::vector<std::vector<DiscoveredInstance>>{
        {proc(1, 4096), proc(2, 4097)},
        {proc(2, 4097), proc(3, 4098), proc(1, 4096)},
    });
    InstanceCache cache(std::vector<DiscoverySourcePtr>{source});

    collect(*cache.discover(1s));
    auto second = collect(*cache.discover(1s));

    ASSERT_EQ(second.size(), 3u);
    EXPECT_EQ(second[0].pid(), 1);
    EXPECT_EQ(second[1].pid(), 2);
    EXPECT_EQ(second[2].pid(), 3);
}

TEST_F(InstanceCacheTest, NetworkAndProcessRecordsReplayInArrivalOrder) {
    auto network = std::make_shared<DelayedOnceSource>(
        DiscoveredInstance::fromMdns(4096, "devbox.local"), 50ms);
    auto process = std::make_shared<ScriptedSource>(std::vector<std::vector<DiscoveredInstance>>{
        {proc(10, 4096)},
        {},
    });
    InstanceCache cache(std::vector<DiscoverySourcePtr>{network, process});

    auto first = collect(*cache.discover(1s));
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].pid(), 10);
    EXPECT_EQ(first[0].origin(), InstanceOrigin::PROCESS);
    EXPECT_FALSE(first[1].pid().has_value());
    EXPECT_EQ(first[1].origin(), InstanceOrigin::MDNS);
    EXPECT_EQ(first[1].port(), 4096);

    auto second = collect(*cache.discover(1s));
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0], first[0]);
    EXPECT_EQ(second[1], first[1]);
    EXPECT_EQ(process->calls(), 2u);
}

TEST_F(InstanceCacheTest, RepeatedDiscoveryIsIdempotentForKnownPids) {
    auto source = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{proc(10, 4096)}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{source});

    for (int i = 0; i < 3; ++i) {
        auto found = collect(*cache.discover(1s));
        ASSERT_EQ(found.size(), 1u);
        EXPECT_EQ(found[0].pid(), 10);
    }
    EXPECT_EQ(cache.instances().size(), 1u);
}

TEST_F(InstanceCacheTest, InstancesWithoutPidAreNeverDeduplicated) {
    auto host = DiscoveredInstance::fromMdns(4096, "devbox.local");
    auto source = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{host, host}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{source});

    EXPECT_EQ(collect(*cache.discover(1s)).size(), 2u);
    EXPECT_EQ(cache.instances().size(), 2u);
}

TEST_F(InstanceCacheTest, DeduplicatesAcrossSources) {
    auto a = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{proc(5, 4096)}});
    auto b = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{proc(5, 4096), proc(6, 4097)}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{a, b});

    auto found = collect(*cache.discover(1s));
    EXPECT_EQ(found.size(), 2u);
    EXPECT_EQ(cache.sourceCount(), 2u);
}

// =============================================================================
// Laziness and lifecycle
// =============================================================================

TEST_F(InstanceCacheTest, SourcesOpenOnlyAfterReplay) {
    auto source = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{proc(1, 4096), proc(2, 4097)}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{source});
    collect(*cache.discover(1s));
    ASSERT_EQ(source->calls(), 1u);

    auto stream = cache.discover(1s);
    EXPECT_EQ(source->calls(), 1u);

    ASSERT_TRUE(stream->next().has_value());
    ASSERT_TRUE(stream->next().has_value());
    EXPECT_EQ(source->calls(), 1u);

    EXPECT_FALSE(stream->next().has_value());
    EXPECT_EQ(source->calls(), 2u);
}

TEST_F(InstanceCacheTest, CancelledStreamNeverOpensSources) {
    auto source = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{proc(1, 4096)}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{source});

    auto stream = cache.discover(1s);
    stream->cancel();
    EXPECT_FALSE(stream->next().has_value());
    EXPECT_EQ(source->calls(), 0u);
}

TEST_F(InstanceCacheTest, NoSourcesYieldsReplayOnly) {
    InstanceCache cache(std::vector<DiscoverySourcePtr>{});
    EXPECT_TRUE(collect(*cache.discover(1s)).empty());
    EXPECT_STREQ(cache.name(), "cache");
}

TEST_F(InstanceCacheTest, StopForwardsToEverySource) {
    auto a = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{}});
    auto b = std::make_shared<ScriptedSource>(
        std::vector<std::vector<DiscoveredInstance>>{{}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{a, b});

    cache.stop();
    cache.stop();

    EXPECT_EQ(a->stops(), 2);
    EXPECT_EQ(b->stops(), 2);
}

TEST_F(InstanceCacheTest, ConcurrentDiscoveriesAdmitEachPidOnce) {
    auto source = std::make_shared<ScriptedSource>(std::vector<std::vector<DiscoveredInstance>>{
        {proc(1, 4096), proc(2, 4097), proc(3, 4098)}});
    InstanceCache cache(std::vector<DiscoverySourcePtr>{source});

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&cache]() { collect(*cache.discover(1s)); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(cache.instances().size(), 3u);
}

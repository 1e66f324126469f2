/**
 * @file test_merged_stream.cpp
 * @brief Unit tests for MergedStream
 *
 * Tests cover:
 * - Every element of every input is emitted exactly once
 * - Per-input order is preserved
 * - A slow input does not hold back fast ones
 * - Empty input list, empty inputs, cancellation
 */

#include <gtest/gtest.h>
#include <agentwatch/core/merged_stream.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace agentwatch::core;
using namespace std::chrono_literals;

namespace {

// Emits its values with a fixed delay before each one.
StreamPtr<std::string> delayedStream(std::vector<std::string> values,
                                     std::chrono::milliseconds delay) {
    auto index = std::make_shared<size_t>(0);
    return std::make_unique<GeneratorStream<std::string>>(
        [values, delay, index]() -> std::optional<std::string> {
            if (*index >= values.size()) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(delay);
            return values[(*index)++];
        });
}

StreamPtr<std::string> vectorStream(std::vector<std::string> values) {
    return std::make_unique<VectorStream<std::string>>(std::move(values));
}

// Blocks until cancelled.
class BlockingStream : public Stream<std::string> {
public:
    std::optional<std::string> next() override {
        auto value = channel_.receive();
        return value;
    }
    void cancel() override {
        cancelled.store(true);
        channel_.close();
    }

    std::atomic<bool> cancelled{false};

private:
    Channel<std::string> channel_;
};

}  // namespace

class MergedStreamTest : public ::testing::Test {};

// =============================================================================
// Completeness and order
// =============================================================================

TEST_F(MergedStreamTest, EmitsEveryElement) {
    std::vector<StreamPtr<std::string>> inputs;
    inputs.push_back(vectorStream({"a1", "a2", "a3"}));
    inputs.push_back(vectorStream({"b1"}));
    inputs.push_back(vectorStream({"c1", "c2"}));

    MergedStream<std::string> merged(std::move(inputs));
    auto values = collect(merged);

    std::sort(values.begin(), values.end());
    EXPECT_EQ(values, (std::vector<std::string>{"a1", "a2", "a3", "b1", "c1", "c2"}));
    EXPECT_EQ(merged.activeCount(), 0u);
}

TEST_F(MergedStreamTest, PreservesPerInputOrder) {
    std::vector<StreamPtr<std::string>> inputs;
    inputs.push_back(delayedStream({"a1", "a2", "a3", "a4"}, 5ms));
    inputs.push_back(delayedStream({"b1", "b2", "b3", "b4"}, 3ms));

    MergedStream<std::string> merged(std::move(inputs));
    auto values = collect(merged);
    ASSERT_EQ(values.size(), 8u);

    std::vector<std::string> a;
    std::vector<std::string> b;
    for (const auto& v : values) {
        (v[0] == 'a' ? a : b).push_back(v);
    }
    EXPECT_EQ(a, (std::vector<std::string>{"a1", "a2", "a3", "a4"}));
    EXPECT_EQ(b, (std::vector<std::string>{"b1", "b2", "b3", "b4"}));
}

TEST_F(MergedStreamTest, SlowInputDoesNotBlockFastOnes) {
    std::vector<StreamPtr<std::string>> inputs;
    inputs.push_back(delayedStream({"slow"}, 400ms));
    inputs.push_back(delayedStream({"fast1", "fast2"}, 10ms));

    MergedStream<std::string> merged(std::move(inputs));

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(merged.next(), std::string("fast1"));
    EXPECT_EQ(merged.next(), std::string("fast2"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 300ms);

    EXPECT_EQ(merged.next(), std::string("slow"));
    EXPECT_FALSE(merged.next().has_value());
}

// =============================================================================
// Edge cases
// =============================================================================

TEST_F(MergedStreamTest, NoInputsEndsImmediately) {
    auto merged = mergeStreams<std::string>({});
    EXPECT_FALSE(merged->next().has_value());
}

TEST_F(MergedStreamTest, EmptyInputsEnd) {
    std::vector<StreamPtr<std::string>> inputs;
    inputs.push_back(vectorStream({}));
    inputs.push_back(vectorStream({}));

    MergedStream<std::string> merged(std::move(inputs));
    EXPECT_FALSE(merged.next().has_value());
    EXPECT_FALSE(merged.next().has_value());
}

TEST_F(MergedStreamTest, EndsAfterLastInputEnds) {
    std::vector<StreamPtr<std::string>> inputs;
    inputs.push_back(vectorStream({"x"}));
    inputs.push_back(delayedStream({"y"}, 50ms));

    MergedStream<std::string> merged(std::move(inputs));
    EXPECT_EQ(collect(merged).size(), 2u);
    EXPECT_FALSE(merged.next().has_value());
}

TEST_F(MergedStreamTest, CancelUnblocksConsumerAndInputs) {
    auto blocking = std::make_unique<BlockingStream>();
    BlockingStream* raw = blocking.get();

    std::vector<StreamPtr<std::string>> inputs;
    inputs.push_back(std::move(blocking));
    MergedStream<std::string> merged(std::move(inputs));

    std::thread canceller([&merged]() {
        std::this_thread::sleep_for(50ms);
        merged.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(merged.next().has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();

    EXPECT_TRUE(raw->cancelled.load());
    EXPECT_FALSE(merged.next().has_value());
}

TEST_F(MergedStreamTest, DestroyingUnconsumedStreamJoinsWorkers) {
    std::vector<StreamPtr<std::string>> inputs;
    inputs.push_back(std::make_unique<BlockingStream>());
    inputs.push_back(vectorStream({"a"}));

    auto merged = mergeStreams(std::move(inputs));
    EXPECT_EQ(merged->next(), std::string("a"));
    merged.reset();  // must not hang
    SUCCEED();
}

#include <gtest/gtest.h>
#include "getchunk/chunk/SizingEngine.hpp"
#include "getchunk/core/DebugTrace.hpp"

#include <vector>

using namespace getchunk;
using core::MemoryBudget;

namespace {

const MemoryBudget kAmple(1e15, false);

Observation observed(double size, double duration) {
    Observation o;
    o.prior_size = size;
    o.prior_duration = duration;
    return o;
}

} // namespace

TEST(SizingEngineTest, AutoFirstStepUsesDefaultFraction) {
    debug_trace::clear_sizing();
    double size = SizingEngine::next_size(SizingMode::automatic(), Observation(), 0.0, 1e6, 1e6, kAmple);
    EXPECT_DOUBLE_EQ(size, 1e6 * 0.001);
    EXPECT_EQ(debug_trace::get_last_sizing(), "sizing.auto.default");
}

TEST(SizingEngineTest, AutoDefaultBeforeRemainingCap) {
    // 10 * 0.001 is well below one byte; the engine reports it unrounded.
    double size = SizingEngine::next_size(SizingMode::automatic(), Observation(), 0.0, 10.0, 10.0, kAmple);
    EXPECT_DOUBLE_EQ(size, 0.01);
}

TEST(SizingEngineTest, AutoHoldsWithoutComparableDurations) {
    debug_trace::clear_sizing();
    // Only one read so far: nothing to compare against.
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::automatic(), observed(4096, 0.5), 0.0, 1e9, 1e9, kAmple), 4096);
    EXPECT_EQ(debug_trace::get_last_sizing(), "sizing.auto.hold");

    // Unmeasurable current read.
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::automatic(), observed(4096, 0.0), 0.5, 1e9, 1e9, kAmple), 4096);

    // Same latency twice.
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::automatic(), observed(4096, 0.5), 0.5, 1e9, 1e9, kAmple), 4096);
}

TEST(SizingEngineTest, AutoGrowsAfterFasterRead) {
    debug_trace::clear_sizing();
    // 5% faster -> 5% larger
    double size = SizingEngine::next_size(SizingMode::automatic(), observed(1000, 0.95), 1.0, 1e9, 1e9, kAmple);
    EXPECT_NEAR(size, 1050.0, 1e-9);
    EXPECT_EQ(debug_trace::get_last_sizing(), "sizing.auto.grow");
}

TEST(SizingEngineTest, AutoGrowthIsBoundedAt15Percent) {
    double size = SizingEngine::next_size(SizingMode::automatic(), observed(1000, 0.1), 1.0, 1e9, 1e9, kAmple);
    EXPECT_NEAR(size, 1150.0, 1e-9);
}

TEST(SizingEngineTest, AutoShrinksAfterSlowerRead) {
    debug_trace::clear_sizing();
    // 20% slower -> 20% smaller
    double size = SizingEngine::next_size(SizingMode::automatic(), observed(1000, 1.2), 1.0, 1e9, 1e9, kAmple);
    EXPECT_NEAR(size, 800.0, 1e-9);
    EXPECT_EQ(debug_trace::get_last_sizing(), "sizing.auto.shrink");
}

TEST(SizingEngineTest, AutoShrinkIsBoundedAt45Percent) {
    double size = SizingEngine::next_size(SizingMode::automatic(), observed(1000, 10.0), 0.1, 1e9, 1e9, kAmple);
    EXPECT_NEAR(size, 550.0, 1e-9);
}

TEST(SizingEngineTest, AutoIsCappedByMemoryBudget) {
    MemoryBudget tight(1000.0, false);
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::automatic(), Observation(), 0.0, 1e9, 1e9, tight), 850.0);
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::automatic(), observed(5000, 0.1), 1.0, 1e9, 1e9, tight), 850.0);
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::automatic(), observed(5000, 1.0), 0.1, 1e9, 1e9, tight), 850.0);
}

TEST(SizingEngineTest, FeedbackLoopFollowsLatencyDirection) {
    const double total = 1e12;

    // Reads keep getting faster: every size is strictly larger, by at most 15%.
    std::vector<double> faster = {1.0, 0.9, 0.7, 0.65, 0.3, 0.29};
    double size = 10000.0;
    for (size_t i = 1; i < faster.size(); ++i) {
        double next = SizingEngine::next_size(SizingMode::automatic(), observed(size, faster[i]), faster[i - 1],
                                              total, total, kAmple);
        EXPECT_GT(next, size);
        EXPECT_LE(next, size * 1.15 + 1e-9);
        size = next;
    }

    // Reads keep getting slower: every size is strictly smaller, by at most 45%.
    std::vector<double> slower = {0.1, 0.11, 0.2, 0.5, 0.51, 3.0};
    size = 10000.0;
    for (size_t i = 1; i < slower.size(); ++i) {
        double next = SizingEngine::next_size(SizingMode::automatic(), observed(size, slower[i]), slower[i - 1],
                                              total, total, kAmple);
        EXPECT_LT(next, size);
        EXPECT_GE(next, size * 0.55 - 1e-9);
        size = next;
    }
}

TEST(SizingEngineTest, GrowthStopsAtMemoryCeiling) {
    MemoryBudget budget(20000.0, false); // ceiling 17000
    double size = 10000.0;
    double prev = 1.0;
    for (int i = 0; i < 10; ++i) {
        double now = prev * 0.5;
        size = SizingEngine::next_size(SizingMode::automatic(), observed(size, now), prev, 1e9, 1e9, budget);
        prev = now;
        EXPECT_LE(size, 17000.0);
    }
    EXPECT_DOUBLE_EQ(size, 17000.0);
}

TEST(SizingEngineTest, PercentModeClampsAtEvaluation) {
    const double total = 1e6;
    double low = SizingEngine::next_size(SizingMode::percentage(0.0), Observation(), 0.0, total, total, kAmple);
    double floor = SizingEngine::next_size(SizingMode::percentage(0.1), Observation(), 0.0, total, total, kAmple);
    EXPECT_DOUBLE_EQ(low, floor);
    EXPECT_DOUBLE_EQ(low, 1000.0);

    double high = SizingEngine::next_size(SizingMode::percentage(500.0), Observation(), 0.0, total, total, kAmple);
    double full = SizingEngine::next_size(SizingMode::percentage(100.0), Observation(), 0.0, total, total, kAmple);
    EXPECT_DOUBLE_EQ(high, full);
    EXPECT_DOUBLE_EQ(high, total);

    EXPECT_DOUBLE_EQ(SizingMode::percentage(500.0).percent, 500.0);
}

TEST(SizingEngineTest, PercentModeIgnoresObservations) {
    double size = SizingEngine::next_size(SizingMode::percentage(15.0), observed(1, 9.0), 0.1, 983040, 983040, kAmple);
    EXPECT_DOUBLE_EQ(size, 983040 * 0.15);
}

TEST(SizingEngineTest, BytesModeIsDirectMinimum) {
    double size = SizingEngine::next_size(SizingMode::fixed_bytes(250000), Observation(), 0.0, 1e6, 1e6, kAmple);
    EXPECT_DOUBLE_EQ(size, 250000.0);

    // Regression guard: the percent-style "divide by 100" variant must not come back.
    double legacy = 1e6 * (250000.0 / 100.0);
    EXPECT_NE(size, legacy);
    EXPECT_NE(size, 250000.0 / 100.0);
}

TEST(SizingEngineTest, BytesModeCappedBySourceAndMemory) {
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::fixed_bytes(5000), Observation(), 0.0, 1200, 1200, kAmple), 1200.0);
    MemoryBudget tight(1000.0, false);
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::fixed_bytes(5000), Observation(), 0.0, 1e6, 1e6, tight), 850.0);
}

TEST(SizingEngineTest, EveryModeIsCappedByRemaining) {
    const double total = 1e6;
    const double remaining = 300.0;
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::fixed_bytes(250000), Observation(), 0.0, total, remaining, kAmple), remaining);
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::percentage(50.0), Observation(), 0.0, total, remaining, kAmple), remaining);
    EXPECT_DOUBLE_EQ(SizingEngine::next_size(SizingMode::automatic(), observed(5000, 0.5), 1.0, total, remaining, kAmple), remaining);
}

TEST(SizingEngineTest, ModeToString) {
    EXPECT_EQ(SizingMode::automatic().to_string(), "Auto");
    EXPECT_EQ(SizingMode::fixed_bytes(42).to_string(), "Bytes(42)");
    EXPECT_EQ(SizingMode::percentage(2.5).to_string(), "Percent(2.5)");
}

#include <gtest/gtest.h>
#include <stdexcept>

#include "rateguard/fixed_window_counter.h"
#include "test_util.h"

using rg::FixedWindowCounter;
using rg::Outcome;
using rg::Uint;

TEST(FixedWindowCounter, RejectsZeroParameters) {
    EXPECT_THROW(FixedWindowCounter(0, 10), std::invalid_argument);
    EXPECT_THROW(FixedWindowCounter(10, 0), std::invalid_argument);
    try {
        FixedWindowCounter(0, 10);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "capacity must be greater than 0");
    }
}

TEST(FixedWindowCounter, ConfigMirrorsConstructor) {
    FixedWindowCounter::Config cfg{50, 20};
    FixedWindowCounter fw(cfg);
    EXPECT_EQ(fw.config().capacity, Uint{50});
    EXPECT_EQ(fw.config().window_ticks, Uint{20});
    EXPECT_EQ(fw.capacity(), Uint{50});
    EXPECT_THROW(FixedWindowCounter(FixedWindowCounter::Config{50, 0}), std::invalid_argument);
}

TEST(FixedWindowCounter, FillsAndResetsPerWindow) {
    FixedWindowCounter fw(30, 10);
    EXPECT_EQ(fw.try_acquire(5, 30), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(9, 1), Outcome::kInsufficientCapacity);
    EXPECT_EQ(fw.try_acquire(10, 30), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(19, 1), Outcome::kInsufficientCapacity);
}

TEST(FixedWindowCounter, BurstOnBothSidesOfBoundary) {
    FixedWindowCounter fw(10, 10);
    EXPECT_EQ(fw.try_acquire(9, 10), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(10, 10), Outcome::kAllowed);
}

TEST(FixedWindowCounter, SkippedWindowsStartEmpty) {
    FixedWindowCounter fw(10, 5);
    EXPECT_EQ(fw.try_acquire(0, 10), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(100, 10), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(104, 1), Outcome::kInsufficientCapacity);
}

TEST(FixedWindowCounter, ExpiredTickBeforeWindowStart) {
    FixedWindowCounter fw(10, 10);
    EXPECT_EQ(fw.try_acquire(25, 1), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(19, 1), Outcome::kExpiredTick);

    rg::Decision d = fw.try_acquire_verbose(3, 1);
    EXPECT_EQ(d.outcome, Outcome::kExpiredTick);
    EXPECT_EQ(d.min_acceptable_tick, Uint{20});

    // Anywhere inside the current window is still fine.
    EXPECT_EQ(fw.try_acquire(20, 1), Outcome::kAllowed);
    EXPECT_EQ(fw.capacity_remaining(19).outcome, Outcome::kExpiredTick);
    EXPECT_EQ(fw.capacity_remaining_or_0(19), Uint{0});
}

TEST(FixedWindowCounter, VerboseDiagnostics) {
    FixedWindowCounter fw(10, 10);
    EXPECT_TRUE(fw.try_acquire_verbose(3, 8).allowed());

    rg::Decision d = fw.try_acquire_verbose(7, 5);
    EXPECT_EQ(d.outcome, Outcome::kInsufficientCapacity);
    EXPECT_EQ(d.acquiring, Uint{5});
    EXPECT_EQ(d.available, Uint{2});
    EXPECT_EQ(d.retry_after_ticks, Uint{3});
    EXPECT_EQ(fw.try_acquire(10, 5), Outcome::kAllowed);

    d = fw.try_acquire_verbose(10, 11);
    EXPECT_EQ(d.outcome, Outcome::kBeyondCapacity);
    EXPECT_EQ(d.acquiring, Uint{11});
    EXPECT_EQ(d.capacity, Uint{10});
    EXPECT_EQ(fw.try_acquire(10, 11), Outcome::kInsufficientCapacity);
}

TEST(FixedWindowCounter, CapacityRemainingAdvancesWindow) {
    FixedWindowCounter fw(100, 10);
    EXPECT_EQ(fw.capacity_remaining(0).units, Uint{100});
    EXPECT_EQ(fw.try_acquire(2, 40), Outcome::kAllowed);
    EXPECT_EQ(fw.capacity_remaining(2).units, Uint{60});
    EXPECT_EQ(fw.capacity_remaining(15).units, Uint{100});
    EXPECT_EQ(fw.try_acquire(15, 10), Outcome::kAllowed);
    EXPECT_EQ(fw.capacity_remaining_or_0(15), Uint{90});
    // The window moved to 10, so tick 5 is now behind it.
    EXPECT_EQ(fw.capacity_remaining(5).outcome, Outcome::kExpiredTick);
}

TEST(FixedWindowCounter, PreviewDoesNotAdvanceWindow) {
    FixedWindowCounter fw(100, 10);
    EXPECT_EQ(fw.try_acquire(2, 40), Outcome::kAllowed);
    EXPECT_EQ(fw.current_capacity_at(15).units, Uint{100});
    EXPECT_EQ(fw.current_capacity_at(5).units, Uint{60});
    EXPECT_EQ(fw.try_acquire(5, 60), Outcome::kAllowed);
    EXPECT_EQ(fw.current_capacity_at(9).units, Uint{0});
}

TEST(FixedWindowCounter, ZeroUnitsNeverFailOrMove) {
    FixedWindowCounter fw(10, 10);
    EXPECT_EQ(fw.try_acquire(5, 10), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(5, 0), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(1000, 0), Outcome::kAllowed);
    // The zero-unit probe at 1000 did not move the window.
    EXPECT_EQ(fw.try_acquire(6, 1), Outcome::kInsufficientCapacity);
    EXPECT_EQ(fw.try_acquire(0, 0), Outcome::kAllowed);
}

TEST(FixedWindowCounter, SaturatesAtMax) {
    const Uint max = rg::kUintMax;
    FixedWindowCounter fw(max, max);
    EXPECT_EQ(fw.try_acquire(0, max), Outcome::kAllowed);
    EXPECT_EQ(fw.try_acquire(max - 1, 1), Outcome::kInsufficientCapacity);

    rg::Decision d = fw.try_acquire_verbose(max - 1, 1);
    EXPECT_EQ(d.outcome, Outcome::kInsufficientCapacity);
    EXPECT_EQ(d.retry_after_ticks, Uint{1});

    EXPECT_EQ(fw.try_acquire(max, max), Outcome::kAllowed);
    EXPECT_EQ(fw.capacity_remaining(max).units, Uint{0});
}

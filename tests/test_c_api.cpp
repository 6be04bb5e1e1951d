#include <gtest/gtest.h>

#include "rateguard/rateguard_c.h"
#include "rateguard/version.h"

TEST(CApi, VersionString) {
    EXPECT_STREQ(rg_version(), RG_VERSION);
}

TEST(CApi, RejectsBadConstruction) {
    EXPECT_EQ(rg_new(-1, 10, 1, 1), nullptr);
    EXPECT_EQ(rg_new(5, 10, 1, 1), nullptr);
    EXPECT_EQ(rg_new(RG_TOKEN_BUCKET, 0, 1, 1), nullptr);
    EXPECT_EQ(rg_new(RG_LEAKY_BUCKET, 10, 1, 0), nullptr);
}

TEST(CApi, SecondParameterIgnoredByWindowAlgorithms) {
    void* h = rg_new(RG_FIXED_WINDOW, 10, 5, 0);
    ASSERT_NE(h, nullptr);
    EXPECT_EQ(rg_try_acquire(h, 0, 10), RG_ALLOWED);
    rg_free(h);
}

TEST(CApi, AcquireAndInspect) {
    void* h = rg_new(RG_TOKEN_BUCKET, 10, 4, 3);
    ASSERT_NE(h, nullptr);

    EXPECT_EQ(rg_try_acquire(h, 0, 10), RG_ALLOWED);
    EXPECT_EQ(rg_try_acquire(h, 1, 11), RG_INSUFFICIENT_CAPACITY);

    rg_decision_t d = rg_try_acquire_verbose(h, 1, 5);
    EXPECT_EQ(d.outcome, RG_INSUFFICIENT_CAPACITY);
    EXPECT_EQ(d.acquiring, 5u);
    EXPECT_EQ(d.available, 0u);
    EXPECT_EQ(d.retry_after_ticks, 7u);

    d = rg_try_acquire_verbose(h, 1, 11);
    EXPECT_EQ(d.outcome, RG_BEYOND_CAPACITY);
    EXPECT_EQ(d.capacity, 10u);

    uint64_t units = 99;
    EXPECT_EQ(rg_capacity_remaining(h, 8, &units), RG_ALLOWED);
    EXPECT_EQ(units, 6u);

    EXPECT_EQ(rg_capacity_remaining(h, 0, &units), RG_EXPIRED_TICK);
    EXPECT_EQ(units, 0u);
    EXPECT_EQ(rg_try_acquire_verbose(h, 0, 1).min_acceptable_tick, 8u);

    rg_free(h);
}

TEST(CApi, NullHandle) {
    uint64_t units = 0;
    EXPECT_EQ(rg_try_acquire(nullptr, 0, 1), RG_INVALID_HANDLE);
    EXPECT_EQ(rg_try_acquire_verbose(nullptr, 0, 1).outcome, RG_INVALID_HANDLE);
    EXPECT_EQ(rg_capacity_remaining(nullptr, 0, &units), RG_INVALID_HANDLE);
    rg_free(nullptr);
}

TEST(CApi, OutcomeNames) {
    EXPECT_STREQ(rg_outcome_name(RG_ALLOWED), "allowed");
    EXPECT_STREQ(rg_outcome_name(RG_EXPIRED_TICK), "expired_tick");
    EXPECT_STREQ(rg_outcome_name(RG_INVALID_HANDLE), "invalid_handle");
    EXPECT_STREQ(rg_outcome_name(7), "unknown");
    EXPECT_STREQ(rg_outcome_name(-1), "unknown");
}

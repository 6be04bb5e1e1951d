#include <gtest/gtest.h>
#include "rateguard/saturating.h"

using rg::kUintMax;
using rg::Uint;

TEST(Saturating, AddClampsAtMax) {
    EXPECT_EQ(rg::sat_add(2, 3), Uint{5});
    EXPECT_EQ(rg::sat_add(kUintMax, 1), kUintMax);
    EXPECT_EQ(rg::sat_add(kUintMax - 1, 1), kUintMax);
    EXPECT_EQ(rg::sat_add(kUintMax, kUintMax), kUintMax);
}

TEST(Saturating, SubClampsAtZero) {
    EXPECT_EQ(rg::sat_sub(5, 3), Uint{2});
    EXPECT_EQ(rg::sat_sub(3, 5), Uint{0});
    EXPECT_EQ(rg::sat_sub(0, kUintMax), Uint{0});
}

TEST(Saturating, MulClampsAtMax) {
    EXPECT_EQ(rg::sat_mul(6, 7), Uint{42});
    EXPECT_EQ(rg::sat_mul(0, kUintMax), Uint{0});
    EXPECT_EQ(rg::sat_mul(kUintMax, 1), kUintMax);
    EXPECT_EQ(rg::sat_mul(kUintMax, 2), kUintMax);
    EXPECT_EQ(rg::sat_mul(kUintMax / 2, 2), kUintMax - 1);
}

TEST(Saturating, CeilDiv) {
    EXPECT_EQ(rg::ceil_div(0, 3), Uint{0});
    EXPECT_EQ(rg::ceil_div(1, 3), Uint{1});
    EXPECT_EQ(rg::ceil_div(3, 3), Uint{1});
    EXPECT_EQ(rg::ceil_div(4, 3), Uint{2});
    EXPECT_EQ(rg::ceil_div(kUintMax, kUintMax), Uint{1});
    EXPECT_EQ(rg::ceil_div(kUintMax, 1), kUintMax);
}

TEST(Saturating, AlignDown) {
    EXPECT_EQ(rg::align_down(0, 5), Uint{0});
    EXPECT_EQ(rg::align_down(4, 5), Uint{0});
    EXPECT_EQ(rg::align_down(5, 5), Uint{5});
    EXPECT_EQ(rg::align_down(kUintMax - 1, kUintMax), Uint{0});
    EXPECT_EQ(rg::align_down(kUintMax, kUintMax), kUintMax);
}

TEST(Types, UintToString) {
    EXPECT_EQ(rg::to_string(Uint{0}), "0");
    EXPECT_EQ(rg::to_string(Uint{1234567890}), "1234567890");
    EXPECT_EQ(rg::to_string(Uint{18446744073709551615ULL}), "18446744073709551615");
}

TEST(Types, UintMaxMatchesBuildWidth) {
#if defined(RG_WIDE_TICKS)
    EXPECT_EQ(sizeof(Uint), 16u);
    EXPECT_EQ(rg::to_string(kUintMax), "340282366920938463463374607431768211455");
    EXPECT_EQ(rg::sat_add(Uint{18446744073709551615ULL}, 1),
              Uint{18446744073709551615ULL} + 1);
#else
    EXPECT_EQ(sizeof(Uint), 8u);
    EXPECT_EQ(rg::to_string(kUintMax), "18446744073709551615");
#endif
}

TEST(Types, DescribeCarriesPayload) {
    EXPECT_EQ(rg::describe(rg::allowed()), "allowed");
    EXPECT_EQ(rg::describe(rg::insufficient_capacity(6, 5, 2)),
              "insufficient capacity: acquiring 6, available 5, retry after 2 tick(s)");
    EXPECT_EQ(rg::describe(rg::expired_tick(20)), "expired tick: minimum acceptable tick is 20");
    EXPECT_NE(rg::describe(rg::beyond_capacity(11, 10)).find("capacity 10"), std::string::npos);
    EXPECT_STREQ(rg::to_string(rg::Outcome::kContentionFailure), "contention_failure");
}

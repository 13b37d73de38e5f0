/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/xorshift.hpp"
#include <gtest/gtest.h>
#include <random>

using goop::core::XorShift128Plus;

TEST(XorShift128Plus, KnownSequence) {
    XorShift128Plus rng({1, 4});
    EXPECT_EQ(rng.next_u64(), 0x800049ull);
    EXPECT_EQ(rng.next_u64(), 0x3000186ull);
    EXPECT_EQ(rng.next_u64(), 0x400003001145ull);
}

TEST(XorShift128Plus, SameSeedSameSequence) {
    auto a = XorShift128Plus::fromSeed(12345);
    auto b = XorShift128Plus::fromSeed(12345);
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(a(), b());
    }
    EXPECT_EQ(a.state(), b.state());
}

TEST(XorShift128Plus, DifferentSeedsDiverge) {
    auto a = XorShift128Plus::fromSeed(1);
    auto b = XorShift128Plus::fromSeed(2);
    EXPECT_NE(a.next_u64(), b.next_u64());
}

TEST(XorShift128Plus, SeedZeroStillProducesNonZeroState) {
    const auto rng = XorShift128Plus::fromSeed(0);
    EXPECT_FALSE(rng.state()[0] == 0 && rng.state()[1] == 0);
}

TEST(XorShift128Plus, LowWordMatchesU32) {
    XorShift128Plus a({1, 4});
    XorShift128Plus b({1, 4});
    EXPECT_EQ(a.next_u32(), static_cast<uint32_t>(b.next_u64()));
}

TEST(XorShift128Plus, WorksWithStandardDistributions) {
    auto rng = XorShift128Plus::fromSeed(7);
    std::uniform_int_distribution<int> dist(1, 6);
    for (int i = 0; i < 1000; ++i) {
        const int roll = dist(rng);
        ASSERT_GE(roll, 1);
        ASSERT_LE(roll, 6);
    }
}

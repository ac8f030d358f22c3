/// @file random_source_test.cpp
/// @brief Unit tests for SeededRandomSource.

#include <gtest/gtest.h>

#include <vector>

#include "duel/foundation/random_source.hpp"

using duel::foundation::SeededRandomSource;

TEST(SeededRandomSourceTest, SameSeedSameSequence) {
    SeededRandomSource a(1234);
    SeededRandomSource b(1234);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.nextInt(-5, 50), b.nextInt(-5, 50));
        EXPECT_DOUBLE_EQ(a.nextUnit(), b.nextUnit());
    }
}

TEST(SeededRandomSourceTest, ReseedRestartsSequence) {
    SeededRandomSource rng(99);
    std::vector<int32_t> first;
    for (int i = 0; i < 10; ++i) {
        first.push_back(rng.nextInt(0, 1000));
    }
    rng.reseed(99);
    EXPECT_EQ(rng.seed(), 99u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(rng.nextInt(0, 1000), first[static_cast<std::size_t>(i)]);
    }
}

TEST(SeededRandomSourceTest, UnitStaysInHalfOpenRange) {
    SeededRandomSource rng(7);
    for (int i = 0; i < 10000; ++i) {
        double v = rng.nextUnit();
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
    }
}

TEST(SeededRandomSourceTest, IntIsInclusiveOnBothEnds) {
    SeededRandomSource rng(42);
    bool sawLow = false;
    bool sawHigh = false;
    for (int i = 0; i < 2000; ++i) {
        auto v = rng.nextInt(-1, 2);
        EXPECT_GE(v, -1);
        EXPECT_LE(v, 2);
        sawLow = sawLow || v == -1;
        sawHigh = sawHigh || v == 2;
    }
    EXPECT_TRUE(sawLow);
    EXPECT_TRUE(sawHigh);
}

TEST(SeededRandomSourceTest, DegenerateRange) {
    SeededRandomSource rng(3);
    EXPECT_EQ(rng.nextInt(5, 5), 5);
}

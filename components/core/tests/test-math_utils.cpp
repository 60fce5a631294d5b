#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include "../src/fairbloom/math_utils.hpp"

using fairbloom::gcd;

TEST(MathUtilsTest, GcdOfSeveralValues) {
    EXPECT_EQ(6, gcd({12, 18, 24}));
    EXPECT_EQ(1, gcd({5, 1, 1}));
    EXPECT_EQ(25U, gcd(std::vector<uint32_t>{100, 75, 50}));
}

TEST(MathUtilsTest, GcdOfSingleValue) {
    EXPECT_EQ(5, gcd({5}));
    EXPECT_EQ(0, gcd({0}));
}

TEST(MathUtilsTest, GcdIgnoresOrderAndDuplicates) {
    EXPECT_EQ(7, gcd({7, 7, 7}));
    EXPECT_EQ(gcd({12, 18, 24}), gcd({24, 12, 18, 12}));
}

TEST(MathUtilsTest, GcdWithZero) {
    EXPECT_EQ(2, gcd({0, 4, 6}));
    EXPECT_EQ(100U, gcd(std::vector<uint32_t>{0, 100, 0}));
}

TEST(MathUtilsTest, GcdOfNothingIsZero) {
    EXPECT_EQ(0, gcd(std::vector<int>{}));
}

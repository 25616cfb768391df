#include "radarscope/utils/MathUtils.hpp"
#include <gtest/gtest.h>

using namespace radarscope;

TEST(MathUtilsTest, NormalizeAnglePositiveWrapsIntoRange) {
    EXPECT_NEAR(MathUtils::normalizeAnglePositive(TWO_PI + 0.5), 0.5, 1e-12);
    EXPECT_NEAR(MathUtils::normalizeAnglePositive(-0.5), TWO_PI - 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(MathUtils::normalizeAnglePositive(0.0), 0.0);

    double wrapped = MathUtils::normalizeAnglePositive(-1e-18);
    EXPECT_GE(wrapped, 0.0);
    EXPECT_LT(wrapped, TWO_PI);
}

TEST(MathUtilsTest, NormalizeAngleRejectsNonFinite) {
    EXPECT_DOUBLE_EQ(MathUtils::normalizeAnglePositive(std::nan("")), 0.0);
    EXPECT_DOUBLE_EQ(MathUtils::normalizeAngle(INFINITY), 0.0);
}

TEST(MathUtilsTest, AngularDistanceTakesShorterArc) {
    EXPECT_NEAR(MathUtils::angularDistance(0.1, TWO_PI - 0.1), 0.2, 1e-12);
    EXPECT_NEAR(MathUtils::angularDistance(0.0, PI), PI, 1e-12);
    EXPECT_NEAR(MathUtils::angularDistance(1.0, 1.0), 0.0, 1e-12);
}

TEST(MathUtilsTest, RssiToStrengthClamps) {
    EXPECT_EQ(MathUtils::rssiToStrength(-50), 100);
    EXPECT_EQ(MathUtils::rssiToStrength(-70), 60);
    EXPECT_EQ(MathUtils::rssiToStrength(-100), 0);
    EXPECT_EQ(MathUtils::rssiToStrength(-120), 0);
}

TEST(MathUtilsTest, RssiToDistanceCapsAtMaxRange) {
    EXPECT_NEAR(MathUtils::rssiToDistance(-30, 1000.0), 10.0, 1e-9);
    EXPECT_NEAR(MathUtils::rssiToDistance(-50, 1000.0), 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(MathUtils::rssiToDistance(-90, 10.0), 10.0);
}

TEST(MathUtilsTest, ChanceHonoursBounds) {
    std::mt19937 rng(1);
    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(MathUtils::chance(rng, 0.0));
        EXPECT_TRUE(MathUtils::chance(rng, 1.0));
    }
}

#include "radarscope/core/Signal.hpp"
#include "radarscope/utils/MathUtils.hpp"
#include <gtest/gtest.h>

using namespace radarscope;

namespace {

constexpr Timestamp T0 = 5000000;

Timestamp at(double seconds) {
    return T0 + fromSeconds(seconds);
}

}  // namespace

TEST(SignalTest, ConstructedSignalIsFullyIlluminated) {
    Signal signal(SignalKind::BLUETOOTH, "AirPods-Pro", T0);

    EXPECT_EQ(signal.name, "AirPods-Pro");
    EXPECT_EQ(signal.icon, kindIcon(SignalKind::BLUETOOTH));
    EXPECT_EQ(signal.createdAt, T0);
    EXPECT_EQ(signal.lastIlluminatedAt, T0);
    EXPECT_DOUBLE_EQ(signal.persistence, 1.0);
    EXPECT_TRUE(signal.history.empty());
    EXPECT_EQ(signal.history.capacity(), DEFAULT_MAX_HISTORY);
}

TEST(SignalTest, DecayIsLinearOverEightSeconds) {
    Signal signal(SignalKind::WIFI, "MyWiFi_5G", T0);

    signal.decay(at(2.0));
    EXPECT_NEAR(signal.persistence, 0.75, 1e-9);

    signal.decay(at(4.0));
    EXPECT_NEAR(signal.persistence, 0.5, 1e-9);

    signal.decay(at(8.0));
    EXPECT_DOUBLE_EQ(signal.persistence, 0.0);

    signal.decay(at(20.0));
    EXPECT_DOUBLE_EQ(signal.persistence, 0.0);
}

TEST(SignalTest, PersistenceNeverIncreasesWithoutIllumination) {
    Signal signal(SignalKind::RADIO, "FM-101.5", T0);

    double previous = signal.persistence;
    for (int step = 1; step <= 100; ++step) {
        signal.decay(at(step * 0.1));
        EXPECT_LE(signal.persistence, previous);
        EXPECT_GE(signal.persistence, 0.0);
        previous = signal.persistence;
    }
}

TEST(SignalTest, IlluminateRestoresFullPersistence) {
    Signal signal(SignalKind::IOT, "Nest-Cam", T0);
    signal.decay(at(6.0));
    ASSERT_LT(signal.persistence, 1.0);

    signal.illuminate(at(6.0));
    EXPECT_DOUBLE_EQ(signal.persistence, 1.0);
    EXPECT_EQ(signal.lastIlluminatedAt, at(6.0));

    // Decay restarts from the new contact
    signal.decay(at(10.0));
    EXPECT_NEAR(signal.persistence, 0.5, 1e-9);
}

TEST(SignalTest, VisibilityThreshold) {
    Signal signal(SignalKind::WIFI, "Linksys_AC", T0);

    signal.decay(at(7.0));   // 0.125
    EXPECT_TRUE(signal.isVisible());

    signal.decay(at(7.5));   // 0.0625
    EXPECT_FALSE(signal.isVisible());
}

TEST(SignalTest, HistoryKeepsNewestSamplesInOrder) {
    Signal signal(SignalKind::CELLULAR, "T-Mobile", T0, 20);

    for (int i = 0; i < 25; ++i) {
        signal.distance = 1.0 + i;
        signal.recordPosition(at(i), i % 2 == 0);
    }

    ASSERT_EQ(signal.history.size(), 20u);
    EXPECT_DOUBLE_EQ(signal.history.front().distance, 6.0);
    EXPECT_DOUBLE_EQ(signal.history.back().distance, 25.0);
    for (size_t i = 1; i < signal.history.size(); ++i) {
        EXPECT_LT(signal.history[i - 1].timestamp, signal.history[i].timestamp);
    }
}

TEST(SignalTest, ConstrainClampsDistanceAndWrapsAngle) {
    Signal signal(SignalKind::SATELLITE, "ISS", T0);

    signal.distance = 42.0;
    signal.angle = -0.25;
    signal.constrain(1.0, 10.0);
    EXPECT_DOUBLE_EQ(signal.distance, 10.0);
    EXPECT_NEAR(signal.angle, TWO_PI - 0.25, 1e-12);

    signal.distance = 0.2;
    signal.constrain(1.0, 10.0);
    EXPECT_DOUBLE_EQ(signal.distance, 1.0);
}

TEST(SignalTest, DriftStaysInsideBounds) {
    std::mt19937 rng(1234);

    for (SignalKind kind : ALL_SIGNAL_KINDS) {
        Signal signal(kind, "drifter", T0);
        signal.distance = 5.0;
        signal.angle = 3.0;

        for (int i = 0; i < 500; ++i) {
            signal.drift(rng, 1.0, 10.0);
            ASSERT_GE(signal.distance, 1.0);
            ASSERT_LE(signal.distance, 10.0);
            ASSERT_GE(signal.angle, 0.0);
            ASSERT_LT(signal.angle, TWO_PI);
        }
    }
}

TEST(SignalTest, SatelliteAdvancesAlongOrbit) {
    std::mt19937 rng(99);
    Signal signal(SignalKind::SATELLITE, "GPS-III", T0);
    signal.distance = 5.0;
    signal.angle = 1.0;

    bool moved = false;
    for (int i = 0; i < 200 && !moved; ++i) {
        double before = signal.angle;
        signal.drift(rng, 1.0, 10.0);
        if (signal.angle != before) {
            EXPECT_NEAR(signal.angle - before, 0.05, 1e-12);
            moved = true;
        }
    }
    EXPECT_TRUE(moved);
}

TEST(SignalTest, StrengthJitterStaysInRange) {
    std::mt19937 rng(7);
    Signal signal(SignalKind::WIFI, "NETGEAR_2.4G", T0);
    signal.strength = 12;

    for (int i = 0; i < 1000; ++i) {
        signal.jitterStrength(rng);
        ASSERT_GE(signal.strength, 10);
        ASSERT_LE(signal.strength, 100);
    }
}

TEST(SignalTest, SetStrengthClamps) {
    Signal signal;
    signal.setStrength(150);
    EXPECT_EQ(signal.strength, 100);
    signal.setStrength(-3);
    EXPECT_EQ(signal.strength, 0);
}

TEST(SignalTest, IlluminationUsesShorterArc) {
    Signal signal(SignalKind::WIFI, "TP-Link_Guest", T0);
    signal.angle = 0.02;

    EXPECT_TRUE(signal.isIlluminatedBy(TWO_PI - 0.02, PI / 60));
    EXPECT_FALSE(signal.isIlluminatedBy(PI, PI / 60));
}

TEST(SignalTest, PhaseWrapsAtMaxPhase) {
    Signal signal;
    for (int i = 0; i < 8; ++i) {
        signal.advancePhase(8);
    }
    EXPECT_EQ(signal.phase, 0);
    signal.advancePhase(8);
    EXPECT_EQ(signal.phase, 1);
}

#include "radarscope/engine/RadarEngine.hpp"
#include "TestScanners.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace radarscope;
using namespace radarscope::test;

namespace {

// Quiet engine: no seeding, no spawning, no drift
RadarConfig quietConfig() {
    RadarConfig config = RadarConfig::simulationOnly();
    config.management.rngSeed = 42;
    config.management.spawnProbability = 0.0;
    config.management.seedWithSimulated = false;
    config.history.enableHistory = false;
    return config;
}

// Beam wide enough to illuminate every bearing on every tick
RadarConfig alwaysLitConfig() {
    RadarConfig config = quietConfig();
    config.sweep.beamWidth = 4.0;
    return config;
}

std::shared_ptr<RealDataCollector> fixedCollector(const RadarConfig& config,
                                                  std::vector<Signal> signals,
                                                  const IClock& clock) {
    auto source = std::make_shared<FixedScanner>("Fixed", std::move(signals));
    return std::make_shared<RealDataCollector>(config.scan, source, clock);
}

}  // namespace

TEST(RadarEngineTest, SimulationSeedsInitialSet) {
    RadarConfig config = RadarConfig::simulationOnly();
    config.management.rngSeed = 7;

    ManualClock clock;
    RadarEngine engine(config, nullptr, clock);

    auto signals = engine.getSignals();
    ASSERT_GE(signals.size(), 4u);
    ASSERT_LE(signals.size(), 6u);

    std::set<SignalId> ids;
    for (const auto& signal : signals) {
        EXPECT_EQ(signal.origin, SignalOrigin::SIMULATED);
        ids.insert(signal.id);
    }
    EXPECT_EQ(ids.size(), signals.size());
    EXPECT_FALSE(engine.isUsingRealData());
}

TEST(RadarEngineTest, RealModeStartsWithCollectedSignals) {
    RadarConfig config = quietConfig();
    config.scan.useRealData = true;

    ManualClock clock;
    auto collector = fixedCollector(config, {
        makeTestSignal(SignalKind::WIFI, "eth0 Interface"),
        makeTestSignal(SignalKind::NETWORK, "HTTP Connections")}, clock);
    RadarEngine engine(config, collector, clock);

    auto signals = engine.getSignals();
    ASSERT_EQ(signals.size(), 2u);
    EXPECT_EQ(signals[0].origin, SignalOrigin::REAL);
    EXPECT_TRUE(engine.isUsingRealData());
}

TEST(RadarEngineTest, EmptyRealDataFallsBackToSimulatedSeed) {
    RadarConfig config = RadarConfig::defaults();
    config.management.rngSeed = 3;
    config.scan.useSimulatedFallback = false;

    ManualClock clock;
    auto collector = std::make_shared<RealDataCollector>(config.scan, nullptr, clock);
    RadarEngine engine(config, collector, clock);

    EXPECT_GE(engine.getNumSignals(), 4u);
}

TEST(RadarEngineTest, SweepAdvancesEachTick) {
    ManualClock clock;
    RadarEngine engine(quietConfig(), nullptr, clock);

    engine.tick();
    EXPECT_NEAR(engine.getSweepAngle(), PI / 30, 1e-12);

    for (int i = 0; i < 29; ++i) {
        engine.tick();
    }
    EXPECT_NEAR(engine.getSweepAngle(), PI, 1e-9);
    EXPECT_EQ(engine.getStatistics().ticks, 30u);
}

TEST(RadarEngineTest, SignalUnderBeamIsRefreshed) {
    ManualClock clock;
    RadarEngine engine(quietConfig(), nullptr, clock);

    engine.addSignal(makeTestSignal(SignalKind::WIFI, "lit", 50, 3.0, 0.05));
    engine.addSignal(makeTestSignal(SignalKind::WIFI, "dark", 50, 3.0, PI));

    clock.advance(4.0);
    engine.tick();

    auto signals = engine.getSignals();
    ASSERT_EQ(signals.size(), 2u);
    EXPECT_DOUBLE_EQ(signals[0].persistence, 1.0);
    EXPECT_NEAR(signals[1].persistence, 0.5, 1e-9);
}

TEST(RadarEngineTest, FadedSignalIsPruned) {
    ManualClock clock;
    RadarEngine engine(quietConfig(), nullptr, clock);
    engine.addSignal(makeTestSignal(SignalKind::RADIO, "AM-680", 50, 3.0, PI));

    clock.advance(7.5);
    engine.tick();

    EXPECT_EQ(engine.getNumSignals(), 0u);
    EXPECT_EQ(engine.getStatistics().signalsExpired, 1u);
}

TEST(RadarEngineTest, SignalExpiresAfterLifetime) {
    ManualClock clock;
    RadarEngine engine(alwaysLitConfig(), nullptr, clock);
    engine.addSignal(makeTestSignal(SignalKind::IOT, "Smart-TV"));

    clock.advance(29.0);
    engine.tick();
    EXPECT_EQ(engine.getNumSignals(), 1u);

    clock.advance(2.0);
    engine.tick();
    EXPECT_EQ(engine.getNumSignals(), 0u);
}

TEST(RadarEngineTest, PausedEngineDoesNothing) {
    ManualClock clock;
    RadarEngine engine(quietConfig(), nullptr, clock);
    engine.addSignal(makeTestSignal(SignalKind::WIFI, "frozen", 50, 3.0, PI));

    engine.setPaused(true);
    clock.advance(20.0);
    engine.tick();

    EXPECT_DOUBLE_EQ(engine.getSweepAngle(), 0.0);
    EXPECT_EQ(engine.getNumSignals(), 1u);
    EXPECT_EQ(engine.getStatistics().ticks, 0u);

    engine.togglePause();
    EXPECT_FALSE(engine.isPaused());
}

TEST(RadarEngineTest, SpeedStaysWithinBounds) {
    RadarConfig config = quietConfig();
    ManualClock clock;
    RadarEngine engine(config, nullptr, clock);

    engine.increaseSpeed();
    EXPECT_NEAR(engine.getSweepSpeed(), config.sweep.sweepSpeed * 1.2, 1e-12);

    for (int i = 0; i < 50; ++i) {
        engine.increaseSpeed();
    }
    EXPECT_DOUBLE_EQ(engine.getSweepSpeed(), config.sweep.maxSweepSpeed);

    for (int i = 0; i < 100; ++i) {
        engine.decreaseSpeed();
    }
    EXPECT_DOUBLE_EQ(engine.getSweepSpeed(), config.sweep.minSweepSpeed);
}

TEST(RadarEngineTest, KindFiltersHideSignals) {
    ManualClock clock;
    RadarEngine engine(quietConfig(), nullptr, clock);
    engine.addSignal(makeTestSignal(SignalKind::WIFI, "HomeAP"));
    engine.addSignal(makeTestSignal(SignalKind::BLUETOOTH, "Keyboard"));

    EXPECT_EQ(engine.getVisibleSignalCount(), 2u);

    engine.toggleKindFilter(SignalKind::WIFI);
    EXPECT_FALSE(engine.isKindVisible(SignalKind::WIFI));
    EXPECT_EQ(engine.getVisibleSignalCount(), 1u);
    EXPECT_EQ(engine.getNumSignals(), 2u);

    auto counts = engine.getSignalCountsByKind();
    EXPECT_EQ(counts.size(), NUM_SIGNAL_KINDS);
    EXPECT_EQ(counts[SignalKind::WIFI], 0u);
    EXPECT_EQ(counts[SignalKind::BLUETOOTH], 1u);

    // Some hidden, so toggling all shows every kind
    engine.toggleAllFilters();
    EXPECT_TRUE(engine.areAllFiltersVisible());
    EXPECT_EQ(engine.getVisibleSignalCount(), 2u);

    engine.toggleAllFilters();
    EXPECT_EQ(engine.getVisibleSignalCount(), 0u);
}

TEST(RadarEngineTest, FiltersIgnoredWhenFilteringDisabled) {
    RadarConfig config = quietConfig();
    config.management.enableFiltering = false;

    ManualClock clock;
    RadarEngine engine(config, nullptr, clock);
    engine.addSignal(makeTestSignal(SignalKind::CELLULAR, "AT&T-5G"));

    engine.setAllFiltersVisible(false);
    EXPECT_EQ(engine.getVisibleSignalCount(), 1u);
}

TEST(RadarEngineTest, SelectionCyclesThroughVisibleSignals) {
    ManualClock clock;
    RadarEngine engine(quietConfig(), nullptr, clock);
    SignalId a = engine.addSignal(makeTestSignal(SignalKind::WIFI, "A"));
    SignalId b = engine.addSignal(makeTestSignal(SignalKind::BLUETOOTH, "B"));
    SignalId c = engine.addSignal(makeTestSignal(SignalKind::RADIO, "C"));

    EXPECT_FALSE(engine.getSelectedSignal().has_value());

    engine.selectNextSignal();
    EXPECT_EQ(engine.getSelectedSignalId(), a);
    engine.selectNextSignal();
    EXPECT_EQ(engine.getSelectedSignalId(), b);
    engine.selectPreviousSignal();
    EXPECT_EQ(engine.getSelectedSignalId(), a);
    engine.selectPreviousSignal();
    EXPECT_EQ(engine.getSelectedSignalId(), c);
    engine.selectNextSignal();
    EXPECT_EQ(engine.getSelectedSignalId(), a);

    // Hidden kinds are skipped
    engine.toggleKindFilter(SignalKind::BLUETOOTH);
    engine.selectNextSignal();
    EXPECT_EQ(engine.getSelectedSignalId(), c);

    auto selected = engine.getSelectedSignal();
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->name, "C");
    EXPECT_EQ(engine.getSelectedSignalIndex(), 2);

    engine.clearSelection();
    EXPECT_EQ(engine.getSelectedSignalId(), -1);
}

TEST(RadarEngineTest, SelectionDropsWithItsSignal) {
    ManualClock clock;
    RadarEngine engine(quietConfig(), nullptr, clock);
    engine.addSignal(makeTestSignal(SignalKind::WIFI, "gone", 50, 3.0, PI));

    engine.selectNextSignal();
    ASSERT_TRUE(engine.getSelectedSignal().has_value());

    clock.advance(9.0);
    engine.tick();

    EXPECT_FALSE(engine.getSelectedSignal().has_value());
    EXPECT_EQ(engine.getSelectedSignalIndex(), -1);
}

TEST(RadarEngineTest, MergeRefreshesKnownSignals) {
    RadarConfig config = alwaysLitConfig();
    config.scan.useRealData = true;

    ManualClock clock;
    auto collector = fixedCollector(config, {
        makeTestSignal(SignalKind::WIFI, "wlan0 Interface", 80),
        makeTestSignal(SignalKind::NETWORK, "SSH Connections", 40)}, clock);
    RadarEngine engine(config, collector, clock);
    ASSERT_EQ(engine.getNumSignals(), 2u);

    clock.advance(9.0);
    engine.tick();

    EXPECT_EQ(engine.getNumSignals(), 2u);
    auto stats = engine.getStatistics();
    EXPECT_EQ(stats.signalsRefreshed, 2u);
    EXPECT_EQ(stats.signalsMerged, 0u);
}

TEST(RadarEngineTest, MergeKeepsMostRecentSignals) {
    RadarConfig config = alwaysLitConfig();
    config.scan.useRealData = true;
    config.scan.maxSignals = 3;

    std::vector<Signal> found;
    for (int i = 0; i < 5; ++i) {
        found.push_back(makeTestSignal(SignalKind::WIFI, "AP-" + std::to_string(i)));
    }

    ManualClock clock;
    RadarEngine engine(config, fixedCollector(config, found, clock), clock);

    auto signals = engine.getSignals();
    ASSERT_EQ(signals.size(), 3u);
    EXPECT_EQ(signals[0].name, "AP-2");
    EXPECT_EQ(signals[2].name, "AP-4");
}

TEST(RadarEngineTest, ManagementSpawnsSimulatedSignal) {
    RadarConfig config = alwaysLitConfig();
    config.management.spawnProbability = 1.0;

    ManualClock clock;
    RadarEngine engine(config, nullptr, clock);
    ASSERT_EQ(engine.getNumSignals(), 0u);

    clock.advance(2.0);
    engine.tick();

    auto signals = engine.getSignals();
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].name.rfind("SIM-", 0), 0u);
    EXPECT_EQ(engine.getStatistics().signalsSpawned, 1u);
}

TEST(RadarEngineTest, SpawningStopsAtMaxSignals) {
    RadarConfig config = alwaysLitConfig();
    config.management.spawnProbability = 1.0;
    config.scan.maxSignals = 2;

    ManualClock clock;
    RadarEngine engine(config, nullptr, clock);

    for (int i = 0; i < 5; ++i) {
        clock.advance(2.0);
        engine.tick();
    }
    EXPECT_EQ(engine.getNumSignals(), 2u);
}

TEST(RadarEngineTest, ResetRestoresDefaults) {
    RadarConfig config = quietConfig();
    ManualClock clock;
    RadarEngine engine(config, nullptr, clock);

    engine.increaseSpeed();
    engine.tick();
    engine.setPaused(true);

    engine.reset();

    EXPECT_FALSE(engine.isPaused());
    EXPECT_DOUBLE_EQ(engine.getSweepAngle(), 0.0);
    EXPECT_DOUBLE_EQ(engine.getSweepSpeed(), config.sweep.sweepSpeed);
    EXPECT_GE(engine.getNumSignals(), 4u);
}

TEST(RadarEngineTest, ToggleDataModeSwapsPopulation) {
    RadarConfig config = quietConfig();

    ManualClock clock;
    auto collector = fixedCollector(config, {
        makeTestSignal(SignalKind::NETWORK, "DNS Connections")}, clock);
    RadarEngine engine(config, collector, clock);
    ASSERT_EQ(engine.getNumSignals(), 0u);

    engine.toggleDataMode();
    EXPECT_TRUE(engine.isUsingRealData());
    auto real = engine.getSignals();
    ASSERT_EQ(real.size(), 1u);
    EXPECT_EQ(real[0].name, "DNS Connections");

    engine.toggleDataMode();
    EXPECT_FALSE(engine.isUsingRealData());
    auto simulated = engine.getSignals();
    ASSERT_GE(simulated.size(), 4u);
    for (const auto& signal : simulated) {
        EXPECT_EQ(signal.origin, SignalOrigin::SIMULATED);
    }
}

TEST(RadarEngineTest, HistoryRecordsOnSchedule) {
    RadarConfig config = alwaysLitConfig();
    config.history.enableHistory = true;
    config.history.historyUpdateRate = 0.5;
    config.history.maxHistory = 4;

    ManualClock clock;
    RadarEngine engine(config, nullptr, clock);
    engine.addSignal(makeTestSignal(SignalKind::WIFI, "trail"));

    for (int i = 0; i < 10; ++i) {
        clock.advance(0.5);
        engine.tick();
    }

    auto signals = engine.getSignals();
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].history.size(), 4u);
    EXPECT_EQ(signals[0].history.capacity(), 4u);
    EXPECT_TRUE(signals[0].history.back().wasIlluminated);
    EXPECT_EQ(engine.getStatistics().historyPasses, 10u);
}

#include "radarscope/collector/RealDataCollector.hpp"
#include "radarscope/scanner/ScanCoordinator.hpp"
#include "TestScanners.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace radarscope;
using namespace radarscope::test;

namespace {

ScanConfig collectorConfig() {
    ScanConfig config;
    config.scanInterval = 8.0;
    config.collectTimeout = 0.3;
    config.useSimulatedFallback = true;
    config.scanners.clear();
    return config;
}

/**
 * @brief Answers the first call, blocks on every later one until released
 */
class OnceThenHangScanner : public IScanner {
public:
    ScanResult scan(const ScanContext&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (calls_++ == 0) {
            return ScanResult::success({makeTestSignal(SignalKind::WIFI, "Lab-AP", 70)});
        }
        cv_.wait(lock, [this] { return released_; });
        return ScanResult::success({});
    }

    std::string getName() const override { return "OnceThenHang"; }
    bool isAvailable() const override { return true; }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int calls_ = 0;
    bool released_ = false;
};

}  // namespace

TEST(RealDataCollectorTest, FallbackPlaceholdersAreFixed) {
    auto signals = RealDataCollector::generateFallbackSignals(1000000);

    ASSERT_EQ(signals.size(), 2u);
    EXPECT_EQ(signals[0].name, "Unknown-WiFi");
    EXPECT_EQ(signals[0].kind, SignalKind::WIFI);
    EXPECT_EQ(signals[1].name, "Network-Activity");
    EXPECT_EQ(signals[1].kind, SignalKind::CELLULAR);
    for (const auto& signal : signals) {
        EXPECT_EQ(signal.origin, SignalOrigin::FALLBACK);
        EXPECT_EQ(signal.history.size(), 1u);
        EXPECT_DOUBLE_EQ(signal.persistence, 1.0);
    }
}

TEST(RealDataCollectorTest, NoSourceServesFallback) {
    ManualClock clock;
    RealDataCollector collector(collectorConfig(), nullptr, clock);

    EXPECT_FALSE(collector.hasSource());
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::NONE);

    auto signals = collector.collect();
    EXPECT_EQ(signals.size(), 2u);
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FALLBACK);
    EXPECT_EQ(collector.getStatistics().fallbacks, 1u);
}

TEST(RealDataCollectorTest, NoSourceWithoutFallbackIsEmpty) {
    ScanConfig config = collectorConfig();
    config.useSimulatedFallback = false;

    ManualClock clock;
    RealDataCollector collector(config, nullptr, clock);

    EXPECT_TRUE(collector.collect().empty());
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::EMPTY);
}

TEST(RealDataCollectorTest, FreshSignalsAreStampedReal) {
    ManualClock clock;
    auto source = std::make_shared<FixedScanner>(
        "Fixed", std::vector<Signal>{makeTestSignal(SignalKind::BLUETOOTH, "MX-Keys")});
    RealDataCollector collector(collectorConfig(), source, clock);

    auto signals = collector.collect();
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].origin, SignalOrigin::REAL);
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FRESH);
    EXPECT_EQ(collector.getStatistics().freshResults, 1u);
}

TEST(RealDataCollectorTest, RateLimitReturnsCache) {
    ManualClock clock;
    auto source = std::make_shared<FixedScanner>(
        "Fixed", std::vector<Signal>{makeTestSignal(SignalKind::WIFI, "Cafe")});
    RealDataCollector collector(collectorConfig(), source, clock);

    collector.collect();
    clock.advance(3.0);
    auto cached = collector.collect();

    ASSERT_EQ(cached.size(), 1u);
    EXPECT_EQ(cached[0].name, "Cafe");
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::CACHED);
    EXPECT_EQ(source->getCalls(), 1);
    EXPECT_EQ(collector.getStatistics().collections, 1u);

    clock.advance(6.0);
    collector.collect();
    EXPECT_EQ(source->getCalls(), 2);
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FRESH);
}

TEST(RealDataCollectorTest, SlowSourceFallsBackWithinBudget) {
    ScanConfig config = collectorConfig();
    config.collectTimeout = 1.0;

    auto source = std::make_shared<HangingScanner>();
    ReleaseGuard guard(source);

    ManualClock clock;
    RealDataCollector collector(config, source, clock);

    auto start = std::chrono::steady_clock::now();
    auto signals = collector.collect();
    double elapsed = secondsSince(start);

    EXPECT_GE(elapsed, 0.9);
    EXPECT_LT(elapsed, 1.5);
    EXPECT_EQ(signals.size(), 2u);
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FALLBACK);
    EXPECT_EQ(collector.getStatistics().timeouts, 1u);
}

TEST(RealDataCollectorTest, SlowSourceServesStaleResult) {
    ManualClock clock;
    auto source = std::make_shared<OnceThenHangScanner>();
    RealDataCollector collector(collectorConfig(), source, clock);

    auto fresh = collector.collect();
    ASSERT_EQ(fresh.size(), 1u);

    clock.advance(9.0);
    auto stale = collector.collect();
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].name, "Lab-AP");
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::STALE);

    source->release();
}

TEST(RealDataCollectorTest, PendingCallIsReusedByNextCollection) {
    ManualClock clock;
    auto source = std::make_shared<HangingScanner>(
        std::vector<Signal>{makeTestSignal(SignalKind::RADIO, "FM-99.1")});
    ReleaseGuard guard(source);
    RealDataCollector collector(collectorConfig(), source, clock);

    collector.collect();
    EXPECT_EQ(source->getEntered(), 1);

    source->release();
    clock.advance(9.0);
    auto signals = collector.collect();

    EXPECT_EQ(source->getEntered(), 1);
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].name, "FM-99.1");
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FRESH);
}

TEST(RealDataCollectorTest, SourceErrorFallsBack) {
    ManualClock clock;
    RealDataCollector collector(collectorConfig(), std::make_shared<FailingScanner>(), clock);

    auto signals = collector.collect();
    EXPECT_EQ(signals.size(), 2u);
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FALLBACK);
    EXPECT_EQ(collector.getStatistics().sourceErrors, 1u);
}

TEST(RealDataCollectorTest, ThrowingSourceFallsBack) {
    ManualClock clock;
    RealDataCollector collector(collectorConfig(), std::make_shared<ThrowingScanner>(), clock);

    EXPECT_EQ(collector.collect().size(), 2u);
    EXPECT_EQ(collector.getStatistics().sourceErrors, 1u);
}

TEST(RealDataCollectorTest, NonStandardExceptionFallsBack) {
    ManualClock clock;
    RealDataCollector collector(collectorConfig(),
                                std::make_shared<ThrowingNonStandardScanner>(), clock);

    EXPECT_EQ(collector.collect().size(), 2u);
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FALLBACK);
    EXPECT_EQ(collector.getStatistics().sourceErrors, 1u);
}

TEST(RealDataCollectorTest, ReturnedSignalsAreCopies) {
    ManualClock clock;
    auto source = std::make_shared<FixedScanner>(
        "Fixed", std::vector<Signal>{makeTestSignal(SignalKind::WIFI, "Cafe", 55)});
    RealDataCollector collector(collectorConfig(), source, clock);

    std::vector<Signal> fresh = collector.collect();
    ASSERT_EQ(fresh.size(), 1u);
    fresh[0].name = "Tampered";
    fresh[0].strength = 1;

    std::vector<Signal> cached = collector.getCachedSignals();
    ASSERT_EQ(cached.size(), 1u);
    EXPECT_EQ(cached[0].name, "Cafe");
    cached[0].name = "Tampered";
    cached[0].strength = 1;

    clock.advance(3.0);
    std::vector<Signal> served = collector.collect();
    ASSERT_EQ(served.size(), 1u);
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::CACHED);
    EXPECT_EQ(served[0].name, "Cafe");
    EXPECT_EQ(served[0].strength, 55);

    std::vector<Signal> cachedAgain = collector.getCachedSignals();
    ASSERT_EQ(cachedAgain.size(), 1u);
    expectSameSignal(cachedAgain[0], served[0]);
}

TEST(RealDataCollectorTest, EmptyCoordinatorIsNotAnError) {
    ManualClock clock;
    ScanConfig config = collectorConfig();
    auto coordinator = std::make_shared<ScanCoordinator>(config, clock);
    coordinator->addScanner(std::make_shared<FixedScanner>(
        "Fixed", std::vector<Signal>{makeTestSignal(SignalKind::IOT, "Hue-Bridge")}));

    RealDataCollector collector(config, coordinator, clock);

    // First coordinator answer is an empty cache while the aggregation runs
    collector.collect();
    EXPECT_EQ(collector.getLastOutcome(), RealDataCollector::Outcome::FALLBACK);
    EXPECT_EQ(collector.getStatistics().sourceErrors, 0u);

    ASSERT_TRUE(coordinator->waitUntilIdle(2.0));
    clock.advance(9.0);

    auto signals = collector.collect();
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].name, "Hue-Bridge");
    EXPECT_EQ(signals[0].origin, SignalOrigin::REAL);
}

/**
 * @file ScanCoordinator.hpp
 * @brief Rate-limited, timeout-bounded aggregation of many scanners
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_SCANNER_SCANCOORDINATOR_HPP
#define RADARSCOPE_SCANNER_SCANCOORDINATOR_HPP

#include "IScanner.hpp"
#include "../core/ScanConfig.hpp"
#include "../utils/Clock.hpp"
#include <condition_variable>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace radarscope {

/**
 * @brief Runs every registered scanner concurrently behind a cache
 *
 * scan() never waits on I/O. When the rate limit allows and no scan is
 * in flight it starts one background aggregation and returns the current
 * (possibly stale) cache right away. The aggregation fans out one detached
 * unit per scanner, fans results back in through a queue until every
 * scanner reported or the scan timeout passed, then replaces the cache.
 *
 * At most one aggregation is outstanding at any time. Every read returns
 * a copy; cache and state changes happen under one reader/writer lock.
 *
 * The coordinator is itself an IScanner so it can feed a RealDataCollector.
 */
class ScanCoordinator : public IScanner {
public:
    enum class State {
        IDLE,
        SCANNING
    };

    /**
     * @brief Construct with configuration
     *
     * @param config Scan configuration (copied)
     * @param clock Time source for rate limiting; must outlive the coordinator
     */
    explicit ScanCoordinator(const ScanConfig& config,
                             const IClock& clock = SystemClock::instance());

    /**
     * @brief Cancels and joins an outstanding aggregation
     */
    ~ScanCoordinator() override;

    // Non-copyable, non-movable (owns a worker thread)
    ScanCoordinator(const ScanCoordinator&) = delete;
    ScanCoordinator& operator=(const ScanCoordinator&) = delete;
    ScanCoordinator(ScanCoordinator&&) = delete;
    ScanCoordinator& operator=(ScanCoordinator&&) = delete;

    /**
     * @brief Register a scanner if its capability probe passes
     *
     * @return false if the scanner is unavailable and was excluded
     */
    bool addScanner(std::shared_ptr<IScanner> scanner);

    /**
     * @brief Non-blocking scan
     *
     * Returns a copy of the cached aggregate; may start a background
     * aggregation. The result error is AGGREGATE_EMPTY when the copy is
     * empty, NONE otherwise.
     */
    ScanResult scan(const ScanContext& ctx) override;

    std::string getName() const override { return "Scan Coordinator"; }

    /**
     * @brief True when at least one scanner is registered
     */
    bool isAvailable() const override;

    /**
     * @brief Copy of the last aggregate
     */
    std::vector<Signal> getCachedSignals() const;

    /**
     * @brief Names of the registered scanners
     */
    std::vector<std::string> getScannerNames() const;

    State getState() const;

    /**
     * @brief Block until no aggregation is in flight
     *
     * @return false if still scanning after @p timeoutSeconds
     */
    bool waitUntilIdle(double timeoutSeconds) const;

    /**
     * @brief Get coordinator statistics
     */
    struct Statistics {
        uint64_t scansLaunched = 0;
        uint64_t scansCompleted = 0;
        uint64_t scannerFailures = 0;
        uint64_t scannerTimeouts = 0;
        size_t lastSignalCount = 0;
        double lastScanDurationMs = 0.0;
    };

    Statistics getStatistics() const;

    const ScanConfig& getConfig() const { return config_; }

private:
    /**
     * @brief Body of the background aggregation
     */
    void performBackgroundScan(ScanContext scanCtx,
                               std::vector<std::shared_ptr<IScanner>> scanners);

    /**
     * @brief Run one scanner, converting exceptions into SCAN_FAILED
     */
    static ScanResult runScanner(IScanner& scanner, const ScanContext& ctx);

    ScanConfig config_;
    const IClock& clock_;

    std::vector<std::shared_ptr<IScanner>> scanners_;
    std::vector<Signal> cachedSignals_;

    State state_ = State::IDLE;
    bool hasScanned_ = false;
    Timestamp lastScanStartedAt_ = 0;

    // Context of the aggregation in flight, cancelled on destruction
    ScanContext activeContext_;
    std::thread worker_;

    Statistics stats_;

    // Thread safety
    mutable std::shared_mutex mutex_;
    mutable std::condition_variable_any idleCv_;
};

inline std::string coordinatorStateToString(ScanCoordinator::State state) {
    return state == ScanCoordinator::State::SCANNING ? "SCANNING" : "IDLE";
}

} // namespace radarscope

#endif // RADARSCOPE_SCANNER_SCANCOORDINATOR_HPP

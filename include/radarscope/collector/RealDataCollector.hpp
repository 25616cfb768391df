/**
 * @file RealDataCollector.hpp
 * @brief Latency-bounded bridge from a scanner to the tick engine
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_COLLECTOR_REALDATACOLLECTOR_HPP
#define RADARSCOPE_COLLECTOR_REALDATACOLLECTOR_HPP

#include "../core/ScanConfig.hpp"
#include "../core/Signal.hpp"
#include "../scanner/IScanner.hpp"
#include "../utils/Clock.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace radarscope {

/**
 * @brief Turns a possibly slow source into a bounded-latency signal feed
 *
 * collect() is rate limited to one real collection per scanInterval. A
 * collection issues the source asynchronously and waits at most
 * collectTimeout for it; whatever happens it returns within that budget,
 * serving the last good result, fallback placeholders or nothing.
 *
 * At most one source call is in flight. A call that outlives its budget
 * keeps running and is picked up by the next collection.
 */
class RealDataCollector {
public:
    /**
     * @brief How the last collect() call was served
     */
    enum class Outcome {
        NONE,       // Not collected yet
        FRESH,      // Source answered in time with signals
        CACHED,     // Rate limited, previous result returned
        STALE,      // Source too slow, previous non-empty result returned
        FALLBACK,   // Placeholders returned
        EMPTY       // Nothing to return
    };

    /**
     * @brief Construct collector
     *
     * @param config Scan configuration (copied)
     * @param source Data source, usually a ScanCoordinator; may be null
     * @param clock Time source for rate limiting; must outlive the collector
     */
    RealDataCollector(const ScanConfig& config,
                      std::shared_ptr<IScanner> source,
                      const IClock& clock = SystemClock::instance());

    /**
     * @brief Cancels the source call in flight, if any
     */
    ~RealDataCollector();

    // Non-copyable
    RealDataCollector(const RealDataCollector&) = delete;
    RealDataCollector& operator=(const RealDataCollector&) = delete;

    /**
     * @brief Collect signals, returning within collectTimeout
     *
     * Fresh signals are stamped with SignalOrigin::REAL.
     */
    std::vector<Signal> collect();

    /**
     * @brief Fixed placeholder set served when no real data is available
     */
    static std::vector<Signal> generateFallbackSignals(Timestamp now);

    Outcome getLastOutcome() const;

    /**
     * @brief Copy of the currently cached result
     */
    std::vector<Signal> getCachedSignals() const;

    bool hasSource() const { return static_cast<bool>(source_); }

    const ScanConfig& getConfig() const { return config_; }

    /**
     * @brief Get collection statistics
     */
    struct Statistics {
        uint64_t collections = 0;       // Calls that went past the rate limit
        uint64_t freshResults = 0;
        uint64_t timeouts = 0;
        uint64_t fallbacks = 0;
        uint64_t sourceErrors = 0;
    };

    Statistics getStatistics() const;

private:
    /**
     * @brief Start a source call unless one is still pending
     */
    void launchIfIdle();

    /**
     * @brief Fallback if enabled, otherwise empty; caches the answer
     */
    std::vector<Signal> serveFallback(Timestamp now);

    ScanConfig config_;
    std::shared_ptr<IScanner> source_;
    const IClock& clock_;

    // Parent of every source call, cancelled on destruction
    ScanContext context_;

    // Touched only by the thread inside collect()
    std::future<ScanResult> pending_;

    std::vector<Signal> cachedSignals_;
    Timestamp lastCollectedAt_ = 0;
    bool hasCollected_ = false;
    Outcome lastOutcome_ = Outcome::NONE;
    Statistics stats_;

    // Serializes collect(); held across the bounded wait
    std::mutex collectMutex_;

    // Guards cache, outcome and statistics for readers
    mutable std::mutex mutex_;
};

inline std::string collectorOutcomeToString(RealDataCollector::Outcome outcome) {
    switch (outcome) {
        case RealDataCollector::Outcome::FRESH: return "FRESH";
        case RealDataCollector::Outcome::CACHED: return "CACHED";
        case RealDataCollector::Outcome::STALE: return "STALE";
        case RealDataCollector::Outcome::FALLBACK: return "FALLBACK";
        case RealDataCollector::Outcome::EMPTY: return "EMPTY";
        default: return "NONE";
    }
}

} // namespace radarscope

#endif // RADARSCOPE_COLLECTOR_REALDATACOLLECTOR_HPP

/**
 * @file RealDataCollector.cpp
 * @brief Real data collector implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/collector/RealDataCollector.hpp"
#include "radarscope/utils/Logger.hpp"
#include <chrono>
#include <exception>
#include <thread>

namespace radarscope {

namespace {

const char* const kLogComponent = "RealDataCollector";

struct FallbackEntry {
    SignalKind kind;
    const char* name;
    int strength;
    double distance;
    double angle;
};

// Fixed so that placeholders do not jump around between collections
const FallbackEntry kFallbackEntries[] = {
    {SignalKind::WIFI, "Unknown-WiFi", 60, 3.0, PI / 4},
    {SignalKind::CELLULAR, "Network-Activity", 50, 5.0, 5 * PI / 4},
};

}  // anonymous namespace

RealDataCollector::RealDataCollector(const ScanConfig& config,
                                     std::shared_ptr<IScanner> source,
                                     const IClock& clock)
    : config_(config),
      source_(std::move(source)),
      clock_(clock),
      context_(ScanContext::withCancel(ScanContext::background())) {
}

RealDataCollector::~RealDataCollector() {
    context_.cancel();
}

std::vector<Signal> RealDataCollector::generateFallbackSignals(Timestamp now) {
    std::vector<Signal> signals;
    signals.reserve(sizeof(kFallbackEntries) / sizeof(kFallbackEntries[0]));

    for (const auto& entry : kFallbackEntries) {
        Signal signal(entry.kind, entry.name, now);
        signal.origin = SignalOrigin::FALLBACK;
        signal.strength = entry.strength;
        signal.distance = entry.distance;
        signal.angle = entry.angle;
        signal.recordPosition(now, true);
        signals.push_back(std::move(signal));
    }

    return signals;
}

void RealDataCollector::launchIfIdle() {
    if (pending_.valid()) {
        return;
    }

    auto promise = std::make_shared<std::promise<ScanResult>>();
    pending_ = promise->get_future();

    std::thread([source = source_, promise, ctx = context_]() {
        try {
            promise->set_value(source->scan(ctx));
        } catch (const std::exception& e) {
            promise->set_value(ScanResult::failure(ScanError::SCAN_FAILED, e.what()));
        } catch (...) {
            promise->set_value(ScanResult::failure(ScanError::SCAN_FAILED, "unknown exception"));
        }
    }).detach();
}

std::vector<Signal> RealDataCollector::serveFallback(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.useSimulatedFallback) {
        cachedSignals_ = generateFallbackSignals(now);
        lastOutcome_ = Outcome::FALLBACK;
        stats_.fallbacks++;
    } else {
        cachedSignals_.clear();
        lastOutcome_ = Outcome::EMPTY;
    }
    return cachedSignals_;
}

std::vector<Signal> RealDataCollector::collect() {
    std::lock_guard<std::mutex> collectLock(collectMutex_);

    const Timestamp now = clock_.now();

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Only scan at the configured interval
        if (hasCollected_ && secondsBetween(lastCollectedAt_, now) < config_.scanInterval) {
            lastOutcome_ = Outcome::CACHED;
            return cachedSignals_;
        }

        lastCollectedAt_ = now;
        hasCollected_ = true;
        stats_.collections++;
    }

    if (!source_) {
        return serveFallback(now);
    }

    launchIfIdle();

    auto budget = std::chrono::duration<double>(config_.collectTimeout);
    if (pending_.wait_for(budget) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.timeouts++;
            RADARSCOPE_LOG_WARN(kLogComponent, "'" << source_->getName() << "' "
                                << scanErrorToString(ScanError::SCAN_TIMEOUT)
                                << " after " << config_.collectTimeout << "s");

            if (!cachedSignals_.empty()) {
                lastOutcome_ = Outcome::STALE;
                return cachedSignals_;
            }
        }
        return serveFallback(now);
    }

    ScanResult result = pending_.get();

    if (result.ok() && !result.signals.empty()) {
        for (auto& signal : result.signals) {
            signal.origin = SignalOrigin::REAL;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        cachedSignals_ = std::move(result.signals);
        lastOutcome_ = Outcome::FRESH;
        stats_.freshResults++;
        return cachedSignals_;
    }

    if (!result.ok() && result.error != ScanError::AGGREGATE_EMPTY) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.sourceErrors++;
        }
        RADARSCOPE_LOG_WARN(kLogComponent, "'" << source_->getName() << "' "
                            << scanErrorToString(result.error)
                            << (result.message.empty() ? "" : ": ") << result.message);
    }

    return serveFallback(now);
}

RealDataCollector::Outcome RealDataCollector::getLastOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOutcome_;
}

std::vector<Signal> RealDataCollector::getCachedSignals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cachedSignals_;
}

RealDataCollector::Statistics RealDataCollector::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace radarscope

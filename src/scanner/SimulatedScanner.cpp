/**
 * @file SimulatedScanner.cpp
 * @brief Simulated scanner implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/scanner/SimulatedScanner.hpp"
#include "radarscope/utils/MathUtils.hpp"
#include <algorithm>
#include <string>

namespace radarscope {

namespace {

// Kinds a synthetic scan cycles through
const SignalKind kScanKinds[] = {
    SignalKind::WIFI,
    SignalKind::BLUETOOTH,
    SignalKind::CELLULAR,
    SignalKind::IOT
};

uint32_t resolveSeed(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device rd;
    return rd();
}

}  // anonymous namespace

SimulatedScanner::SimulatedScanner(const ScanConfig& config, const IClock& clock)
    : SimulatedScanner(config, Options(), clock) {
}

SimulatedScanner::SimulatedScanner(const ScanConfig& config, const Options& options,
                                   const IClock& clock)
    : config_(config),
      options_(options),
      clock_(clock),
      rng_(resolveSeed(options.seed)) {
}

ScanResult SimulatedScanner::scan(const ScanContext& ctx) {
    scanCount_++;

    if (options_.latencySeconds > 0.0 && !ctx.waitFor(options_.latencySeconds)) {
        return ScanResult::failure(ScanError::SCAN_TIMEOUT, "cancelled while scanning");
    }

    if (ctx.isCancelled()) {
        return ScanResult::failure(ScanError::SCAN_TIMEOUT, "cancelled before scanning");
    }

    std::lock_guard<std::mutex> lock(rngMutex_);

    if (MathUtils::chance(rng_, options_.failureProbability)) {
        return ScanResult::failure(ScanError::SCAN_FAILED, "simulated hardware fault");
    }

    const Timestamp now = clock_.now();
    const size_t numKinds = sizeof(kScanKinds) / sizeof(kScanKinds[0]);
    int count = std::min(options_.signalCount, config_.maxSignals);

    std::vector<Signal> signals;
    signals.reserve(static_cast<size_t>(std::max(0, count)));

    for (int i = 0; i < count; ++i) {
        SignalKind kind = kScanKinds[static_cast<size_t>(i) % numKinds];

        Signal signal(kind, "SCAN-" + signalKindToString(kind) + "-" + std::to_string(i + 1), now);
        signal.origin = SignalOrigin::SIMULATED;
        signal.strength = MathUtils::uniformInt(rng_, 30, 100);
        signal.distance = MathUtils::uniformRandom(rng_, 1.0, std::max(1.0, config_.maxScanRange));
        signal.angle = MathUtils::uniformRandom(rng_, 0.0, TWO_PI);
        signal.recordPosition(now, true);

        signals.push_back(std::move(signal));
    }

    return ScanResult::success(std::move(signals));
}

} // namespace radarscope

/**
 * @file ScanCoordinator.cpp
 * @brief Scan coordinator implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/scanner/ScanCoordinator.hpp"
#include "radarscope/utils/BlockingQueue.hpp"
#include "radarscope/utils/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>

namespace radarscope {

namespace {

const char* const kLogComponent = "ScanCoordinator";

// Upper bound on one wait for the result queue, so cancellation is noticed
constexpr double kCollectSliceSeconds = 0.05;

}  // anonymous namespace

ScanCoordinator::ScanCoordinator(const ScanConfig& config, const IClock& clock)
    : config_(config),
      clock_(clock) {
}

ScanCoordinator::~ScanCoordinator() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (state_ == State::SCANNING) {
            activeContext_.cancel();
        }
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

bool ScanCoordinator::addScanner(std::shared_ptr<IScanner> scanner) {
    if (!scanner) {
        return false;
    }

    if (!scanner->isAvailable()) {
        RADARSCOPE_LOG_INFO(kLogComponent, scanErrorToString(ScanError::SCANNER_UNAVAILABLE)
                            << ": excluding '" << scanner->getName() << "'");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    RADARSCOPE_LOG_DEBUG(kLogComponent, "registered '" << scanner->getName() << "'");
    scanners_.push_back(std::move(scanner));
    return true;
}

ScanResult ScanCoordinator::scan(const ScanContext& ctx) {
    std::vector<Signal> signals;
    bool rateLimited = false;

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        // Rate limiting
        if (hasScanned_ &&
            secondsBetween(lastScanStartedAt_, clock_.now()) < config_.scanInterval) {
            rateLimited = true;
            signals = cachedSignals_;
        }
    }

    if (!rateLimited) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        // An aggregation may have completed since the shared section
        bool stillDue = !hasScanned_ ||
                        secondsBetween(lastScanStartedAt_, clock_.now()) >= config_.scanInterval;

        if (stillDue && state_ == State::IDLE && !scanners_.empty()) {
            // Previous worker already went idle; reap it before reuse
            if (worker_.joinable()) {
                worker_.join();
            }

            state_ = State::SCANNING;
            stats_.scansLaunched++;
            activeContext_ = ScanContext::withTimeout(ctx, config_.scanTimeout);
            worker_ = std::thread(&ScanCoordinator::performBackgroundScan, this,
                                  activeContext_, scanners_);
        }

        signals = cachedSignals_;
    }

    ScanResult result = ScanResult::success(std::move(signals));
    result.scannerName = getName();
    if (result.signals.empty()) {
        result.error = ScanError::AGGREGATE_EMPTY;
    }
    return result;
}

ScanResult ScanCoordinator::runScanner(IScanner& scanner, const ScanContext& ctx) {
    ScanResult result;

    try {
        result = scanner.scan(ctx);
    } catch (const std::exception& e) {
        result = ScanResult::failure(ScanError::SCAN_FAILED, e.what());
    } catch (...) {
        result = ScanResult::failure(ScanError::SCAN_FAILED, "unknown exception");
    }

    result.scannerName = scanner.getName();
    return result;
}

void ScanCoordinator::performBackgroundScan(ScanContext scanCtx,
                                            std::vector<std::shared_ptr<IScanner>> scanners) {
    auto startTime = std::chrono::steady_clock::now();

    // Channel and scanners are shared with the units so a unit that
    // outlives this aggregation still has somewhere to report
    auto channel = std::make_shared<BlockingQueue<ScanResult>>();

    for (const auto& scanner : scanners) {
        std::thread([scanner, channel, scanCtx]() {
            channel->push(runScanner(*scanner, scanCtx));
        }).detach();
    }

    // Collect results
    std::vector<Signal> allSignals;
    size_t received = 0;
    uint64_t failures = 0;

    while (received < scanners.size() && !scanCtx.isCancelled()) {
        auto slice = std::chrono::duration<double>(
            std::min(kCollectSliceSeconds, scanCtx.remainingSeconds()));

        ScanResult result;
        if (!channel->popFor(result, slice)) {
            continue;
        }
        received++;

        if (result.ok()) {
            allSignals.insert(allSignals.end(),
                              std::make_move_iterator(result.signals.begin()),
                              std::make_move_iterator(result.signals.end()));
        } else {
            failures++;
            RADARSCOPE_LOG_WARN(kLogComponent, "'" << result.scannerName << "' "
                                << scanErrorToString(result.error)
                                << (result.message.empty() ? "" : ": ") << result.message);
        }
    }

    // Scanners that have not reported are dropped for this cycle
    uint64_t timeouts = scanners.size() - received;
    if (timeouts > 0) {
        RADARSCOPE_LOG_WARN(kLogComponent, timeouts << " scanner(s) "
                            << scanErrorToString(ScanError::SCAN_TIMEOUT)
                            << " after " << config_.scanTimeout << "s");
    }

    // Limit total signals
    if (allSignals.size() > static_cast<size_t>(config_.maxSignals)) {
        allSignals.resize(static_cast<size_t>(config_.maxSignals));
    }

    auto elapsed = std::chrono::steady_clock::now() - startTime;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cachedSignals_ = std::move(allSignals);
        state_ = State::IDLE;
        hasScanned_ = true;
        lastScanStartedAt_ = clock_.now();

        stats_.scansCompleted++;
        stats_.scannerFailures += failures;
        stats_.scannerTimeouts += timeouts;
        stats_.lastSignalCount = cachedSignals_.size();
        stats_.lastScanDurationMs =
            std::chrono::duration<double, std::milli>(elapsed).count();

        RADARSCOPE_LOG_DEBUG(kLogComponent, "aggregated " << cachedSignals_.size()
                             << " signal(s) from " << received << "/" << scanners.size()
                             << " scanner(s) in " << stats_.lastScanDurationMs << "ms");
    }

    idleCv_.notify_all();
}

bool ScanCoordinator::isAvailable() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return !scanners_.empty();
}

std::vector<Signal> ScanCoordinator::getCachedSignals() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cachedSignals_;
}

std::vector<std::string> ScanCoordinator::getScannerNames() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(scanners_.size());
    for (const auto& scanner : scanners_) {
        names.push_back(scanner->getName());
    }
    return names;
}

ScanCoordinator::State ScanCoordinator::getState() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

bool ScanCoordinator::waitUntilIdle(double timeoutSeconds) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return idleCv_.wait_for(lock, std::chrono::duration<double>(timeoutSeconds),
                            [this] { return state_ == State::IDLE; });
}

ScanCoordinator::Statistics ScanCoordinator::getStatistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return stats_;
}

} // namespace radarscope

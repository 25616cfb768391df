/**
 * @file SimulatedScanner.hpp
 * @brief Synthetic scanner with configurable latency and failures
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_SCANNER_SIMULATEDSCANNER_HPP
#define RADARSCOPE_SCANNER_SIMULATEDSCANNER_HPP

#include "IScanner.hpp"
#include "../core/ScanConfig.hpp"
#include "../utils/Clock.hpp"
#include <atomic>
#include <mutex>
#include <random>

namespace radarscope {

/**
 * @brief Scanner producing synthetic detections
 *
 * Always available. Latency is spent in ScanContext::waitFor(), so a
 * cancelled or expired context ends the scan early with SCAN_TIMEOUT.
 */
class SimulatedScanner : public IScanner {
public:
    struct Options {
        std::string name = "Simulated Scanner";
        int signalCount = 3;                // Detections per scan
        double latencySeconds = 0.0;        // Artificial delay before answering
        Probability failureProbability = 0.0;
        uint32_t seed = 0;                  // 0 draws a seed from std::random_device
    };

    /**
     * @brief Construct with default options
     */
    explicit SimulatedScanner(const ScanConfig& config,
                              const IClock& clock = SystemClock::instance());

    SimulatedScanner(const ScanConfig& config, const Options& options,
                     const IClock& clock = SystemClock::instance());

    ScanResult scan(const ScanContext& ctx) override;

    std::string getName() const override { return options_.name; }

    bool isAvailable() const override { return true; }

    const Options& getOptions() const { return options_; }

    /**
     * @brief Number of scan() calls started so far
     */
    uint64_t getScanCount() const { return scanCount_.load(); }

private:
    ScanConfig config_;
    Options options_;
    const IClock& clock_;

    std::mt19937 rng_;
    std::mutex rngMutex_;

    std::atomic<uint64_t> scanCount_{0};
};

} // namespace radarscope

#endif // RADARSCOPE_SCANNER_SIMULATEDSCANNER_HPP

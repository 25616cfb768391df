/**
 * @file RadarConfig.hpp
 * @brief Complete radar configuration structure
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_CORE_RADARCONFIG_HPP
#define RADARSCOPE_CORE_RADARCONFIG_HPP

#include "Types.hpp"
#include "ScanConfig.hpp"
#include <cstdint>
#include <string>

namespace radarscope {

/**
 * @brief Complete radar configuration
 *
 * Sweep, signal lifecycle and data-acquisition settings consumed by the
 * engine. Keyboard controls adjust a few sweep fields at runtime through
 * the engine's setters.
 */
struct RadarConfig {
    // Sweep parameters
    struct SweepParams {
        double sweepSpeed = PI / 30;    // Radians advanced per tick
        double beamWidth = PI / 60;     // Illumination half-width (radians)
        double minSweepSpeed = PI / 120;
        double maxSweepSpeed = PI / 5;
        double refreshRate = 0.08;      // Seconds between ticks
    } sweep;

    // Signal lifecycle parameters
    struct SignalParams {
        double signalLifetime = 30.0;   // Seconds before a signal expires
        int maxPhase = 8;               // Animation phase modulus
        double minDistance = 1.0;       // Lower distance clamp
        double decayTime = 8.0;         // Seconds from illumination to zero persistence
        double visibilityThreshold = 0.1;
        double strengthJitterProbability = 0.1;
    } signals;

    // History / trail parameters
    struct HistoryParams {
        bool enableHistory = true;
        double historyUpdateRate = 0.5; // Seconds between drift + record passes
        int maxHistory = 20;            // Samples kept per signal
    } history;

    // Signal management parameters
    struct ManagementParams {
        double managementInterval = 2.0;    // Seconds between prune/merge passes
        double spawnProbability = 0.3;      // Chance of a new simulated signal per pass
        bool enableFiltering = true;        // Honour per-kind filters
        bool seedWithSimulated = true;      // Start with a simulated set when no real data
        uint32_t rngSeed = 0;               // 0 draws a seed from std::random_device
    } management;

    // Data acquisition
    ScanConfig scan;

    // Diagnostics
    std::string logLevel = "WARN";

    /**
     * @brief Default constructor
     */
    RadarConfig() = default;

    /**
     * @brief Persistence lost per second without illumination
     */
    double decayRate() const {
        return signals.decayTime > 0.0 ? 1.0 / signals.decayTime : 1.0;
    }

    /**
     * @brief Validate configuration
     */
    bool isValid() const {
        return scan.isValid() &&
               sweep.sweepSpeed > 0.0 &&
               sweep.beamWidth > 0.0 &&
               sweep.minSweepSpeed > 0.0 &&
               sweep.minSweepSpeed <= sweep.maxSweepSpeed &&
               signals.signalLifetime > 0.0 &&
               signals.maxPhase > 0 &&
               signals.minDistance >= 0.0 &&
               signals.minDistance < scan.maxScanRange &&
               signals.decayTime > 0.0 &&
               history.historyUpdateRate > 0.0 &&
               history.maxHistory > 0 &&
               management.managementInterval > 0.0 &&
               management.spawnProbability >= 0.0 &&
               management.spawnProbability <= 1.0;
    }

    /**
     * @brief Default preset: real data with simulated filler
     */
    static RadarConfig defaults() {
        return RadarConfig();
    }

    /**
     * @brief Preset with no host probing at all
     */
    static RadarConfig simulationOnly() {
        RadarConfig cfg;
        cfg.scan.useRealData = false;
        cfg.scan.enableConsent = false;
        cfg.scan.scanners.clear();
        return cfg;
    }

    /**
     * @brief Preset showing real detections only
     */
    static RadarConfig realDataOnly() {
        RadarConfig cfg;
        cfg.scan.useRealData = true;
        cfg.scan.useSimulatedFallback = false;
        cfg.management.spawnProbability = 0.0;
        cfg.management.seedWithSimulated = false;
        return cfg;
    }
};

} // namespace radarscope

#endif // RADARSCOPE_CORE_RADARCONFIG_HPP

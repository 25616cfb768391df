/**
 * @file ScanConfig.hpp
 * @brief Data-acquisition configuration
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_CORE_SCANCONFIG_HPP
#define RADARSCOPE_CORE_SCANCONFIG_HPP

#include "Types.hpp"
#include <string>
#include <vector>

namespace radarscope {

/**
 * @brief Configuration shared by scanners, coordinator and collector
 *
 * Treated as immutable once handed to a data-acquisition component;
 * each component keeps its own copy.
 */
struct ScanConfig {
    double scanInterval = 8.0;          // Minimum seconds between scans
    int maxSignals = 8;                 // Cap on aggregated signals
    double maxScanRange = 10.0;         // Maximum synthetic distance
    bool useRealData = true;            // Feed scanner output into the engine
    bool enableConsent = true;          // Consent prompt handled by the front end

    bool useSimulatedFallback = true;   // Serve placeholders when nothing is found
    double scanTimeout = 5.0;           // Hard bound on one aggregation (seconds)
    double collectTimeout = 1.0;        // Hard bound on one collection (seconds)

    // Scanners registered by the facade, see ScannerFactory
    std::vector<std::string> scanners = {"NETWORK_INTERFACE"};

    /**
     * @brief Validate configuration
     */
    bool isValid() const {
        return scanInterval >= 0.0 &&
               maxSignals > 0 &&
               maxScanRange > 0.0 &&
               scanTimeout > 0.0 &&
               collectTimeout > 0.0;
    }
};

} // namespace radarscope

#endif // RADARSCOPE_CORE_SCANCONFIG_HPP

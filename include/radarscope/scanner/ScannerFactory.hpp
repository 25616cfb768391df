/**
 * @file ScannerFactory.hpp
 * @brief Factory for creating built-in scanners
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_SCANNER_SCANNERFACTORY_HPP
#define RADARSCOPE_SCANNER_SCANNERFACTORY_HPP

#include "IScanner.hpp"
#include "../core/ScanConfig.hpp"
#include "../utils/Clock.hpp"
#include <memory>
#include <string>
#include <vector>

namespace radarscope {

/**
 * @brief Factory for creating scanner instances
 */
class ScannerFactory {
public:
    /**
     * @brief Create scanner by name
     *
     * @param scannerName Scanner name (SIMULATED, NETWORK_INTERFACE), case-insensitive
     * @param config Scan configuration handed to the scanner
     * @param clock Time source used to stamp detections
     * @throws std::invalid_argument for an unknown name
     */
    static std::shared_ptr<IScanner> create(const std::string& scannerName,
                                            const ScanConfig& config,
                                            const IClock& clock = SystemClock::instance());

    /**
     * @brief Create every scanner listed in config.scanners
     *
     * @throws std::invalid_argument for an unknown name
     */
    static std::vector<std::shared_ptr<IScanner>> createAll(const ScanConfig& config,
                                                            const IClock& clock = SystemClock::instance());

    /**
     * @brief Check if scanner name is valid
     */
    static bool isValidScanner(const std::string& scannerName);

    /**
     * @brief Get list of available scanners
     */
    static std::vector<std::string> getAvailableScanners();

private:
    ScannerFactory() = delete;  // Static factory, no instantiation
};

} // namespace radarscope

#endif // RADARSCOPE_SCANNER_SCANNERFACTORY_HPP

/**
 * @file ScannerFactory.cpp
 * @brief Scanner factory implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/scanner/ScannerFactory.hpp"
#include "radarscope/scanner/NetworkInterfaceScanner.hpp"
#include "radarscope/scanner/SimulatedScanner.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace radarscope {

namespace {

std::string toUpper(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

}  // anonymous namespace

std::shared_ptr<IScanner> ScannerFactory::create(const std::string& scannerName,
                                                 const ScanConfig& config,
                                                 const IClock& clock) {
    std::string name = toUpper(scannerName);

    if (name == "SIMULATED" || name == "SIMULATION") {
        return std::make_shared<SimulatedScanner>(config, clock);
    } else if (name == "NETWORK_INTERFACE" || name == "NETWORK") {
        return std::make_shared<NetworkInterfaceScanner>(config, clock);
    }

    throw std::invalid_argument("Unknown scanner: " + scannerName);
}

std::vector<std::shared_ptr<IScanner>> ScannerFactory::createAll(const ScanConfig& config,
                                                                 const IClock& clock) {
    std::vector<std::shared_ptr<IScanner>> scanners;
    scanners.reserve(config.scanners.size());
    for (const auto& name : config.scanners) {
        scanners.push_back(create(name, config, clock));
    }
    return scanners;
}

bool ScannerFactory::isValidScanner(const std::string& scannerName) {
    std::string name = toUpper(scannerName);

    return name == "SIMULATED" ||
           name == "SIMULATION" ||
           name == "NETWORK_INTERFACE" ||
           name == "NETWORK";
}

std::vector<std::string> ScannerFactory::getAvailableScanners() {
    return {"SIMULATED", "NETWORK_INTERFACE"};
}

} // namespace radarscope

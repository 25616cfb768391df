/**
 * @file JsonSaver.cpp
 * @brief JSON saver implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/config/JsonSaver.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace radarscope {

std::string JsonSaver::escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }

    return result;
}

std::string JsonSaver::indent(int level) {
    return std::string(static_cast<size_t>(level) * 2, ' ');
}

std::string JsonSaver::saveToString(const RadarConfig& config, bool pretty) {
    std::ostringstream ss;
    // Enough digits for angles such as pi/30 to load back unchanged
    ss << std::setprecision(12);

    std::string nl = pretty ? "\n" : "";
    std::string sp = pretty ? " " : "";
    auto ind = [&](int level) { return pretty ? indent(level) : ""; };
    auto boolStr = [](bool b) { return b ? "true" : "false"; };

    ss << "{" << nl;

    // Sweep
    ss << ind(1) << "\"sweep\":" << sp << "{" << nl;
    ss << ind(2) << "\"speed\":" << sp << config.sweep.sweepSpeed << "," << nl;
    ss << ind(2) << "\"beamWidth\":" << sp << config.sweep.beamWidth << "," << nl;
    ss << ind(2) << "\"minSpeed\":" << sp << config.sweep.minSweepSpeed << "," << nl;
    ss << ind(2) << "\"maxSpeed\":" << sp << config.sweep.maxSweepSpeed << "," << nl;
    ss << ind(2) << "\"refreshRate\":" << sp << config.sweep.refreshRate << nl;
    ss << ind(1) << "}," << nl;

    // Signal lifecycle
    ss << ind(1) << "\"signals\":" << sp << "{" << nl;
    ss << ind(2) << "\"lifetime\":" << sp << config.signals.signalLifetime << "," << nl;
    ss << ind(2) << "\"maxPhase\":" << sp << config.signals.maxPhase << "," << nl;
    ss << ind(2) << "\"minDistance\":" << sp << config.signals.minDistance << "," << nl;
    ss << ind(2) << "\"decayTime\":" << sp << config.signals.decayTime << "," << nl;
    ss << ind(2) << "\"visibilityThreshold\":" << sp << config.signals.visibilityThreshold << "," << nl;
    ss << ind(2) << "\"strengthJitterProbability\":" << sp
       << config.signals.strengthJitterProbability << nl;
    ss << ind(1) << "}," << nl;

    // History
    ss << ind(1) << "\"history\":" << sp << "{" << nl;
    ss << ind(2) << "\"enabled\":" << sp << boolStr(config.history.enableHistory) << "," << nl;
    ss << ind(2) << "\"updateRate\":" << sp << config.history.historyUpdateRate << "," << nl;
    ss << ind(2) << "\"maxHistory\":" << sp << config.history.maxHistory << nl;
    ss << ind(1) << "}," << nl;

    // Management
    ss << ind(1) << "\"management\":" << sp << "{" << nl;
    ss << ind(2) << "\"interval\":" << sp << config.management.managementInterval << "," << nl;
    ss << ind(2) << "\"spawnProbability\":" << sp << config.management.spawnProbability << "," << nl;
    ss << ind(2) << "\"enableFiltering\":" << sp << boolStr(config.management.enableFiltering) << "," << nl;
    ss << ind(2) << "\"seedWithSimulated\":" << sp << boolStr(config.management.seedWithSimulated) << "," << nl;
    ss << ind(2) << "\"rngSeed\":" << sp << config.management.rngSeed << nl;
    ss << ind(1) << "}," << nl;

    // Data acquisition
    const ScanConfig& scan = config.scan;
    ss << ind(1) << "\"scan\":" << sp << "{" << nl;
    ss << ind(2) << "\"interval\":" << sp << scan.scanInterval << "," << nl;
    ss << ind(2) << "\"maxSignals\":" << sp << scan.maxSignals << "," << nl;
    ss << ind(2) << "\"maxRange\":" << sp << scan.maxScanRange << "," << nl;
    ss << ind(2) << "\"useRealData\":" << sp << boolStr(scan.useRealData) << "," << nl;
    ss << ind(2) << "\"enableConsent\":" << sp << boolStr(scan.enableConsent) << "," << nl;
    ss << ind(2) << "\"useSimulatedFallback\":" << sp << boolStr(scan.useSimulatedFallback) << "," << nl;
    ss << ind(2) << "\"scanTimeout\":" << sp << scan.scanTimeout << "," << nl;
    ss << ind(2) << "\"collectTimeout\":" << sp << scan.collectTimeout << "," << nl;
    ss << ind(2) << "\"scanners\":" << sp << "[";
    for (size_t i = 0; i < scan.scanners.size(); ++i) {
        if (i > 0) ss << "," << sp;
        ss << "\"" << escapeString(scan.scanners[i]) << "\"";
    }
    ss << "]" << nl;
    ss << ind(1) << "}," << nl;

    ss << ind(1) << "\"logLevel\":" << sp << "\"" << escapeString(config.logLevel) << "\"" << nl;

    ss << "}";

    return ss.str();
}

void JsonSaver::saveToFile(const RadarConfig& config, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << saveToString(config, true);

    if (!file.good()) {
        throw std::runtime_error("Error writing to file: " + filepath);
    }
}

} // namespace radarscope

/**
 * @file SignalGenerator.cpp
 * @brief Signal generator implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/engine/SignalGenerator.hpp"
#include "radarscope/utils/MathUtils.hpp"

namespace radarscope {

namespace {

constexpr double kMinSpawnDistance = 2.0;
constexpr double kMaxSpawnDistance = 6.0;
constexpr int kMinSpawnStrength = 50;
constexpr int kMaxSpawnStrength = 100;
constexpr int kInitialPhases = 4;

// Kinds at or beyond this index are optional in the initial set
constexpr size_t kAlwaysPresentKinds = 4;
constexpr Probability kOptionalKindProbability = 0.7;

}  // anonymous namespace

SignalGenerator::SignalGenerator(const RadarConfig& config)
    : maxHistory_(static_cast<size_t>(std::max(1, config.history.maxHistory))),
      minDistance_(config.signals.minDistance),
      maxRange_(config.scan.maxScanRange) {
}

const std::vector<SignalKind>& SignalGenerator::getSimulatedKinds() {
    static const std::vector<SignalKind> kinds = {
        SignalKind::WIFI,
        SignalKind::BLUETOOTH,
        SignalKind::CELLULAR,
        SignalKind::RADIO,
        SignalKind::IOT,
        SignalKind::SATELLITE
    };
    return kinds;
}

const std::vector<std::string>& SignalGenerator::getNamesForKind(SignalKind kind) {
    static const std::vector<std::string> wifi = {
        "MyWiFi_5G", "NETGEAR_2.4G", "Linksys_AC", "TP-Link_Guest"};
    static const std::vector<std::string> bluetooth = {
        "iPhone-12", "AirPods-Pro", "MacBook", "Xbox-Controller"};
    static const std::vector<std::string> cellular = {
        "Verizon-LTE", "AT&T-5G", "T-Mobile", "Cell-Tower-1"};
    static const std::vector<std::string> radio = {
        "FM-101.5", "AM-680", "HAM-Radio", "Emergency-Freq"};
    static const std::vector<std::string> iot = {
        "Smart-TV", "Nest-Cam", "Ring-Door", "Alexa-Echo"};
    static const std::vector<std::string> satellite = {
        "GPS-III", "Starlink", "ISS", "Weather-Sat"};
    static const std::vector<std::string> network = {
        "Network-Activity"};

    switch (kind) {
        case SignalKind::WIFI: return wifi;
        case SignalKind::BLUETOOTH: return bluetooth;
        case SignalKind::CELLULAR: return cellular;
        case SignalKind::RADIO: return radio;
        case SignalKind::IOT: return iot;
        case SignalKind::SATELLITE: return satellite;
        default: return network;
    }
}

Signal SignalGenerator::makeSignal(std::mt19937& rng, SignalKind kind,
                                   const std::string& name, int phase,
                                   Timestamp now) const {
    Signal signal(kind, name, now, maxHistory_);
    signal.origin = SignalOrigin::SIMULATED;
    signal.distance = MathUtils::uniformRandom(rng, kMinSpawnDistance, kMaxSpawnDistance);
    signal.angle = MathUtils::uniformRandom(rng, 0.0, TWO_PI);
    signal.strength = MathUtils::uniformInt(rng, kMinSpawnStrength, kMaxSpawnStrength);
    signal.phase = phase;
    signal.constrain(minDistance_, maxRange_);

    signal.recordPosition(now, true);
    return signal;
}

std::vector<Signal> SignalGenerator::generateInitialSignals(std::mt19937& rng,
                                                            Timestamp now) const {
    const auto& kinds = getSimulatedKinds();

    std::vector<Signal> signals;
    signals.reserve(kinds.size());

    for (size_t i = 0; i < kinds.size(); ++i) {
        if (i >= kAlwaysPresentKinds && !MathUtils::chance(rng, kOptionalKindProbability)) {
            continue;
        }

        const auto& names = getNamesForKind(kinds[i]);
        const std::string& name =
            names[static_cast<size_t>(MathUtils::uniformInt(rng, 0, static_cast<int>(names.size()) - 1))];
        int phase = MathUtils::uniformInt(rng, 0, kInitialPhases - 1);

        signals.push_back(makeSignal(rng, kinds[i], name, phase, now));
    }

    return signals;
}

Signal SignalGenerator::generateRandomSignal(std::mt19937& rng, Timestamp now) const {
    const auto& kinds = getSimulatedKinds();
    SignalKind kind = kinds[static_cast<size_t>(
        MathUtils::uniformInt(rng, 0, static_cast<int>(kinds.size()) - 1))];

    return makeSignal(rng, kind, "SIM-" + signalKindToString(kind), 0, now);
}

} // namespace radarscope

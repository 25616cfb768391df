/**
 * @file Signal.cpp
 * @brief Signal decay and movement implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/core/Signal.hpp"
#include "radarscope/utils/MathUtils.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace radarscope {

namespace {

// Movement profile per kind
struct DriftProfile {
    Probability moveProbability;
    double distanceSpan;    // Full width of the uniform distance delta
    double angleSpan;       // Full width of the uniform angle delta
    double orbitalStep;     // Deterministic angle advance when moving
};

DriftProfile driftProfileFor(SignalKind kind) {
    switch (kind) {
        case SignalKind::BLUETOOTH:
            return {0.15, 0.5, 0.2, 0.0};
        case SignalKind::CELLULAR:
            return {0.25, 0.8, 0.3, 0.0};
        case SignalKind::SATELLITE:
            return {0.20, 0.3, 0.0, 0.05};
        case SignalKind::WIFI:
        case SignalKind::RADIO:
        case SignalKind::IOT:
        default:
            return {0.05, 0.2, 0.1, 0.0};
    }
}

}  // anonymous namespace

Signal::Signal(SignalKind k, const std::string& n, Timestamp now, size_t maxHistory)
    : kind(k),
      icon(kindIcon(k)),
      name(n),
      createdAt(now),
      lastIlluminatedAt(now),
      persistence(1.0),
      history(maxHistory) {
}

void Signal::decay(Timestamp now, double decayRate) {
    double elapsed = secondsSinceIlluminated(now);
    persistence = MathUtils::clamp(1.0 - elapsed * decayRate, 0.0, 1.0);
}

void Signal::drift(std::mt19937& rng, double minDistance, double maxRange) {
    const DriftProfile profile = driftProfileFor(kind);

    if (MathUtils::chance(rng, profile.moveProbability)) {
        distance += (MathUtils::uniformRandom(rng, 0.0, 1.0) - 0.5) * profile.distanceSpan;

        if (profile.orbitalStep > 0.0) {
            angle += profile.orbitalStep;
        } else {
            angle += (MathUtils::uniformRandom(rng, 0.0, 1.0) - 0.5) * profile.angleSpan;
        }
    }

    constrain(minDistance, maxRange);
}

void Signal::constrain(double minDistance, double maxRange) {
    distance = MathUtils::clamp(distance, minDistance, std::max(minDistance, maxRange));
    angle = MathUtils::normalizeAnglePositive(angle);
}

void Signal::setStrength(int value) {
    strength = MathUtils::clamp(value, 0, 100);
}

void Signal::jitterStrength(std::mt19937& rng) {
    strength = MathUtils::clamp(strength + MathUtils::uniformInt(rng, -10, 10), 10, 100);
}

bool Signal::isIlluminatedBy(double sweepAngle, double beamWidth) const {
    return MathUtils::angularDistance(angle, sweepAngle) < beamWidth;
}

std::string Signal::getSummary() const {
    std::ostringstream ss;
    ss << "Signal " << id
       << " [" << signalKindToString(kind) << "/" << signalOriginToString(origin) << "]"
       << " '" << name << "'"
       << " str=" << strength
       << std::fixed << std::setprecision(2)
       << " dist=" << distance
       << " ang=" << MathUtils::radToDeg(angle) << "deg"
       << " pers=" << static_cast<int>(persistence * 100) << "%"
       << " hist=" << history.size();
    return ss.str();
}

} // namespace radarscope

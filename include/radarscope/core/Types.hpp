/**
 * @file Types.hpp
 * @brief Core type definitions for Radarscope
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_CORE_TYPES_HPP
#define RADARSCOPE_CORE_TYPES_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>
#include <limits>
#include <cmath>

namespace radarscope {

// Forward declarations
struct Signal;
struct PositionSample;
struct ScanConfig;
struct RadarConfig;

// Type aliases for clarity
using SignalId = int;
using Timestamp = uint64_t;     // Microseconds
using Probability = double;

// Constants
constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double US_PER_SECOND = 1e6;

// Signal category enumeration
enum class SignalKind {
    WIFI,
    BLUETOOTH,
    CELLULAR,
    RADIO,
    IOT,
    SATELLITE,
    NETWORK
};

// Where a signal came from
enum class SignalOrigin {
    REAL,           // Produced by a scanner probing the host
    SIMULATED,      // Synthesized by the signal generator
    FALLBACK        // Placeholder served when real data is unavailable
};

constexpr SignalKind ALL_SIGNAL_KINDS[] = {
    SignalKind::WIFI,
    SignalKind::BLUETOOTH,
    SignalKind::CELLULAR,
    SignalKind::RADIO,
    SignalKind::IOT,
    SignalKind::SATELLITE,
    SignalKind::NETWORK
};

constexpr size_t NUM_SIGNAL_KINDS = sizeof(ALL_SIGNAL_KINDS) / sizeof(ALL_SIGNAL_KINDS[0]);

// Helper functions for enum conversions
inline std::string signalKindToString(SignalKind kind) {
    switch (kind) {
        case SignalKind::WIFI: return "WiFi";
        case SignalKind::BLUETOOTH: return "Bluetooth";
        case SignalKind::CELLULAR: return "Cellular";
        case SignalKind::RADIO: return "Radio";
        case SignalKind::IOT: return "IoT";
        case SignalKind::SATELLITE: return "Satellite";
        default: return "Network";
    }
}

inline SignalKind stringToSignalKind(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "WIFI") return SignalKind::WIFI;
    if (s == "BLUETOOTH") return SignalKind::BLUETOOTH;
    if (s == "CELLULAR") return SignalKind::CELLULAR;
    if (s == "RADIO") return SignalKind::RADIO;
    if (s == "IOT") return SignalKind::IOT;
    if (s == "SATELLITE") return SignalKind::SATELLITE;
    return SignalKind::NETWORK;
}

inline size_t signalKindIndex(SignalKind kind) {
    return static_cast<size_t>(kind);
}

inline std::string signalOriginToString(SignalOrigin origin) {
    switch (origin) {
        case SignalOrigin::REAL: return "REAL";
        case SignalOrigin::FALLBACK: return "FALLBACK";
        default: return "SIMULATED";
    }
}

// Default presentation icon per kind; opaque to the core
inline std::string kindIcon(SignalKind kind) {
    switch (kind) {
        case SignalKind::WIFI: return "≋";
        case SignalKind::BLUETOOTH: return "β";
        case SignalKind::CELLULAR: return "▲";
        case SignalKind::RADIO: return "◈";
        case SignalKind::IOT: return "◇";
        case SignalKind::SATELLITE: return "★";
        default: return "⇅";
    }
}

// Time helpers
inline double toSeconds(Timestamp us) {
    return static_cast<double>(us) / US_PER_SECOND;
}

inline Timestamp fromSeconds(double seconds) {
    return seconds <= 0.0 ? 0 : static_cast<Timestamp>(seconds * US_PER_SECOND);
}

// Elapsed seconds between two timestamps; never negative
inline double secondsBetween(Timestamp from, Timestamp to) {
    return (to > from) ? (to - from) / US_PER_SECOND : 0.0;
}

// Utility function to check if value is valid
inline bool isValid(double value) {
    return !std::isnan(value) && !std::isinf(value);
}

} // namespace radarscope

#endif // RADARSCOPE_CORE_TYPES_HPP

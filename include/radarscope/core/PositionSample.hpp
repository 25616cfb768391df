/**
 * @file PositionSample.hpp
 * @brief Recorded signal position for movement trails
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_CORE_POSITIONSAMPLE_HPP
#define RADARSCOPE_CORE_POSITIONSAMPLE_HPP

#include "Types.hpp"

namespace radarscope {

/**
 * @brief One point of a signal's position history
 *
 * Samples are never modified after being recorded.
 */
struct PositionSample {
    double distance = 0.0;          // Synthetic radial units
    double angle = 0.0;             // Radians [0, 2*pi)
    int strength = 0;               // 0-100
    Timestamp timestamp = 0;        // Microseconds
    bool wasIlluminated = false;    // Sweep overlapped the signal when recorded

    PositionSample() = default;

    PositionSample(double d, double a, int s, Timestamp t, bool illuminated)
        : distance(d), angle(a), strength(s), timestamp(t), wasIlluminated(illuminated) {}
};

} // namespace radarscope

#endif // RADARSCOPE_CORE_POSITIONSAMPLE_HPP

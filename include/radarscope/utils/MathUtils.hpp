/**
 * @file MathUtils.hpp
 * @brief Mathematical utility functions for the radar sweep
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_UTILS_MATHUTILS_HPP
#define RADARSCOPE_UTILS_MATHUTILS_HPP

#include "../core/Types.hpp"
#include <cmath>
#include <random>
#include <algorithm>

namespace radarscope {

/**
 * @brief Utility class for mathematical operations
 */
class MathUtils {
public:
    /**
     * @brief Normalize angle to [-pi, pi]
     */
    static double normalizeAngle(double angle) {
        if (!isValid(angle)) return 0.0;
        angle = std::fmod(angle, TWO_PI);
        if (angle > PI) angle -= TWO_PI;
        if (angle < -PI) angle += TWO_PI;
        return angle;
    }

    /**
     * @brief Normalize angle to [0, 2*pi)
     */
    static double normalizeAnglePositive(double angle) {
        if (!isValid(angle)) return 0.0;
        angle = std::fmod(angle, TWO_PI);
        if (angle < 0) angle += TWO_PI;
        // fmod of a tiny negative value can round up to exactly 2*pi
        if (angle >= TWO_PI) angle = 0.0;
        return angle;
    }

    /**
     * @brief Shorter-arc distance between two angles, in [0, pi]
     */
    static double angularDistance(double a1, double a2) {
        double delta = std::fabs(normalizeAnglePositive(a1) - normalizeAnglePositive(a2));
        return std::min(delta, TWO_PI - delta);
    }

    /**
     * @brief Convert degrees to radians
     */
    static double degToRad(double deg) {
        return deg * DEG_TO_RAD;
    }

    /**
     * @brief Convert radians to degrees
     */
    static double radToDeg(double rad) {
        return rad * RAD_TO_DEG;
    }

    /**
     * @brief Clamp value to range
     */
    static double clamp(double value, double minVal, double maxVal) {
        return std::max(minVal, std::min(maxVal, value));
    }

    static int clamp(int value, int minVal, int maxVal) {
        return std::max(minVal, std::min(maxVal, value));
    }

    /**
     * @brief Map an RSSI reading (dBm) onto the 0-100 strength scale
     */
    static int rssiToStrength(int rssiDbm) {
        return clamp((rssiDbm + 100) * 2, 0, 100);
    }

    /**
     * @brief Rough synthetic distance for an RSSI reading
     *
     * -30 dBm maps to 10 units, every further 20 dB multiplies by ten.
     */
    static double rssiToDistance(int rssiDbm, double maxRange) {
        double distance = std::pow(10.0, static_cast<double>(-rssiDbm - 30) / 20.0) * 10.0;
        return std::min(distance, maxRange);
    }

    /**
     * @brief Uniform random number in [min, max)
     */
    static double uniformRandom(std::mt19937& rng, double minVal, double maxVal) {
        std::uniform_real_distribution<double> dist(minVal, maxVal);
        return dist(rng);
    }

    /**
     * @brief Uniform random integer in [min, max]
     */
    static int uniformInt(std::mt19937& rng, int minVal, int maxVal) {
        std::uniform_int_distribution<int> dist(minVal, maxVal);
        return dist(rng);
    }

    /**
     * @brief Bernoulli trial with given success probability
     */
    static bool chance(std::mt19937& rng, Probability p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return uniformRandom(rng, 0.0, 1.0) < p;
    }
};

} // namespace radarscope

#endif // RADARSCOPE_UTILS_MATHUTILS_HPP

/**
 * @file Signal.hpp
 * @brief Signal structure for detected and simulated emitters
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_CORE_SIGNAL_HPP
#define RADARSCOPE_CORE_SIGNAL_HPP

#include "Types.hpp"
#include "PositionSample.hpp"
#include "../utils/RingBuffer.hpp"
#include <random>
#include <string>

namespace radarscope {

constexpr size_t DEFAULT_MAX_HISTORY = 20;
constexpr double DEFAULT_DECAY_RATE = 1.0 / 8.0;     // Full fade over 8 seconds
constexpr double VISIBILITY_THRESHOLD = 0.1;

/**
 * @brief Represents one emitter on the radar
 *
 * Holds the presentation fields handed to the renderer together with the
 * persistence and history state mutated by the engine on every tick.
 * Once inside the engine a signal is touched only by the tick thread.
 */
struct Signal {
    // Stable handle, assigned by the engine on insertion
    SignalId id = -1;

    SignalKind kind = SignalKind::NETWORK;
    SignalOrigin origin = SignalOrigin::SIMULATED;

    // Presentation only
    std::string icon;
    std::string name;

    int strength = 0;                   // 0-100
    double distance = 0.0;              // [minDistance, maxScanRange]
    double angle = 0.0;                 // Radians [0, 2*pi)
    int phase = 0;                      // [0, maxPhase)

    // Timestamps
    Timestamp createdAt = 0;            // Fixed once inside the engine
    Timestamp lastIlluminatedAt = 0;    // Last sweep contact

    double persistence = 1.0;           // Freshness [0, 1]

    // Movement trail, oldest first
    RingBuffer<PositionSample> history{DEFAULT_MAX_HISTORY};

    /**
     * @brief Default constructor
     */
    Signal() = default;

    /**
     * @brief Construct a freshly seen signal
     *
     * The signal starts fully illuminated at @p now with an empty history
     * of capacity @p maxHistory.
     */
    Signal(SignalKind kind, const std::string& name, Timestamp now,
           size_t maxHistory = DEFAULT_MAX_HISTORY);

    /**
     * @brief Sweep contact: full persistence as of @p now
     */
    void illuminate(Timestamp now) {
        lastIlluminatedAt = now;
        persistence = 1.0;
    }

    /**
     * @brief Linear fade from the last sweep contact
     *
     * persistence = max(0, 1 - secondsSinceContact * decayRate)
     */
    void decay(Timestamp now, double decayRate = DEFAULT_DECAY_RATE);

    /**
     * @brief Append the current position to the history trail
     */
    void recordPosition(Timestamp now, bool wasIlluminated) {
        history.push(PositionSample(distance, angle, strength, now, wasIlluminated));
    }

    /**
     * @brief Per-kind stochastic movement
     *
     * Stationary kinds rarely move, mobile kinds move more often and
     * further, satellites advance along their orbit. Position is
     * re-constrained afterwards.
     */
    void drift(std::mt19937& rng, double minDistance, double maxRange);

    /**
     * @brief Clamp distance and normalize angle
     */
    void constrain(double minDistance, double maxRange);

    /**
     * @brief Set strength clamped to [0, 100]
     */
    void setStrength(int value);

    /**
     * @brief Random +/-10 strength change clamped to [10, 100]
     */
    void jitterStrength(std::mt19937& rng);

    /**
     * @brief Advance the animation phase
     */
    void advancePhase(int maxPhase) {
        phase = (maxPhase > 0) ? (phase + 1) % maxPhase : 0;
    }

    /**
     * @brief True when the sweep at @p sweepAngle overlaps this signal
     */
    bool isIlluminatedBy(double sweepAngle, double beamWidth) const;

    /**
     * @brief Check if signal should be drawn
     */
    bool isVisible(double threshold = VISIBILITY_THRESHOLD) const {
        return persistence > threshold;
    }

    double ageSeconds(Timestamp now) const {
        return secondsBetween(createdAt, now);
    }

    double secondsSinceIlluminated(Timestamp now) const {
        return secondsBetween(lastIlluminatedAt, now);
    }

    /**
     * @brief Get signal summary string (for debugging)
     */
    std::string getSummary() const;
};

} // namespace radarscope

#endif // RADARSCOPE_CORE_SIGNAL_HPP

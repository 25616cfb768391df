/**
 * @file SignalGenerator.hpp
 * @brief Synthetic signal source for simulation mode
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_ENGINE_SIGNALGENERATOR_HPP
#define RADARSCOPE_ENGINE_SIGNALGENERATOR_HPP

#include "../core/RadarConfig.hpp"
#include "../core/Signal.hpp"
#include <random>
#include <string>
#include <vector>

namespace radarscope {

/**
 * @brief Produces simulated signals
 *
 * Generated signals are placed 2-6 units out with strength 50-100, start
 * fully illuminated and carry one history sample. Randomness comes from
 * the caller's generator so a seeded engine stays reproducible.
 */
class SignalGenerator {
public:
    explicit SignalGenerator(const RadarConfig& config);

    /**
     * @brief Initial simulated population
     *
     * WiFi, Bluetooth, Cellular and Radio are always present; IoT and
     * Satellite each appear with 70% probability.
     */
    std::vector<Signal> generateInitialSignals(std::mt19937& rng, Timestamp now) const;

    /**
     * @brief One simulated signal of a random kind, named "SIM-<Kind>"
     */
    Signal generateRandomSignal(std::mt19937& rng, Timestamp now) const;

    /**
     * @brief Names used for simulated signals of @p kind
     */
    static const std::vector<std::string>& getNamesForKind(SignalKind kind);

    /**
     * @brief Kinds the generator draws from (every kind except NETWORK)
     */
    static const std::vector<SignalKind>& getSimulatedKinds();

private:
    Signal makeSignal(std::mt19937& rng, SignalKind kind, const std::string& name,
                      int phase, Timestamp now) const;

    size_t maxHistory_;
    double minDistance_;
    double maxRange_;
};

} // namespace radarscope

#endif // RADARSCOPE_ENGINE_SIGNALGENERATOR_HPP

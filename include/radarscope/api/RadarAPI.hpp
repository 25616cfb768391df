/**
 * @file RadarAPI.hpp
 * @brief Public API for embedding the radar in a front end
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_API_RADARAPI_HPP
#define RADARSCOPE_API_RADARAPI_HPP

#include "../core/RadarConfig.hpp"
#include "../core/Signal.hpp"
#include "../scanner/IScanner.hpp"
#include "../utils/Clock.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace radarscope {

/**
 * @brief Facade wiring scanners, coordinator, collector and engine
 *
 * A terminal or GUI front end drives tick() at getRefreshRate() and draws
 * what the getters return. Keyboard controls map onto the control
 * methods one to one.
 *
 * Thread-safety: All public methods are thread-safe.
 * Memory: Everything is returned by value; no shared mutable state with
 * client code.
 */
class RadarAPI {
public:
    /**
     * @brief Default constructor (uninitialized)
     */
    RadarAPI();

    /**
     * @brief Construct and initialize with configuration
     */
    explicit RadarAPI(const RadarConfig& config);

    /**
     * @brief Construct and initialize with an explicit time source
     *
     * @param clock Must outlive the API
     */
    RadarAPI(const RadarConfig& config, const IClock& clock);

    /**
     * @brief Destructor
     */
    ~RadarAPI();

    // Non-copyable
    RadarAPI(const RadarAPI&) = delete;
    RadarAPI& operator=(const RadarAPI&) = delete;

    // Movable
    RadarAPI(RadarAPI&&) noexcept;
    RadarAPI& operator=(RadarAPI&&) noexcept;

    /**
     * @brief Initialize or reinitialize the radar
     *
     * Scanners named in config.scan.scanners are created and registered
     * with the coordinator together with @p extraScanners. Scanners whose
     * availability probe fails are left out.
     *
     * @return true if successful
     */
    bool initialize(const RadarConfig& config,
                    const std::vector<std::shared_ptr<IScanner>>& extraScanners = {});

    /**
     * @brief Check if radar is initialized
     */
    bool isInitialized() const;

    /**
     * @brief Advance one frame (main entry point)
     */
    void tick();

    /**
     * @brief Seconds the front end should wait between ticks
     */
    double getRefreshRate() const;

    // Render boundary

    std::vector<Signal> getSignals() const;
    std::vector<Signal> getVisibleSignals() const;
    int getVisibleSignalCount() const;
    std::map<SignalKind, size_t> getSignalCountsByKind() const;
    double getSweepAngle() const;
    double getSweepSpeed() const;

    /**
     * @brief Get the selected signal
     *
     * @param signal Output signal
     * @return true if a signal is selected
     */
    bool getSelectedSignal(Signal& signal) const;

    /**
     * @brief Names of the scanners that passed their availability probe
     */
    std::vector<std::string> getScannerNames() const;

    // Controls

    bool isPaused() const;
    void setPaused(bool paused);
    void togglePause();
    void increaseSpeed();
    void decreaseSpeed();
    void toggleKindFilter(SignalKind kind);
    void toggleAllFilters();
    bool isKindVisible(SignalKind kind) const;
    void selectNextSignal();
    void selectPreviousSignal();
    void clearSelection();
    bool isUsingRealData() const;
    void toggleDataMode();

    /**
     * @brief Fresh simulated set, sweep back to 0, unpaused
     */
    void reset();

    /**
     * @brief Get current configuration
     */
    RadarConfig getConfig() const;

    /**
     * @brief Update configuration
     *
     * This will reinitialize the radar.
     */
    bool setConfig(const RadarConfig& config);

    /**
     * @brief Statistics structure
     */
    struct Statistics {
        // Engine
        uint64_t ticks;
        uint64_t managementPasses;
        uint64_t signalsSpawned;
        uint64_t signalsMerged;
        uint64_t signalsExpired;
        double lastTickDurationMs;
        int numSignals;
        int numVisibleSignals;

        // Coordinator
        uint64_t scansLaunched;
        uint64_t scansCompleted;
        uint64_t scannerFailures;
        uint64_t scannerTimeouts;

        // Collector
        uint64_t collections;
        uint64_t collectTimeouts;
        uint64_t fallbacks;
        std::string lastCollectOutcome;
    };

    /**
     * @brief Get processing statistics
     */
    Statistics getStatistics() const;

    /**
     * @brief Load configuration from JSON file
     *
     * @param filepath Path to JSON file
     * @return true if successful
     */
    bool loadConfigFromFile(const std::string& filepath);

    /**
     * @brief Save current configuration to JSON file
     *
     * @param filepath Path to JSON file
     * @return true if successful
     */
    bool saveConfigToFile(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON string
     *
     * @param jsonString JSON configuration string
     * @return true if successful
     */
    bool loadConfigFromString(const std::string& jsonString);

    /**
     * @brief Get current configuration as JSON string
     */
    std::string getConfigAsJson() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace radarscope

#endif // RADARSCOPE_API_RADARAPI_HPP

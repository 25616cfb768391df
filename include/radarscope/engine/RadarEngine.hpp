/**
 * @file RadarEngine.hpp
 * @brief Sweep engine driving the signal lifecycle
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_ENGINE_RADARENGINE_HPP
#define RADARSCOPE_ENGINE_RADARENGINE_HPP

#include "../core/RadarConfig.hpp"
#include "../core/Signal.hpp"
#include "../collector/RealDataCollector.hpp"
#include "../utils/Clock.hpp"
#include "SignalGenerator.hpp"
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

namespace radarscope {

/**
 * @brief Radar tick engine
 *
 * Per tick: History → Phase/Illumination/Decay → Sweep advance → Management
 *
 * The engine is the sole owner of the signal list. All public methods are
 * serialized by one mutex so a renderer on another thread always observes
 * a whole tick. Data-source failures never reach tick(); the collector
 * absorbs them.
 */
class RadarEngine {
public:
    /**
     * @brief Construct engine and its initial signal population
     *
     * When real data is enabled the collector is asked once; if that
     * yields nothing and seeding is enabled a simulated set is generated.
     *
     * @param config Radar configuration
     * @param collector Real data feed; may be null for pure simulation
     * @param clock Time source; must outlive the engine
     */
    RadarEngine(const RadarConfig& config,
                std::shared_ptr<RealDataCollector> collector,
                const IClock& clock = SystemClock::instance());

    /**
     * @brief Default destructor
     */
    ~RadarEngine() = default;

    // Non-copyable, non-movable
    RadarEngine(const RadarEngine&) = delete;
    RadarEngine& operator=(const RadarEngine&) = delete;
    RadarEngine(RadarEngine&&) = delete;
    RadarEngine& operator=(RadarEngine&&) = delete;

    /**
     * @brief Advance the radar by one frame
     *
     * No-op while paused. May wait up to the collect timeout on a
     * management tick when real data is enabled.
     */
    void tick();

    // Render boundary

    /**
     * @brief Copy of every signal, including faded ones
     */
    std::vector<Signal> getSignals() const;

    /**
     * @brief Signals above the visibility threshold that pass the filters
     */
    std::vector<Signal> getVisibleSignals() const;

    size_t getNumSignals() const;

    size_t getVisibleSignalCount() const;

    /**
     * @brief Visible signal count per kind (every kind present as a key)
     */
    std::map<SignalKind, size_t> getSignalCountsByKind() const;

    double getSweepAngle() const;

    double getSweepSpeed() const;

    // Controls

    bool isPaused() const;
    void setPaused(bool paused);
    void togglePause();

    /**
     * @brief Sweep speed x1.2, capped at maxSweepSpeed
     */
    void increaseSpeed();

    /**
     * @brief Sweep speed /1.2, floored at minSweepSpeed
     */
    void decreaseSpeed();

    void toggleKindFilter(SignalKind kind);

    /**
     * @brief Show every kind if any is hidden, otherwise hide every kind
     */
    void toggleAllFilters();

    void setAllFiltersVisible(bool visible);
    bool isKindVisible(SignalKind kind) const;
    bool areAllFiltersVisible() const;

    /**
     * @brief Cycle forward through the visible signals
     *
     * Selection is kept by signal id so it survives pruning.
     */
    void selectNextSignal();
    void selectPreviousSignal();
    void clearSelection();

    /**
     * @brief Copy of the selected signal, if it still exists
     */
    std::optional<Signal> getSelectedSignal() const;

    /**
     * @brief Index of the selected signal in getSignals(), or -1
     */
    int getSelectedSignalIndex() const;

    SignalId getSelectedSignalId() const;

    bool isUsingRealData() const;

    /**
     * @brief Switch between real and simulated data
     *
     * Entering real mode replaces the list with collected signals if there
     * are any; entering simulated mode replaces it with a fresh simulated set.
     */
    void toggleDataMode();

    /**
     * @brief Fresh simulated set, sweep back to 0, default speed, unpaused
     */
    void reset();

    /**
     * @brief Insert a signal, assigning its id
     *
     * @return Id of the inserted signal
     */
    SignalId addSignal(Signal signal);

    /**
     * @brief Remove every signal
     */
    void clearSignals();

    /**
     * @brief Get current configuration
     */
    const RadarConfig& getConfig() const { return config_; }

    /**
     * @brief Get processing statistics
     */
    struct Statistics {
        uint64_t ticks = 0;
        uint64_t managementPasses = 0;
        uint64_t historyPasses = 0;
        uint64_t signalsSpawned = 0;
        uint64_t signalsMerged = 0;
        uint64_t signalsRefreshed = 0;
        uint64_t signalsExpired = 0;
        double lastTickDurationMs = 0.0;
        Timestamp lastTimestamp = 0;
    };

    Statistics getStatistics() const;

private:
    /**
     * @brief Drift every signal and record its position
     */
    void updateSignalHistory(Timestamp now);

    /**
     * @brief Phase, illumination and decay against one sweep snapshot
     */
    void updatePersistence(double sweepAngle, Timestamp now);

    /**
     * @brief Prune, merge real data, maybe spawn a simulated signal
     */
    void manageSignals(Timestamp now);

    /**
     * @brief Remove expired and faded signals
     */
    void pruneSignals(Timestamp now);

    /**
     * @brief Merge collected signals, de-duplicating by kind and name
     */
    void mergeSignals(std::vector<Signal> incoming, Timestamp now);

    /**
     * @brief Replace the whole list with @p signals
     */
    void replaceSignals(std::vector<Signal> signals, Timestamp now);

    /**
     * @brief Drop the oldest entries beyond maxSignals
     */
    void trimToMaxSignals();

    /**
     * @brief Stamp and insert a signal entering the engine
     */
    SignalId insertSignal(Signal signal, Timestamp now);

    std::vector<Signal> generateInitialSignals(Timestamp now);

    bool passesFilter(const Signal& signal) const;
    bool isShown(const Signal& signal) const;
    std::vector<size_t> getVisibleSignalIndices() const;
    int indexOfId(SignalId id) const;

    RadarConfig config_;
    std::shared_ptr<RealDataCollector> collector_;
    const IClock& clock_;
    SignalGenerator generator_;
    std::mt19937 rng_;

    std::vector<Signal> signals_;
    SignalId nextSignalId_ = 1;

    // Sweep state
    double sweepAngle_ = 0.0;
    double sweepSpeed_;
    bool paused_ = false;
    bool useRealData_;

    // Filters, indexed by signalKindIndex()
    std::array<bool, NUM_SIGNAL_KINDS> kindVisible_;

    SignalId selectedId_ = -1;

    // Timing
    Timestamp lastHistoryUpdate_;
    Timestamp lastManagement_;

    // Statistics
    Statistics stats_;

    // Thread safety
    mutable std::mutex mutex_;
};

} // namespace radarscope

#endif // RADARSCOPE_ENGINE_RADARENGINE_HPP

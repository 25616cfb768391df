/**
 * @file RadarEngine.cpp
 * @brief Radar engine implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/engine/RadarEngine.hpp"
#include "radarscope/utils/Logger.hpp"
#include "radarscope/utils/MathUtils.hpp"
#include <algorithm>
#include <chrono>

namespace radarscope {

namespace {

const char* const kLogComponent = "RadarEngine";

constexpr double kSpeedStep = 1.2;

uint32_t resolveSeed(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device rd;
    return rd();
}

}  // anonymous namespace

RadarEngine::RadarEngine(const RadarConfig& config,
                         std::shared_ptr<RealDataCollector> collector,
                         const IClock& clock)
    : config_(config),
      collector_(std::move(collector)),
      clock_(clock),
      generator_(config),
      rng_(resolveSeed(config.management.rngSeed)),
      sweepSpeed_(config.sweep.sweepSpeed),
      useRealData_(config.scan.useRealData) {

    kindVisible_.fill(true);

    const Timestamp now = clock_.now();
    lastHistoryUpdate_ = now;
    lastManagement_ = now;

    // Initial population
    if (useRealData_ && collector_) {
        replaceSignals(collector_->collect(), now);
    }

    if (signals_.empty() && config_.management.seedWithSimulated) {
        replaceSignals(generateInitialSignals(now), now);
    }

    RADARSCOPE_LOG_INFO(kLogComponent, "started with " << signals_.size() << " signal(s), "
                        << (useRealData_ ? "real" : "simulated") << " data");
}

std::vector<Signal> RadarEngine::generateInitialSignals(Timestamp now) {
    return generator_.generateInitialSignals(rng_, now);
}

SignalId RadarEngine::insertSignal(Signal signal, Timestamp now) {
    signal.id = nextSignalId_++;

    // Lifetime counts from entry into the engine
    signal.createdAt = now;
    signal.illuminate(now);
    signal.constrain(config_.signals.minDistance, config_.scan.maxScanRange);

    size_t capacity = static_cast<size_t>(config_.history.maxHistory);
    if (signal.history.capacity() != capacity) {
        RingBuffer<PositionSample> resized(capacity);
        for (const auto& sample : signal.history.toVector()) {
            resized.push(sample);
        }
        signal.history = std::move(resized);
    }

    signals_.push_back(std::move(signal));
    return signals_.back().id;
}

void RadarEngine::replaceSignals(std::vector<Signal> signals, Timestamp now) {
    signals_.clear();
    selectedId_ = -1;
    for (auto& signal : signals) {
        insertSignal(std::move(signal), now);
    }
    trimToMaxSignals();
}

void RadarEngine::trimToMaxSignals() {
    // Keep the most recent entries
    size_t maxSignals = static_cast<size_t>(config_.scan.maxSignals);
    if (signals_.size() > maxSignals) {
        signals_.erase(signals_.begin(),
                       signals_.begin() + static_cast<std::ptrdiff_t>(signals_.size() - maxSignals));
    }
}

// Tick

void RadarEngine::updateSignalHistory(Timestamp now) {
    for (auto& signal : signals_) {
        signal.drift(rng_, config_.signals.minDistance, config_.scan.maxScanRange);

        bool swept = signal.isIlluminatedBy(sweepAngle_, config_.sweep.beamWidth);
        signal.recordPosition(now, swept);
    }
    stats_.historyPasses++;
}

void RadarEngine::updatePersistence(double sweepAngle, Timestamp now) {
    const double decayRate = config_.decayRate();

    for (auto& signal : signals_) {
        signal.advancePhase(config_.signals.maxPhase);

        if (signal.isIlluminatedBy(sweepAngle, config_.sweep.beamWidth)) {
            signal.illuminate(now);

            if (MathUtils::chance(rng_, config_.signals.strengthJitterProbability)) {
                signal.jitterStrength(rng_);
            }
        } else {
            signal.decay(now, decayRate);
        }
    }
}

void RadarEngine::pruneSignals(Timestamp now) {
    const double lifetime = config_.signals.signalLifetime;
    const double threshold = config_.signals.visibilityThreshold;

    size_t before = signals_.size();
    signals_.erase(
        std::remove_if(signals_.begin(), signals_.end(),
                       [&](const Signal& s) {
                           return s.ageSeconds(now) >= lifetime || !s.isVisible(threshold);
                       }),
        signals_.end());

    size_t removed = before - signals_.size();
    stats_.signalsExpired += removed;

    if (removed > 0) {
        RADARSCOPE_LOG_DEBUG(kLogComponent, "pruned " << removed << " signal(s)");
    }
}

void RadarEngine::mergeSignals(std::vector<Signal> incoming, Timestamp now) {
    for (auto& signal : incoming) {
        auto existing = std::find_if(signals_.begin(), signals_.end(),
                                     [&](const Signal& s) {
                                         return s.kind == signal.kind && s.name == signal.name;
                                     });

        if (existing != signals_.end()) {
            existing->setStrength(signal.strength);
            stats_.signalsRefreshed++;
        } else {
            insertSignal(std::move(signal), now);
            stats_.signalsMerged++;
        }
    }

    trimToMaxSignals();
}

void RadarEngine::manageSignals(Timestamp now) {
    pruneSignals(now);

    if (useRealData_ && collector_) {
        std::vector<Signal> collected = collector_->collect();
        if (!collected.empty()) {
            mergeSignals(std::move(collected), now);
        }
    }

    if (signals_.size() < static_cast<size_t>(config_.scan.maxSignals) &&
        MathUtils::chance(rng_, config_.management.spawnProbability)) {
        SignalId id = insertSignal(generator_.generateRandomSignal(rng_, now), now);
        stats_.signalsSpawned++;
        RADARSCOPE_LOG_DEBUG(kLogComponent, "spawned simulated signal " << id);
    }

    stats_.managementPasses++;
}

void RadarEngine::tick() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (paused_) {
        return;
    }

    auto startTime = std::chrono::steady_clock::now();
    const Timestamp now = clock_.now();

    // 1. History and movement
    if (config_.history.enableHistory &&
        secondsBetween(lastHistoryUpdate_, now) >= config_.history.historyUpdateRate) {
        updateSignalHistory(now);
        lastHistoryUpdate_ = now;
    }

    // 2. Phase, illumination and decay against a single sweep snapshot
    const double sweepAngle = sweepAngle_;
    updatePersistence(sweepAngle, now);

    // 3. Sweep advance
    sweepAngle_ = MathUtils::normalizeAnglePositive(sweepAngle + sweepSpeed_);

    // 4. Signal management
    if (secondsBetween(lastManagement_, now) >= config_.management.managementInterval) {
        manageSignals(now);
        lastManagement_ = now;
    }

    stats_.ticks++;
    stats_.lastTimestamp = now;

    auto endTime = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
    stats_.lastTickDurationMs = duration.count() / 1000.0;
}

// Render boundary

bool RadarEngine::passesFilter(const Signal& signal) const {
    if (!config_.management.enableFiltering) {
        return true;
    }
    return kindVisible_[signalKindIndex(signal.kind)];
}

bool RadarEngine::isShown(const Signal& signal) const {
    return signal.isVisible(config_.signals.visibilityThreshold) && passesFilter(signal);
}

std::vector<size_t> RadarEngine::getVisibleSignalIndices() const {
    std::vector<size_t> indices;
    for (size_t i = 0; i < signals_.size(); ++i) {
        if (isShown(signals_[i])) {
            indices.push_back(i);
        }
    }
    return indices;
}

int RadarEngine::indexOfId(SignalId id) const {
    if (id < 0) {
        return -1;
    }
    for (size_t i = 0; i < signals_.size(); ++i) {
        if (signals_[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<Signal> RadarEngine::getSignals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_;
}

std::vector<Signal> RadarEngine::getVisibleSignals() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Signal> visible;
    for (const auto& signal : signals_) {
        if (isShown(signal)) {
            visible.push_back(signal);
        }
    }
    return visible;
}

size_t RadarEngine::getNumSignals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_.size();
}

size_t RadarEngine::getVisibleSignalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getVisibleSignalIndices().size();
}

std::map<SignalKind, size_t> RadarEngine::getSignalCountsByKind() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<SignalKind, size_t> counts;
    for (SignalKind kind : ALL_SIGNAL_KINDS) {
        counts[kind] = 0;
    }
    for (const auto& signal : signals_) {
        if (isShown(signal)) {
            counts[signal.kind]++;
        }
    }
    return counts;
}

double RadarEngine::getSweepAngle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweepAngle_;
}

double RadarEngine::getSweepSpeed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweepSpeed_;
}

// Controls

bool RadarEngine::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

void RadarEngine::setPaused(bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = paused;
}

void RadarEngine::togglePause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = !paused_;
}

void RadarEngine::increaseSpeed() {
    std::lock_guard<std::mutex> lock(mutex_);
    sweepSpeed_ = std::min(sweepSpeed_ * kSpeedStep, config_.sweep.maxSweepSpeed);
}

void RadarEngine::decreaseSpeed() {
    std::lock_guard<std::mutex> lock(mutex_);
    sweepSpeed_ = std::max(sweepSpeed_ / kSpeedStep, config_.sweep.minSweepSpeed);
}

void RadarEngine::toggleKindFilter(SignalKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t idx = signalKindIndex(kind);
    kindVisible_[idx] = !kindVisible_[idx];
}

void RadarEngine::toggleAllFilters() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool allVisible = std::all_of(kindVisible_.begin(), kindVisible_.end(),
                                  [](bool v) { return v; });
    kindVisible_.fill(!allVisible);
}

void RadarEngine::setAllFiltersVisible(bool visible) {
    std::lock_guard<std::mutex> lock(mutex_);
    kindVisible_.fill(visible);
}

bool RadarEngine::isKindVisible(SignalKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kindVisible_[signalKindIndex(kind)];
}

bool RadarEngine::areAllFiltersVisible() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::all_of(kindVisible_.begin(), kindVisible_.end(),
                       [](bool v) { return v; });
}

void RadarEngine::selectNextSignal() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<size_t> visible = getVisibleSignalIndices();
    if (visible.empty()) {
        selectedId_ = -1;
        return;
    }

    int current = indexOfId(selectedId_);
    auto pos = std::find(visible.begin(), visible.end(), static_cast<size_t>(current));

    if (current < 0 || pos == visible.end()) {
        selectedId_ = signals_[visible.front()].id;
    } else {
        size_t next = (static_cast<size_t>(pos - visible.begin()) + 1) % visible.size();
        selectedId_ = signals_[visible[next]].id;
    }
}

void RadarEngine::selectPreviousSignal() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<size_t> visible = getVisibleSignalIndices();
    if (visible.empty()) {
        selectedId_ = -1;
        return;
    }

    int current = indexOfId(selectedId_);
    auto pos = std::find(visible.begin(), visible.end(), static_cast<size_t>(current));

    if (current < 0 || pos == visible.end()) {
        selectedId_ = signals_[visible.back()].id;
    } else {
        size_t at = static_cast<size_t>(pos - visible.begin());
        size_t prev = (at + visible.size() - 1) % visible.size();
        selectedId_ = signals_[visible[prev]].id;
    }
}

void RadarEngine::clearSelection() {
    std::lock_guard<std::mutex> lock(mutex_);
    selectedId_ = -1;
}

std::optional<Signal> RadarEngine::getSelectedSignal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int idx = indexOfId(selectedId_);
    if (idx < 0) {
        return std::nullopt;
    }
    return signals_[static_cast<size_t>(idx)];
}

int RadarEngine::getSelectedSignalIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indexOfId(selectedId_);
}

SignalId RadarEngine::getSelectedSignalId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indexOfId(selectedId_) >= 0 ? selectedId_ : -1;
}

bool RadarEngine::isUsingRealData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return useRealData_;
}

void RadarEngine::toggleDataMode() {
    std::lock_guard<std::mutex> lock(mutex_);

    useRealData_ = !useRealData_;
    const Timestamp now = clock_.now();

    if (useRealData_) {
        if (collector_) {
            std::vector<Signal> collected = collector_->collect();
            if (!collected.empty()) {
                replaceSignals(std::move(collected), now);
            }
        }
    } else {
        replaceSignals(generateInitialSignals(now), now);
    }

    RADARSCOPE_LOG_INFO(kLogComponent, "switched to "
                        << (useRealData_ ? "real" : "simulated") << " data");
}

void RadarEngine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = clock_.now();
    replaceSignals(generateInitialSignals(now), now);

    sweepAngle_ = 0.0;
    sweepSpeed_ = config_.sweep.sweepSpeed;
    paused_ = false;
    lastHistoryUpdate_ = now;
    lastManagement_ = now;
}

SignalId RadarEngine::addSignal(Signal signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insertSignal(std::move(signal), clock_.now());
}

void RadarEngine::clearSignals() {
    std::lock_guard<std::mutex> lock(mutex_);
    signals_.clear();
    selectedId_ = -1;
}

RadarEngine::Statistics RadarEngine::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace radarscope

/**
 * @file RadarAPI.cpp
 * @brief Radar API implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/api/RadarAPI.hpp"
#include "radarscope/collector/RealDataCollector.hpp"
#include "radarscope/config/JsonLoader.hpp"
#include "radarscope/config/JsonSaver.hpp"
#include "radarscope/engine/RadarEngine.hpp"
#include "radarscope/scanner/ScanCoordinator.hpp"
#include "radarscope/scanner/ScannerFactory.hpp"
#include "radarscope/utils/Logger.hpp"
#include <mutex>
#include <stdexcept>

namespace radarscope {

namespace {

const char* const kLogComponent = "RadarAPI";

}  // anonymous namespace

/**
 * @brief Private implementation (PIMPL idiom for ABI stability)
 *
 * Members are declared source first so that destruction runs engine,
 * collector, coordinator.
 */
class RadarAPI::Impl {
public:
    explicit Impl(const IClock& c) : clock(&c) {}

    const IClock* clock;
    RadarConfig config;

    std::shared_ptr<ScanCoordinator> coordinator;
    std::shared_ptr<RealDataCollector> collector;
    std::shared_ptr<RadarEngine> engine;

    mutable std::mutex mutex;
    bool initialized = false;

    // Engine handle taken under the lock; calls run outside it so the API
    // mutex is never held while the engine mutex is contended
    std::shared_ptr<RadarEngine> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return engine;
    }
};

RadarAPI::RadarAPI()
    : pImpl_(std::make_unique<Impl>(SystemClock::instance())) {
}

RadarAPI::RadarAPI(const RadarConfig& config)
    : pImpl_(std::make_unique<Impl>(SystemClock::instance())) {
    initialize(config);
}

RadarAPI::RadarAPI(const RadarConfig& config, const IClock& clock)
    : pImpl_(std::make_unique<Impl>(clock)) {
    initialize(config);
}

RadarAPI::~RadarAPI() = default;

RadarAPI::RadarAPI(RadarAPI&&) noexcept = default;
RadarAPI& RadarAPI::operator=(RadarAPI&&) noexcept = default;

bool RadarAPI::initialize(const RadarConfig& config,
                          const std::vector<std::shared_ptr<IScanner>>& extraScanners) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);

    try {
        if (!config.isValid()) {
            throw std::invalid_argument("Invalid radar configuration");
        }

        Logger::setLevel(stringToLogLevel(config.logLevel));

        const IClock& clock = *pImpl_->clock;

        // Build the new pipeline before releasing the old one
        auto coordinator = std::make_shared<ScanCoordinator>(config.scan, clock);
        for (auto& scanner : ScannerFactory::createAll(config.scan, clock)) {
            coordinator->addScanner(std::move(scanner));
        }
        for (const auto& scanner : extraScanners) {
            coordinator->addScanner(scanner);
        }

        auto collector = std::make_shared<RealDataCollector>(config.scan, coordinator, clock);
        auto engine = std::make_shared<RadarEngine>(config, collector, clock);

        pImpl_->engine.reset();
        pImpl_->collector.reset();
        pImpl_->coordinator.reset();

        pImpl_->config = config;
        pImpl_->coordinator = std::move(coordinator);
        pImpl_->collector = std::move(collector);
        pImpl_->engine = std::move(engine);
        pImpl_->initialized = true;
        return true;
    } catch (const std::exception& e) {
        RADARSCOPE_LOG_ERROR(kLogComponent, "initialization failed: " << e.what());
        pImpl_->initialized = false;
        return false;
    }
}

bool RadarAPI::isInitialized() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->initialized && pImpl_->engine != nullptr;
}

void RadarAPI::tick() {
    auto engine = pImpl_->snapshot();
    if (!engine) return;

    engine->tick();
}

double RadarAPI::getRefreshRate() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->config.sweep.refreshRate;
}

std::vector<Signal> RadarAPI::getSignals() const {
    auto engine = pImpl_->snapshot();
    if (!engine) return {};

    return engine->getSignals();
}

std::vector<Signal> RadarAPI::getVisibleSignals() const {
    auto engine = pImpl_->snapshot();
    if (!engine) return {};

    return engine->getVisibleSignals();
}

int RadarAPI::getVisibleSignalCount() const {
    auto engine = pImpl_->snapshot();
    if (!engine) return 0;

    return static_cast<int>(engine->getVisibleSignalCount());
}

std::map<SignalKind, size_t> RadarAPI::getSignalCountsByKind() const {
    auto engine = pImpl_->snapshot();
    if (!engine) return {};

    return engine->getSignalCountsByKind();
}

double RadarAPI::getSweepAngle() const {
    auto engine = pImpl_->snapshot();
    return engine ? engine->getSweepAngle() : 0.0;
}

double RadarAPI::getSweepSpeed() const {
    auto engine = pImpl_->snapshot();
    return engine ? engine->getSweepSpeed() : 0.0;
}

bool RadarAPI::getSelectedSignal(Signal& signal) const {
    auto engine = pImpl_->snapshot();
    if (!engine) return false;

    auto selected = engine->getSelectedSignal();
    if (!selected) return false;

    signal = *selected;
    return true;
}

std::vector<std::string> RadarAPI::getScannerNames() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);

    if (!pImpl_->coordinator) return {};

    return pImpl_->coordinator->getScannerNames();
}

bool RadarAPI::isPaused() const {
    auto engine = pImpl_->snapshot();
    return engine && engine->isPaused();
}

void RadarAPI::setPaused(bool paused) {
    if (auto engine = pImpl_->snapshot()) engine->setPaused(paused);
}

void RadarAPI::togglePause() {
    if (auto engine = pImpl_->snapshot()) engine->togglePause();
}

void RadarAPI::increaseSpeed() {
    if (auto engine = pImpl_->snapshot()) engine->increaseSpeed();
}

void RadarAPI::decreaseSpeed() {
    if (auto engine = pImpl_->snapshot()) engine->decreaseSpeed();
}

void RadarAPI::toggleKindFilter(SignalKind kind) {
    if (auto engine = pImpl_->snapshot()) engine->toggleKindFilter(kind);
}

void RadarAPI::toggleAllFilters() {
    if (auto engine = pImpl_->snapshot()) engine->toggleAllFilters();
}

bool RadarAPI::isKindVisible(SignalKind kind) const {
    auto engine = pImpl_->snapshot();
    return engine && engine->isKindVisible(kind);
}

void RadarAPI::selectNextSignal() {
    if (auto engine = pImpl_->snapshot()) engine->selectNextSignal();
}

void RadarAPI::selectPreviousSignal() {
    if (auto engine = pImpl_->snapshot()) engine->selectPreviousSignal();
}

void RadarAPI::clearSelection() {
    if (auto engine = pImpl_->snapshot()) engine->clearSelection();
}

bool RadarAPI::isUsingRealData() const {
    auto engine = pImpl_->snapshot();
    return engine && engine->isUsingRealData();
}

void RadarAPI::toggleDataMode() {
    if (auto engine = pImpl_->snapshot()) engine->toggleDataMode();
}

void RadarAPI::reset() {
    if (auto engine = pImpl_->snapshot()) engine->reset();
}

RadarConfig RadarAPI::getConfig() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->config;
}

bool RadarAPI::setConfig(const RadarConfig& config) {
    return initialize(config);
}

RadarAPI::Statistics RadarAPI::getStatistics() const {
    std::shared_ptr<RadarEngine> engine;
    std::shared_ptr<ScanCoordinator> coordinator;
    std::shared_ptr<RealDataCollector> collector;
    {
        std::lock_guard<std::mutex> lock(pImpl_->mutex);
        engine = pImpl_->engine;
        coordinator = pImpl_->coordinator;
        collector = pImpl_->collector;
    }

    Statistics stats = {};
    stats.lastCollectOutcome = collectorOutcomeToString(RealDataCollector::Outcome::NONE);

    if (engine) {
        const auto engineStats = engine->getStatistics();
        stats.ticks = engineStats.ticks;
        stats.managementPasses = engineStats.managementPasses;
        stats.signalsSpawned = engineStats.signalsSpawned;
        stats.signalsMerged = engineStats.signalsMerged;
        stats.signalsExpired = engineStats.signalsExpired;
        stats.lastTickDurationMs = engineStats.lastTickDurationMs;
        stats.numSignals = static_cast<int>(engine->getNumSignals());
        stats.numVisibleSignals = static_cast<int>(engine->getVisibleSignalCount());
    }

    if (coordinator) {
        const auto scanStats = coordinator->getStatistics();
        stats.scansLaunched = scanStats.scansLaunched;
        stats.scansCompleted = scanStats.scansCompleted;
        stats.scannerFailures = scanStats.scannerFailures;
        stats.scannerTimeouts = scanStats.scannerTimeouts;
    }

    if (collector) {
        const auto collectStats = collector->getStatistics();
        stats.collections = collectStats.collections;
        stats.collectTimeouts = collectStats.timeouts;
        stats.fallbacks = collectStats.fallbacks;
        stats.lastCollectOutcome = collectorOutcomeToString(collector->getLastOutcome());
    }

    return stats;
}

bool RadarAPI::loadConfigFromFile(const std::string& filepath) {
    try {
        RadarConfig config = JsonLoader::loadFromFile(filepath);
        return initialize(config);
    } catch (const std::exception& e) {
        RADARSCOPE_LOG_ERROR(kLogComponent, "cannot load " << filepath << ": " << e.what());
        return false;
    }
}

bool RadarAPI::saveConfigToFile(const std::string& filepath) const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);

    try {
        JsonSaver::saveToFile(pImpl_->config, filepath);
        return true;
    } catch (const std::exception& e) {
        RADARSCOPE_LOG_ERROR(kLogComponent, "cannot save " << filepath << ": " << e.what());
        return false;
    }
}

bool RadarAPI::loadConfigFromString(const std::string& jsonString) {
    try {
        RadarConfig config = JsonLoader::loadFromString(jsonString);
        return initialize(config);
    } catch (const std::exception& e) {
        RADARSCOPE_LOG_ERROR(kLogComponent, "cannot parse configuration: " << e.what());
        return false;
    }
}

std::string RadarAPI::getConfigAsJson() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return JsonSaver::saveToString(pImpl_->config);
}

} // namespace radarscope

/**
 * @file main.cpp
 * @brief Radarscope demo application
 *
 * Headless walk through the radar core:
 * - Simulated sweep on a manual clock
 * - Real data through scanners, coordinator and collector
 * - Keyboard-style controls
 * - JSON save/load
 * @copyright Radarscope signal radar
 */

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

#include "radarscope/Radarscope.hpp"

using namespace radarscope;

/**
 * @brief Print one signal as a radar contact line
 */
void printSignal(const Signal& signal) {
    std::cout << "  " << signal.icon << " "
              << std::left << std::setw(22) << signal.name << std::right
              << std::setw(10) << signalKindToString(signal.kind)
              << "  str=" << std::setw(3) << signal.strength
              << std::fixed << std::setprecision(1)
              << "  dist=" << std::setw(4) << signal.distance
              << "  bearing=" << std::setw(5) << MathUtils::radToDeg(signal.angle)
              << "  pers=" << std::setw(3) << static_cast<int>(signal.persistence * 100) << "%"
              << "  trail=" << signal.history.size()
              << "  [" << signalOriginToString(signal.origin) << "]"
              << std::endl;
}

void printFrame(const RadarAPI& radar) {
    std::cout << "Sweep at " << std::fixed << std::setprecision(1)
              << MathUtils::radToDeg(radar.getSweepAngle()) << " deg, "
              << radar.getVisibleSignalCount() << " visible" << std::endl;
    for (const auto& signal : radar.getVisibleSignals()) {
        printSignal(signal);
    }
}

/**
 * @brief Demo 1: Simulated sweep driven by a manual clock
 */
void demoSimulatedSweep() {
    std::cout << "\n=== Demo 1: Simulated Sweep ===" << std::endl;

    RadarConfig config = RadarConfig::simulationOnly();
    config.management.rngSeed = 42;

    ManualClock clock;
    RadarAPI radar(config, clock);

    std::cout << "Radar initialized with " << radar.getSignals().size()
              << " simulated signal(s)" << std::endl;

    // 20 seconds of frames at the configured refresh rate
    int frames = static_cast<int>(20.0 / config.sweep.refreshRate);
    for (int frame = 1; frame <= frames; ++frame) {
        clock.advance(config.sweep.refreshRate);
        radar.tick();

        if (frame % 100 == 0) {
            std::cout << "\nt=" << std::fixed << std::setprecision(1)
                      << frame * config.sweep.refreshRate << "s  ";
            printFrame(radar);
        }
    }

    auto stats = radar.getStatistics();
    std::cout << "\nTicks: " << stats.ticks
              << ", management passes: " << stats.managementPasses
              << ", spawned: " << stats.signalsSpawned
              << ", expired: " << stats.signalsExpired << std::endl;
}

/**
 * @brief Demo 2: Real data from host scanners
 */
void demoRealData() {
    std::cout << "\n=== Demo 2: Real Data ===" << std::endl;

    RadarConfig config = RadarConfig::defaults();
    config.scan.scanners = {"NETWORK_INTERFACE", "SIMULATED"};
    config.scan.scanInterval = 1.0;
    config.management.managementInterval = 1.0;

    RadarAPI radar(config);

    std::cout << "Active scanners:";
    for (const auto& name : radar.getScannerNames()) {
        std::cout << " [" << name << "]";
    }
    std::cout << std::endl;

    // About three seconds of wall-clock frames
    auto refresh = std::chrono::duration<double>(radar.getRefreshRate());
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < until) {
        radar.tick();
        std::this_thread::sleep_for(refresh);
    }

    printFrame(radar);

    auto stats = radar.getStatistics();
    std::cout << "Scans launched: " << stats.scansLaunched
              << ", completed: " << stats.scansCompleted
              << ", collections: " << stats.collections
              << ", last outcome: " << stats.lastCollectOutcome << std::endl;
}

/**
 * @brief Demo 3: Controls
 */
void demoControls() {
    std::cout << "\n=== Demo 3: Controls ===" << std::endl;

    RadarConfig config = RadarConfig::simulationOnly();
    config.management.rngSeed = 7;

    ManualClock clock;
    RadarAPI radar(config, clock);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Sweep speed " << radar.getSweepSpeed();
    for (int i = 0; i < 20; ++i) radar.increaseSpeed();
    std::cout << " -> max " << radar.getSweepSpeed();
    for (int i = 0; i < 40; ++i) radar.decreaseSpeed();
    std::cout << " -> min " << radar.getSweepSpeed() << " rad/tick" << std::endl;

    radar.toggleKindFilter(SignalKind::WIFI);
    std::cout << "WiFi filter: " << (radar.isKindVisible(SignalKind::WIFI) ? "shown" : "hidden")
              << ", visible signals: " << radar.getVisibleSignalCount() << std::endl;
    radar.toggleAllFilters();

    radar.selectNextSignal();
    Signal selected;
    if (radar.getSelectedSignal(selected)) {
        std::cout << "Selected: " << selected.getSummary() << std::endl;
    }

    radar.togglePause();
    double before = radar.getSweepAngle();
    clock.advance(1.0);
    radar.tick();
    std::cout << "Paused: sweep " << (radar.getSweepAngle() == before ? "held" : "moved") << std::endl;

    radar.reset();
    std::cout << "After reset: paused=" << std::boolalpha << radar.isPaused()
              << ", sweep=" << radar.getSweepAngle() << std::endl;
}

/**
 * @brief Demo 4: JSON configuration
 */
void demoJsonConfig() {
    std::cout << "\n=== Demo 4: JSON Configuration ===" << std::endl;

    RadarConfig config = RadarConfig::realDataOnly();
    config.scan.scanners = {"SIMULATED"};

    std::string jsonStr = JsonSaver::saveToString(config);
    std::cout << "Generated JSON configuration:" << std::endl;
    std::cout << jsonStr << std::endl;

    RadarConfig loadedConfig = JsonLoader::loadFromString(jsonStr);
    std::cout << "\nLoaded configuration:" << std::endl;
    std::cout << "  Scan interval: " << loadedConfig.scan.scanInterval << "s" << std::endl;
    std::cout << "  Fallback: " << std::boolalpha << loadedConfig.scan.useSimulatedFallback << std::endl;

    RadarAPI radar(loadedConfig);
    std::cout << "\nRadar initialized from JSON: "
              << (radar.isInitialized() ? "SUCCESS" : "FAILED") << std::endl;
}

/**
 * @brief Main entry point
 */
int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "     Radarscope - Demo Application      " << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        demoSimulatedSweep();
        demoRealData();
        demoControls();
        demoJsonConfig();

        std::cout << "\n========================================" << std::endl;
        std::cout << "   All demos completed successfully!    " << std::endl;
        std::cout << "========================================" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

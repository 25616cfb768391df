/**
 * @file Radarscope.hpp
 * @brief Main include file for Radarscope
 *
 * Include this single header to access all Radarscope functionality.
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_RADARSCOPE_HPP
#define RADARSCOPE_RADARSCOPE_HPP

// Core types
#include "core/Types.hpp"
#include "core/PositionSample.hpp"
#include "core/Signal.hpp"
#include "core/ScanConfig.hpp"
#include "core/RadarConfig.hpp"

// Utilities
#include "utils/MathUtils.hpp"
#include "utils/RingBuffer.hpp"
#include "utils/BlockingQueue.hpp"
#include "utils/Clock.hpp"
#include "utils/Logger.hpp"

// Scanners
#include "scanner/ScanContext.hpp"
#include "scanner/IScanner.hpp"
#include "scanner/SimulatedScanner.hpp"
#include "scanner/NetworkInterfaceScanner.hpp"
#include "scanner/ScannerFactory.hpp"
#include "scanner/ScanCoordinator.hpp"

// Data collection
#include "collector/RealDataCollector.hpp"

// Engine
#include "engine/SignalGenerator.hpp"
#include "engine/RadarEngine.hpp"

// Public API
#include "api/RadarAPI.hpp"

// Configuration
#include "config/JsonLoader.hpp"
#include "config/JsonSaver.hpp"

/**
 * @namespace radarscope
 * @brief Radarscope - terminal radar for nearby signals
 *
 * The radarscope namespace contains all components of the radar core:
 *
 * - **Core Types**: Signal, PositionSample, ScanConfig, RadarConfig
 * - **Scanners**: IScanner contract, simulated and network interface scanners
 * - **Coordinator**: Rate-limited concurrent aggregation of scanners
 * - **Collector**: Latency-bounded real data feed with fallback
 * - **Engine**: RadarEngine drives sweep, decay, history and management
 * - **API**: Thread-safe RadarAPI facade for front ends
 *
 * @example
 * @code
 * #include <radarscope/Radarscope.hpp>
 *
 * radarscope::RadarAPI radar(radarscope::RadarConfig::simulationOnly());
 *
 * while (running) {
 *     radar.tick();
 *     draw(radar.getVisibleSignals(), radar.getSweepAngle());
 *     sleep(radar.getRefreshRate());
 * }
 * @endcode
 */

#endif // RADARSCOPE_RADARSCOPE_HPP

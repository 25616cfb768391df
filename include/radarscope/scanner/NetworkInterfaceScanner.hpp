/**
 * @file NetworkInterfaceScanner.hpp
 * @brief Scanner reporting host network interfaces and connections
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_SCANNER_NETWORKINTERFACESCANNER_HPP
#define RADARSCOPE_SCANNER_NETWORKINTERFACESCANNER_HPP

#include "IScanner.hpp"
#include "../core/ScanConfig.hpp"
#include "../utils/Clock.hpp"
#include <string>
#include <vector>

namespace radarscope {

/**
 * @brief Turns kernel network statistics into radar signals
 *
 * Reads the procfs tables directly, no subprocesses. Every non-loopback
 * interface with traffic becomes one signal whose strength follows its
 * packet count; established TCP connections are grouped by service into
 * one signal per group.
 *
 * Positions are derived from the interface or group name so the same
 * emitter shows up at the same bearing on every scan.
 */
class NetworkInterfaceScanner : public IScanner {
public:
    static constexpr const char* DEFAULT_DEV_PATH = "/proc/net/dev";
    static constexpr const char* DEFAULT_TCP_PATH = "/proc/net/tcp";
    static constexpr const char* DEFAULT_TCP6_PATH = "/proc/net/tcp6";

    explicit NetworkInterfaceScanner(const ScanConfig& config,
                                     const IClock& clock = SystemClock::instance());

    /**
     * @brief Construct reading alternative statistics files
     *
     * @param tcpPaths Connection tables counted together; empty skips
     *                 connection grouping
     */
    NetworkInterfaceScanner(const ScanConfig& config,
                            const std::string& devPath,
                            const std::vector<std::string>& tcpPaths,
                            const IClock& clock = SystemClock::instance());

    ScanResult scan(const ScanContext& ctx) override;

    std::string getName() const override { return "Network Interface Scanner"; }

    /**
     * @brief True when the interface table is readable
     */
    bool isAvailable() const override;

    /**
     * @brief Parse the contents of /proc/net/dev
     *
     * Header lines, loopback interfaces and idle interfaces are skipped.
     * Strength is (rx + tx packets) / 1000 clamped to [10, 100].
     */
    static std::vector<Signal> parseProcNetDev(const std::string& text, Timestamp now,
                                               double maxRange = 10.0);

    /**
     * @brief Parse the contents of /proc/net/tcp or /proc/net/tcp6
     *
     * Both tables share a layout, so their texts may be concatenated to
     * count IPv4 and IPv6 connections together.
     * Established connections are counted per service (HTTP, SSH, DNS,
     * Other); each non-empty group yields one signal with strength
     * min(100, 20 * count).
     */
    static std::vector<Signal> parseProcNetTcp(const std::string& text, Timestamp now,
                                               double maxRange = 10.0);

private:
    ScanConfig config_;
    std::string devPath_;
    std::vector<std::string> tcpPaths_;
    const IClock& clock_;
};

} // namespace radarscope

#endif // RADARSCOPE_SCANNER_NETWORKINTERFACESCANNER_HPP

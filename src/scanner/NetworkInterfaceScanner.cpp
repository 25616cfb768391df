/**
 * @file NetworkInterfaceScanner.cpp
 * @brief Network interface scanner implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/scanner/NetworkInterfaceScanner.hpp"
#include "radarscope/utils/Logger.hpp"
#include "radarscope/utils/MathUtils.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace radarscope {

namespace {

const char* const kLogComponent = "NetworkInterfaceScanner";

// /proc/net/dev columns after the interface name
constexpr size_t kRxPacketsColumn = 1;
constexpr size_t kTxPacketsColumn = 9;
constexpr size_t kDevColumns = 16;

// /proc/net/tcp{,6} connection state for ESTABLISHED
const char* const kTcpEstablished = "01";

constexpr double kMinPlacementDistance = 1.0;

bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

// Stable bearing for a name
double bearingFor(const std::string& name) {
    size_t h = std::hash<std::string>()(name);
    return static_cast<double>(h % 3600) / 3600.0 * TWO_PI;
}

// Stronger emitters sit closer to the centre
double distanceFor(int strength, double maxRange) {
    double span = std::max(0.0, maxRange - kMinPlacementDistance);
    return kMinPlacementDistance + span * (100 - strength) / 100.0;
}

Signal makeSignal(SignalKind kind, const std::string& name, int strength,
                  Timestamp now, double maxRange) {
    Signal signal(kind, name, now);
    signal.origin = SignalOrigin::REAL;
    signal.setStrength(strength);
    signal.angle = bearingFor(name);
    signal.distance = distanceFor(signal.strength, maxRange);
    signal.recordPosition(now, true);
    return signal;
}

std::string serviceForPort(unsigned long port) {
    switch (port) {
        case 80:
        case 443:
            return "HTTP";
        case 22:
            return "SSH";
        case 53:
            return "DNS";
        default:
            return "Other";
    }
}

bool parsePort(const std::string& endpoint, unsigned long& port) {
    size_t colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon + 1 >= endpoint.size()) {
        return false;
    }
    try {
        port = std::stoul(endpoint.substr(colon + 1), nullptr, 16);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

}  // anonymous namespace

NetworkInterfaceScanner::NetworkInterfaceScanner(const ScanConfig& config, const IClock& clock)
    : NetworkInterfaceScanner(config, DEFAULT_DEV_PATH,
                              {DEFAULT_TCP_PATH, DEFAULT_TCP6_PATH}, clock) {
}

NetworkInterfaceScanner::NetworkInterfaceScanner(const ScanConfig& config,
                                                 const std::string& devPath,
                                                 const std::vector<std::string>& tcpPaths,
                                                 const IClock& clock)
    : config_(config),
      devPath_(devPath),
      tcpPaths_(tcpPaths),
      clock_(clock) {
}

bool NetworkInterfaceScanner::isAvailable() const {
    std::ifstream file(devPath_);
    return file.is_open();
}

std::vector<Signal> NetworkInterfaceScanner::parseProcNetDev(const std::string& text,
                                                             Timestamp now,
                                                             double maxRange) {
    std::vector<Signal> signals;
    std::istringstream lines(text);
    std::string line;

    while (std::getline(lines, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;   // Header
        }

        std::string iface = trim(line.substr(0, colon));
        if (iface.empty() || startsWith(iface, "lo")) {
            continue;
        }

        std::istringstream fields(line.substr(colon + 1));
        std::vector<unsigned long long> columns;
        unsigned long long value = 0;
        while (columns.size() < kDevColumns && fields >> value) {
            columns.push_back(value);
        }
        if (columns.size() <= kTxPacketsColumn) {
            continue;
        }

        unsigned long long packets = columns[kRxPacketsColumn] + columns[kTxPacketsColumn];
        if (packets == 0) {
            continue;
        }

        unsigned long long scaled = std::min<unsigned long long>(packets / 1000, 100);
        int strength = MathUtils::clamp(static_cast<int>(scaled), 10, 100);

        SignalKind kind = (startsWith(iface, "wl") || startsWith(iface, "wifi"))
                              ? SignalKind::WIFI
                              : SignalKind::NETWORK;

        signals.push_back(makeSignal(kind, iface + " Interface", strength, now, maxRange));
    }

    return signals;
}

std::vector<Signal> NetworkInterfaceScanner::parseProcNetTcp(const std::string& text,
                                                             Timestamp now,
                                                             double maxRange) {
    const std::vector<std::string> services = {"HTTP", "SSH", "DNS", "Other"};
    std::vector<int> counts(services.size(), 0);

    std::istringstream lines(text);
    std::string line;

    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string slot, local, remote, state;
        if (!(fields >> slot >> local >> remote >> state)) {
            continue;
        }
        if (slot.empty() || slot.back() != ':' || state != kTcpEstablished) {
            continue;   // Header or not established
        }

        unsigned long localPort = 0;
        unsigned long remotePort = 0;
        if (!parsePort(local, localPort) || !parsePort(remote, remotePort)) {
            continue;
        }

        std::string service = serviceForPort(remotePort);
        if (service == "Other") {
            service = serviceForPort(localPort);
        }

        for (size_t i = 0; i < services.size(); ++i) {
            if (services[i] == service) {
                counts[i]++;
                break;
            }
        }
    }

    std::vector<Signal> signals;
    for (size_t i = 0; i < services.size(); ++i) {
        if (counts[i] == 0) {
            continue;
        }
        int strength = std::min(100, counts[i] * 20);
        signals.push_back(makeSignal(SignalKind::NETWORK, services[i] + " Connections",
                                     strength, now, maxRange));
    }
    return signals;
}

ScanResult NetworkInterfaceScanner::scan(const ScanContext& ctx) {
    if (ctx.isCancelled()) {
        return ScanResult::failure(ScanError::SCAN_TIMEOUT, "cancelled before scanning");
    }

    std::string devText;
    if (!readFile(devPath_, devText)) {
        return ScanResult::failure(ScanError::SCAN_FAILED, "cannot read " + devPath_);
    }

    const Timestamp now = clock_.now();
    std::vector<Signal> signals = parseProcNetDev(devText, now, config_.maxScanRange);

    // IPv4 and IPv6 tables are counted as one
    std::string tcpText;
    bool haveTcp = false;
    for (const auto& path : tcpPaths_) {
        if (ctx.isCancelled()) {
            break;
        }
        std::string text;
        if (readFile(path, text)) {
            tcpText += text;
            tcpText += '\n';
            haveTcp = true;
        } else {
            RADARSCOPE_LOG_DEBUG(kLogComponent, "cannot read " << path);
        }
    }
    if (haveTcp) {
        std::vector<Signal> connections = parseProcNetTcp(tcpText, now, config_.maxScanRange);
        signals.insert(signals.end(),
                       std::make_move_iterator(connections.begin()),
                       std::make_move_iterator(connections.end()));
    }

    // Limit results
    if (signals.size() > static_cast<size_t>(config_.maxSignals)) {
        signals.resize(static_cast<size_t>(config_.maxSignals));
    }

    return ScanResult::success(std::move(signals));
}

} // namespace radarscope

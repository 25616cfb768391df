/**
 * @file IScanner.hpp
 * @brief Scanner interface for signal sources
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_SCANNER_ISCANNER_HPP
#define RADARSCOPE_SCANNER_ISCANNER_HPP

#include "../core/Signal.hpp"
#include "ScanContext.hpp"
#include <string>
#include <vector>

namespace radarscope {

/**
 * @brief Data-source failure taxonomy
 *
 * None of these ever propagate to the tick loop; they are absorbed by the
 * coordinator and collector and turned into cached or fallback data.
 */
enum class ScanError {
    NONE,
    SCANNER_UNAVAILABLE,    // Probe failed at registration, excluded for good
    SCAN_TIMEOUT,           // Exceeded the bounded window, retried next cycle
    SCAN_FAILED,            // Scanner reported an error, treated like a timeout
    AGGREGATE_EMPTY         // Nothing came back from any scanner
};

inline std::string scanErrorToString(ScanError error) {
    switch (error) {
        case ScanError::NONE: return "NONE";
        case ScanError::SCANNER_UNAVAILABLE: return "SCANNER_UNAVAILABLE";
        case ScanError::SCAN_TIMEOUT: return "SCAN_TIMEOUT";
        case ScanError::SCAN_FAILED: return "SCAN_FAILED";
        case ScanError::AGGREGATE_EMPTY: return "AGGREGATE_EMPTY";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Outcome of one scan
 *
 * A failed scan may still carry partial signals.
 */
struct ScanResult {
    std::vector<Signal> signals;
    ScanError error = ScanError::NONE;
    std::string message;
    std::string scannerName;

    bool ok() const { return error == ScanError::NONE; }

    static ScanResult success(std::vector<Signal> found) {
        ScanResult result;
        result.signals = std::move(found);
        return result;
    }

    static ScanResult failure(ScanError err, const std::string& why) {
        ScanResult result;
        result.error = err;
        result.message = why;
        return result;
    }
};

/**
 * @brief Abstract interface for signal sources
 *
 * Defines the contract every data source must satisfy. Implementations
 * may be slow or unreliable but must honour the context: return partial
 * or empty results once it is cancelled or its deadline passes rather
 * than block past it.
 */
class IScanner {
public:
    /**
     * @brief Virtual destructor
     */
    virtual ~IScanner() = default;

    /**
     * @brief Detect signals
     *
     * May be called from a background thread. Implementations report
     * failures through ScanResult::error; exceptions are tolerated and
     * converted into SCAN_FAILED by the caller.
     */
    virtual ScanResult scan(const ScanContext& ctx) = 0;

    /**
     * @brief Stable identifier for diagnostics
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Cheap capability probe
     *
     * Evaluated once when the scanner is registered, never per scan.
     */
    virtual bool isAvailable() const = 0;

protected:
    IScanner() = default;

    // Prevent copying through base class
    IScanner(const IScanner&) = default;
    IScanner& operator=(const IScanner&) = default;
};

} // namespace radarscope

#endif // RADARSCOPE_SCANNER_ISCANNER_HPP

/**
 * @file ScanContext.hpp
 * @brief Cancellation token with an optional deadline
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_SCANNER_SCANCONTEXT_HPP
#define RADARSCOPE_SCANNER_SCANCONTEXT_HPP

#include <chrono>
#include <memory>

namespace radarscope {

/**
 * @brief Shared cancellation handle passed to scanners
 *
 * Copies refer to the same underlying token. A context derived with
 * withTimeout() or withCancel() is cancelled when its parent is
 * cancelled, when its own deadline passes, or when cancel() is called on
 * it; cancelling a child never affects the parent.
 *
 * Scanners are expected to poll isCancelled() or sleep through waitFor()
 * so that they return promptly once the context ends.
 */
class ScanContext {
public:
    using SteadyClock = std::chrono::steady_clock;
    using TimePoint = SteadyClock::time_point;

    /**
     * @brief Root context: no deadline, cancelled only explicitly
     */
    ScanContext();

    static ScanContext background() { return ScanContext(); }

    /**
     * @brief Derive a child that expires @p seconds from now
     */
    static ScanContext withTimeout(const ScanContext& parent, double seconds);

    /**
     * @brief Derive a child that can be cancelled independently
     */
    static ScanContext withCancel(const ScanContext& parent);

    /**
     * @brief Cancel this context and every context derived from it
     */
    void cancel() const;

    bool isCancelled() const;

    /**
     * @brief True when the context ended because a deadline passed
     */
    bool deadlineExceeded() const;

    bool hasDeadline() const;

    /**
     * @brief Earliest deadline along the parent chain
     *
     * TimePoint::max() when there is none.
     */
    TimePoint deadline() const;

    /**
     * @brief Seconds until the deadline, 0 once passed, a very large
     *        value when there is no deadline
     */
    double remainingSeconds() const;

    /**
     * @brief Sleep up to @p seconds, waking early on cancellation
     *
     * @return true if the full interval elapsed, false if the context
     *         ended first
     */
    bool waitFor(double seconds) const;

private:
    struct State;

    explicit ScanContext(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace radarscope

#endif // RADARSCOPE_SCANNER_SCANCONTEXT_HPP

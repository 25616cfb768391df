/**
 * @file Clock.hpp
 * @brief Injectable time source
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_UTILS_CLOCK_HPP
#define RADARSCOPE_UTILS_CLOCK_HPP

#include "../core/Types.hpp"
#include <atomic>
#include <chrono>

namespace radarscope {

/**
 * @brief Abstract time source
 *
 * Decay, rate limiting and lifetimes are computed from this clock so that
 * tests can drive simulated time without sleeping. Hard wall-clock budgets
 * (scan and collect timeouts) always use std::chrono::steady_clock.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Current time in microseconds
     */
    virtual Timestamp now() const = 0;

protected:
    IClock() = default;
    IClock(const IClock&) = default;
    IClock& operator=(const IClock&) = default;
};

/**
 * @brief Monotonic clock backed by std::chrono::steady_clock
 */
class SystemClock : public IClock {
public:
    Timestamp now() const override {
        auto since = std::chrono::steady_clock::now().time_since_epoch();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::microseconds>(since).count());
    }

    /**
     * @brief Process-wide shared instance
     */
    static const SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }
};

/**
 * @brief Manually advanced clock for tests and replays
 *
 * Safe to read from background threads while the owner advances it.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = 1000000) : now_(start) {}

    Timestamp now() const override { return now_.load(); }

    void set(Timestamp t) { now_.store(t); }

    void advance(double seconds) { now_.fetch_add(fromSeconds(seconds)); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace radarscope

#endif // RADARSCOPE_UTILS_CLOCK_HPP

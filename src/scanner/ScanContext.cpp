/**
 * @file ScanContext.cpp
 * @brief Cancellation token implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/scanner/ScanContext.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace radarscope {

namespace {

// Granularity at which waiters notice a cancelled parent
constexpr std::chrono::milliseconds kParentPollInterval(10);

}  // anonymous namespace

struct ScanContext::State {
    std::shared_ptr<State> parent;
    bool hasDeadline = false;
    TimePoint deadline = TimePoint::max();

    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;

    bool ownDeadlinePassed() const {
        return hasDeadline && SteadyClock::now() >= deadline;
    }
};

ScanContext::ScanContext()
    : state_(std::make_shared<State>()) {
}

ScanContext::ScanContext(std::shared_ptr<State> state)
    : state_(std::move(state)) {
}

ScanContext ScanContext::withTimeout(const ScanContext& parent, double seconds) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    state->hasDeadline = true;

    auto span = std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::duration<double>(std::max(0.0, seconds)));
    state->deadline = SteadyClock::now() + span;

    return ScanContext(std::move(state));
}

ScanContext ScanContext::withCancel(const ScanContext& parent) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    return ScanContext(std::move(state));
}

void ScanContext::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool ScanContext::isCancelled() const {
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load() || s->ownDeadlinePassed()) {
            return true;
        }
    }
    return false;
}

bool ScanContext::deadlineExceeded() const {
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) return false;
        if (s->ownDeadlinePassed()) return true;
    }
    return false;
}

bool ScanContext::hasDeadline() const {
    return deadline() != TimePoint::max();
}

ScanContext::TimePoint ScanContext::deadline() const {
    TimePoint earliest = TimePoint::max();
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->hasDeadline) {
            earliest = std::min(earliest, s->deadline);
        }
    }
    return earliest;
}

double ScanContext::remainingSeconds() const {
    TimePoint end = deadline();
    if (end == TimePoint::max()) {
        return 1e12;
    }
    auto now = SteadyClock::now();
    if (now >= end) {
        return 0.0;
    }
    return std::chrono::duration<double>(end - now).count();
}

bool ScanContext::waitFor(double seconds) const {
    auto span = std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::duration<double>(std::max(0.0, seconds)));
    const TimePoint wakeAt = SteadyClock::now() + span;

    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
        if (isCancelled()) {
            return false;
        }
        auto now = SteadyClock::now();
        if (now >= wakeAt) {
            return true;
        }

        TimePoint poll = now + std::chrono::duration_cast<SteadyClock::duration>(kParentPollInterval);
        TimePoint next = std::min({wakeAt, deadline(), poll});
        state_->cv.wait_until(lock, next);
    }
}

} // namespace radarscope

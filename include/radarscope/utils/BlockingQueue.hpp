/**
 * @file BlockingQueue.hpp
 * @brief Unbounded thread-safe FIFO with timed pop
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_UTILS_BLOCKINGQUEUE_HPP
#define RADARSCOPE_UTILS_BLOCKINGQUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace radarscope {

/**
 * @brief Multi-producer result channel
 *
 * Producers never block. Consumers wait with a timeout so that a
 * producer which never reports cannot stall them.
 */
template <typename T>
class BlockingQueue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    /**
     * @brief Pop the oldest item, waiting at most @p timeout
     *
     * @return false if nothing arrived in time
     */
    template <typename Rep, typename Period>
    bool popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
};

} // namespace radarscope

#endif // RADARSCOPE_UTILS_BLOCKINGQUEUE_HPP

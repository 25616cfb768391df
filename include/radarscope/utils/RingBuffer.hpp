/**
 * @file RingBuffer.hpp
 * @brief Fixed-capacity ring buffer that overwrites its oldest element
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_UTILS_RINGBUFFER_HPP
#define RADARSCOPE_UTILS_RINGBUFFER_HPP

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace radarscope {

/**
 * @brief Bounded FIFO with O(1) push
 *
 * Elements are indexed oldest (0) to newest (size() - 1). Pushing into a
 * full buffer drops the oldest element. Not thread-safe; owners serialize
 * access.
 */
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity = 20)
        : data_(capacity > 0 ? capacity : 1) {}

    void push(const T& item) {
        data_[head_] = item;
        head_ = (head_ + 1) % data_.size();
        if (count_ < data_.size()) {
            count_++;
        }
    }

    /**
     * @brief Element by age, 0 is the oldest
     */
    const T& operator[](size_t i) const {
        return data_[(tail() + i) % data_.size()];
    }

    const T& at(size_t i) const {
        if (i >= count_) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return (*this)[i];
    }

    const T& front() const { return at(0); }
    const T& back() const { return at(count_ - 1); }

    size_t size() const { return count_; }
    size_t capacity() const { return data_.size(); }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == data_.size(); }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

    /**
     * @brief Copy contents out, oldest first
     */
    std::vector<T> toVector() const {
        std::vector<T> out;
        out.reserve(count_);
        for (size_t i = 0; i < count_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

private:
    size_t tail() const {
        return (head_ + data_.size() - count_) % data_.size();
    }

    std::vector<T> data_;
    size_t head_ = 0;
    size_t count_ = 0;
};

} // namespace radarscope

#endif // RADARSCOPE_UTILS_RINGBUFFER_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace alertwatch {

/**
 * @brief Fixed-capacity FIFO of error/non-error observations
 *
 * Ring buffer over a pre-sized vector. push() appends at the tail and,
 * once full, overwrites the oldest slot. The error count is maintained
 * incrementally so rate() is O(1).
 *
 * Invariant: size() <= capacity()
 */
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity) : slots_(capacity, 0) {
        if (capacity == 0) {
            throw std::invalid_argument("RollingWindow capacity must be positive");
        }
    }

    void push(bool is_error) {
        if (size_ == slots_.size()) {
            error_count_ -= slots_[next_];  // evict oldest
        } else {
            ++size_;
        }
        slots_[next_] = is_error ? 1 : 0;
        error_count_ += slots_[next_];
        next_ = (next_ + 1) % slots_.size();
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t capacity() const { return slots_.size(); }
    [[nodiscard]] bool full() const { return size_ == slots_.size(); }
    [[nodiscard]] size_t error_count() const { return error_count_; }

    /// Errors over capacity; only meaningful once full()
    [[nodiscard]] double rate() const {
        return static_cast<double>(error_count_) / static_cast<double>(slots_.size());
    }

private:
    std::vector<uint8_t> slots_;
    size_t size_ = 0;
    size_t next_ = 0;         // slot written by the next push()
    size_t error_count_ = 0;
};

} // namespace alertwatch

#pragma once

#include <cstddef>
#include <vector>

/// Fixed-capacity circular buffer. Pushing into a full buffer overwrites
/// the oldest element.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : slots_(capacity > 0 ? capacity : 1) {}

    void push(const T& value) {
        slots_[head_] = value;
        head_ = (head_ + 1) % slots_.size();
        if (size_ < slots_.size()) ++size_;
    }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

    /// Element by age: 0 is the oldest retained element.
    const T& at(std::size_t i) const {
        std::size_t start = (head_ + slots_.size() - size_) % slots_.size();
        return slots_[(start + i) % slots_.size()];
    }

    const T& newest() const { return at(size_ - 1); }

    /// Copy out in oldest-to-newest order
    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i) out.push_back(at(i));
        return out;
    }

private:
    std::vector<T> slots_;
    std::size_t head_ = 0;
    std::size_t size_ = 0;
};

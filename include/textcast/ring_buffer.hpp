#pragma once
#include <cstddef>
#include <vector>

namespace textcast {

// Fixed-capacity ring; push() overwrites the oldest element once full.
// Not synchronized.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

    void push(T value) {
        slots_[head_] = std::move(value);
        head_ = (head_ + 1) % slots_.size();
        if (size_ < slots_.size()) ++size_;
    }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    // Oldest first.
    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size_);
        std::size_t start = (head_ + slots_.size() - size_) % slots_.size();
        for (std::size_t i = 0; i < size_; ++i) {
            out.push_back(slots_[(start + i) % slots_.size()]);
        }
        return out;
    }

private:
    std::vector<T> slots_;
    std::size_t head_{0};
    std::size_t size_{0};
};

} // namespace textcast

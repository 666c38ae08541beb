#pragma once

#include <cstddef>
#include <vector>

namespace srvkeeper {

// Fixed capacity FIFO that overwrites the oldest entry. Not synchronized: owned by the single
// orchestrator thread.
template <typename T>
class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity), buffer_(capacity_) {}

    void Push(T value) {
        buffer_[(head_ + size_) % capacity_] = std::move(value);
        if (size_ < capacity_) {
            ++size_;
        } else {
            head_ = (head_ + 1) % capacity_;
        }
    }

    // Oldest first.
    std::vector<T> Snapshot() const { return Latest(size_); }

    // The newest `count` entries, oldest first.
    std::vector<T> Latest(std::size_t count) const {
        if (count > size_) {
            count = size_;
        }
        std::vector<T> out;
        out.reserve(count);
        for (std::size_t i = size_ - count; i < size_; ++i) {
            out.push_back(buffer_[(head_ + i) % capacity_]);
        }
        return out;
    }

    void Clear() {
        head_ = 0;
        size_ = 0;
    }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return size_ == 0; }

  private:
    std::size_t capacity_;
    std::vector<T> buffer_;
    std::size_t head_ = 0;
    std::size_t size_ = 0;
};

}  // namespace srvkeeper

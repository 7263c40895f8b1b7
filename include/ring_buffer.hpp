#pragma once
#include <cstddef>
#include <vector>

// Fixed-capacity window of the most recent values of every channel, used for plots.
class RingBuffer {
public:
    static const size_t DEFAULT_CAPACITY = 64;

    explicit RingBuffer(size_t dim = 0, size_t capacity = DEFAULT_CAPACITY);

    void reset(size_t dim);
    void reset();
    // Rejects a sample with fewer than dim() values; extra values are ignored.
    bool add(const std::vector<float>& values);

    // Oldest-first copies, they do not follow later add() calls.
    std::vector<float> get(size_t channel) const;
    std::vector<std::vector<float> > getAll() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t dim() const { return buffer_.size(); }

private:
    std::vector<std::vector<float> > buffer_;
    size_t capacity_;
    size_t head_;
    size_t tail_;
    bool full_;
};

#include "../include/ring_buffer.hpp"

const size_t RingBuffer::DEFAULT_CAPACITY;

RingBuffer::RingBuffer(size_t dim, size_t capacity)
    : capacity_(capacity ? capacity : DEFAULT_CAPACITY), head_(0), tail_(0), full_(false) {
    reset(dim);
}

void RingBuffer::reset(size_t dim) {
    buffer_.assign(dim, std::vector<float>(capacity_, 0.0f));
    reset();
}

void RingBuffer::reset() {
    head_ = tail_ = 0;
    full_ = false;
}

bool RingBuffer::add(const std::vector<float>& values) {
    if (values.size() < dim()) return false;
    for (size_t i = 0; i < dim(); ++i) {
        buffer_[i][head_] = values[i];
    }
    if (full_) tail_ = (tail_ + 1) % capacity_;
    head_ = (head_ + 1) % capacity_;
    full_ = head_ == tail_;
    return true;
}

std::vector<float> RingBuffer::get(size_t channel) const {
    std::vector<float> out;
    if (channel >= dim()) return out;
    size_t entries = size();
    out.reserve(entries);
    for (size_t i = 0; i < entries; ++i) {
        out.push_back(buffer_[channel][(tail_ + i) % capacity_]);
    }
    return out;
}

std::vector<std::vector<float> > RingBuffer::getAll() const {
    std::vector<std::vector<float> > out;
    out.reserve(dim());
    for (size_t i = 0; i < dim(); ++i) {
        out.push_back(get(i));
    }
    return out;
}

size_t RingBuffer::size() const {
    if (full_) return capacity_;
    if (head_ >= tail_) return head_ - tail_;
    return capacity_ - tail_ + head_;
}

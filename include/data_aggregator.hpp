#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "types.hpp"

// Running min/mean/max per channel over an unbounded number of samples.
//
// max starts at 0 rather than -inf: a channel that only ever reads negative
// values reports max = 0. Downstream logs rely on this, keep it.
class DataAggregator {
public:
    explicit DataAggregator(size_t dim = 0);

    void reset(size_t dim);
    void reset();
    // Values beyond dim() are ignored, missing trailing channels are left untouched.
    void add(const std::vector<float>& values);

    size_t dim() const { return min_.size(); }
    uint32_t count() const { return count_; }

    // All getters return false and leave the output alone while count() == 0.
    bool get(ResultSet& out) const;
    bool get(size_t channel, ChannelResult& out) const;
    bool getMean(std::vector<double>& out) const;

private:
    uint32_t count_ = 0;
    std::vector<double> min_;
    std::vector<double> sum_;
    std::vector<double> max_;
};

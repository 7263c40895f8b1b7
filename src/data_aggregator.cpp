#include "../include/data_aggregator.hpp"
#include <limits>

DataAggregator::DataAggregator(size_t dim) {
    reset(dim);
}

void DataAggregator::reset(size_t dim) {
    count_ = 0;
    min_.assign(dim, std::numeric_limits<double>::infinity());
    sum_.assign(dim, 0.0);
    max_.assign(dim, 0.0);
}

void DataAggregator::reset() {
    reset(dim());
}

void DataAggregator::add(const std::vector<float>& values) {
    count_++;
    size_t n = values.size() < dim() ? values.size() : dim();
    for (size_t i = 0; i < n; ++i) {
        double v = values[i];
        sum_[i] += v;
        if (v < min_[i]) min_[i] = v;
        if (v > max_[i]) max_[i] = v;
    }
}

bool DataAggregator::get(ResultSet& out) const {
    if (count_ == 0) return false;
    ResultSet result(dim());
    for (size_t i = 0; i < dim(); ++i) {
        get(i, result[i]);
    }
    out.swap(result);
    return true;
}

bool DataAggregator::get(size_t channel, ChannelResult& out) const {
    if (count_ == 0 || channel >= dim()) return false;
    out.min = (float)min_[channel];
    out.mean = (float)(sum_[channel] / count_);
    out.max = (float)max_[channel];
    return true;
}

bool DataAggregator::getMean(std::vector<double>& out) const {
    if (count_ == 0) return false;
    out.resize(dim());
    for (size_t i = 0; i < dim(); ++i) {
        out[i] = sum_[i] / count_;
    }
    return true;
}

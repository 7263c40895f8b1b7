#pragma once
#include <stdint.h>
#include "sample_source.hpp"

class Clock;
class ConfigManager;

// Synthetic source: slowly rising sine/cosine values, 2 or 3 channels.
// With an unbounded duration it reports end of stream after one minute.
class FakeSource : public SampleSource {
public:
    static const uint64_t READ_DELAY_US = 10000;
    static const uint64_t UNBOUNDED_LIMIT_US = 60000000;

    FakeSource(Clock* clock, ConfigManager* config, size_t dim = 3);

    void reset() override;
    ReadResult read(std::vector<float>& values) override;
    size_t channelCount() const override { return dim_; }
    std::vector<std::string> channelUnits() const override;
    std::vector<int> channelDecimals() const override;

private:
    Clock* clock_;
    ConfigManager* config_;
    size_t dim_;
    bool started_;
    uint64_t start_us_;
};

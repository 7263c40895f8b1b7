#include "../include/fake_source.hpp"
#include "../include/clock.hpp"
#include "../include/config_manager.hpp"
#include <cmath>

const uint64_t FakeSource::READ_DELAY_US;
const uint64_t FakeSource::UNBOUNDED_LIMIT_US;

FakeSource::FakeSource(Clock* clock, ConfigManager* config, size_t dim)
    : clock_(clock), config_(config), dim_(dim == 2 ? 2 : 3), started_(false), start_us_(0) {}

void FakeSource::reset() {
    started_ = false;
}

std::vector<std::string> FakeSource::channelUnits() const {
    std::vector<std::string> units;
    if (dim_ == 3) units.push_back("V");
    units.push_back("V");
    units.push_back("mA");
    return units;
}

std::vector<int> FakeSource::channelDecimals() const {
    std::vector<int> decimals;
    decimals.push_back(2);
    decimals.push_back(1);
    if (dim_ == 3) decimals.push_back(1);
    return decimals;
}

ReadResult FakeSource::read(std::vector<float>& values) {
    clock_->sleepMicros(READ_DELAY_US);
    uint64_t now = clock_->micros();
    if (!started_) {
        started_ = true;
        start_us_ = now;
    }
    if (config_->getAcquisitionSettings().duration == 0 && now - start_us_ > UNBOUNDED_LIMIT_US) {
        return ReadResult::END_OF_STREAM;
    }

    double t = (double)(now - start_us_) / 1e6;
    values.clear();
    if (dim_ == 3) values.push_back((float)(1.0 + t / 100.0 + std::sin(t)));
    values.push_back((float)(5.0 + t / 10.0 + std::sin(t)));
    values.push_back((float)(25.0 + t / 10.0 + std::cos(t)));
    return ReadResult::OK;
}

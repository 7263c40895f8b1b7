#include "../include/host_platform.hpp"
#include <chrono>
#include <cstdio>
#include <thread>

namespace {

std::chrono::steady_clock::time_point clockOrigin() {
    static const std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
    return origin;
}

class ConsoleValuesView : public ValuesView {
public:
    explicit ConsoleValuesView(const std::vector<std::string>& units) : units_(units) {}
    void setValues(const std::vector<float>& values, float elapsed) override {
        text_.clear();
        for (size_t i = 0; i < values.size() && i < units_.size(); i++) {
            if (i) text_ += "  ";
            text_ += formatValue(values[i], units_[i]);
        }
        if (elapsed >= 0.0f) text_ += "  @" + formatValue(elapsed, "s");
    }
    void clearValues() override {
        text_.clear();
        for (size_t i = 0; i < units_.size(); i++) {
            if (i) text_ += "  ";
            text_ += units_[i];
        }
    }
    void setUnits(const std::vector<std::string>& units) override { units_ = units; }
    void show() override { printf("#display: %s\n", text_.c_str()); }
private:
    std::vector<std::string> units_;
    std::string text_;
};

class ConsolePlotView : public PlotView {
public:
    explicit ConsolePlotView(const std::string& unit) : unit_(unit) {}
    void setSeries(const std::vector<float>& series) override { series_ = series; }
    void reset() override { series_.clear(); }
    void show() override {
        if (series_.empty()) {
            printf("#display: plot %s (empty)\n", unit_.c_str());
            return;
        }
        float lo = series_[0];
        float hi = series_[0];
        for (size_t i = 1; i < series_.size(); i++) {
            if (series_[i] < lo) lo = series_[i];
            if (series_[i] > hi) hi = series_[i];
        }
        printf("#display: plot %u points, last %s, range %s..%s\n", (unsigned)series_.size(),
               formatValue(series_.back(), unit_).c_str(), formatValue(lo, unit_).c_str(),
               formatValue(hi, unit_).c_str());
    }
private:
    std::string unit_;
    std::vector<float> series_;
};

class ConsoleResultView : public ResultView {
public:
    explicit ConsoleResultView(const std::string& unit) : unit_(unit), min_(0), mean_(0), max_(0) {}
    void setValues(float min, float mean, float max) override { min_ = min; mean_ = mean; max_ = max; }
    void show() override {
        printf("#display: min: %s  mean: %s  max: %s\n", formatValue(min_, unit_).c_str(),
               formatValue(mean_, unit_).c_str(), formatValue(max_, unit_).c_str());
    }
private:
    std::string unit_;
    float min_;
    float mean_;
    float max_;
};

class ConsoleConfigView : public ConfigView {
public:
    ConsoleConfigView(const std::string& heading, const std::string& unit) : heading_(heading), unit_(unit) {}
    void setValue(const std::string& value) override { value_ = value; }
    void setUnit(const std::string& unit) override { unit_ = unit; }
    void show() override { printf("#display: %s %s%s\n", heading_.c_str(), value_.c_str(), unit_.c_str()); }
private:
    std::string heading_;
    std::string unit_;
    std::string value_;
};

}

SteadyClock::SteadyClock() {
    clockOrigin();
}

uint64_t SteadyClock::micros() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - clockOrigin()).count();
}

void SteadyClock::sleepMicros(uint64_t us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

bool StdoutLogSink::write(const std::string& line) {
    return fputs(line.c_str(), stdout) >= 0;
}

void StdoutLogSink::close() {
    fflush(stdout);
}

ValuesView* ConsoleDisplay::createValuesView(const std::vector<std::string>& units) {
    return new ConsoleValuesView(units);
}

PlotView* ConsoleDisplay::createPlotView(const std::string& unit) {
    return new ConsolePlotView(unit);
}

ResultView* ConsoleDisplay::createResultView(const std::string& unit) {
    return new ConsoleResultView(unit);
}

ConfigView* ConsoleDisplay::createConfigView(const std::string& heading, const std::string& unit) {
    return new ConsoleConfigView(heading, unit);
}

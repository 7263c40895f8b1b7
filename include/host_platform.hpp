#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "clock.hpp"
#include "log_writer.hpp"
#include "view.hpp"

// Collaborators for running the instrument on a development machine.

class SteadyClock : public Clock {
public:
    SteadyClock();
    uint64_t micros() override;
    void sleepMicros(uint64_t us) override;
};

// Data log on stdout, the way the device writes it to its serial port.
class StdoutLogSink : public LogSink {
public:
    bool write(const std::string& line) override;
    void close() override;
};

// Prints every shown page as one text line.
class ConsoleDisplay : public Display {
public:
    ValuesView* createValuesView(const std::vector<std::string>& units) override;
    PlotView* createPlotView(const std::string& unit) override;
    ResultView* createResultView(const std::string& unit) override;
    ConfigView* createConfigView(const std::string& heading, const std::string& unit) override;
};

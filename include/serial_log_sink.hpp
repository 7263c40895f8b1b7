#pragma once
#include "log_writer.hpp"

// Data log on the USB serial port, shared with the diagnostics.
class SerialLogSink : public LogSink {
public:
    bool write(const std::string& line) override;
    void close() override;
};

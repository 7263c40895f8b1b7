#include "../include/serial_log_sink.hpp"
#include <Arduino.h>

bool SerialLogSink::write(const std::string& line) {
    return Serial.write((const uint8_t*)line.data(), line.size()) == line.size();
}

void SerialLogSink::close() {
    Serial.flush();
}

#pragma once
#include "clock.hpp"

// Microsecond clock of the ESP32 high resolution timer.
class ArduinoClock : public Clock {
public:
    uint64_t micros() override;
    void sleepMicros(uint64_t us) override;
};

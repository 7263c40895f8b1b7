#pragma once
#include <cstdint>

// Monotonic time source and the only place where the acquisition loop may suspend.
class Clock {
public:
    virtual ~Clock() {}
    virtual uint64_t micros() = 0;
    virtual void sleepMicros(uint64_t us) = 0;

    uint32_t millis() { return (uint32_t)(micros() / 1000ULL); }
};

#include "../include/arduino_clock.hpp"
#include <Arduino.h>
#include <esp_timer.h>

uint64_t ArduinoClock::micros() {
    return (uint64_t)esp_timer_get_time();
}

void ArduinoClock::sleepMicros(uint64_t us) {
    // delay() yields to the idle task, delayMicroseconds() busy-waits
    if (us >= 1000) {
        delay((uint32_t)(us / 1000));
    }
    uint32_t rest = (uint32_t)(us % 1000);
    if (rest) {
        delayMicroseconds(rest);
    }
}

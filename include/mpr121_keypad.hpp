#pragma once
#include <stdint.h>
#include "config_manager.hpp"
#include "key_input.hpp"

class Adafruit_MPR121;
class Clock;

/**
 * @brief 4x3 capacitive keypad on an MPR121.
 *
 * Pads are mapped to keys per keymap and orientation. The config keymap has
 * a SHIFT layer for '0' and '.', toggled by the SHIFT pad inside wait().
 */
class Mpr121Keypad : public KeyInput {
public:
    static const size_t NUM_PADS = 12;
    static const uint64_t DEBOUNCE_US = 200000;
    static const uint64_t WAIT_POLL_US = 10000;

    Mpr121Keypad(Clock* clock, KeypadOrientation orientation);
    ~Mpr121Keypad();

    bool begin();

    Key poll(KeyMap keymap) override;
    Key wait(KeyMap keymap) override;

private:
    Clock* clock_;
    Adafruit_MPR121* mpr_;
    KeypadOrientation orientation_;
    int last_pad_;
    uint64_t last_us_;

    // pad index with debounce, -1 if nothing new is touched
    int touchedPad();
    const Key* table(KeyMap keymap) const;
    const Key* shiftTable() const;
};

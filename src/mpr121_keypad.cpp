#include "../include/mpr121_keypad.hpp"
#include "../include/clock.hpp"
#include "../include/logger.hpp"
#include <Adafruit_MPR121.h>

const size_t Mpr121Keypad::NUM_PADS;
const uint64_t Mpr121Keypad::DEBOUNCE_US;
const uint64_t Mpr121Keypad::WAIT_POLL_US;

namespace {

const Key N = Key::NONE;

// Index = pad number.
const Key READY_P[12] = {Key::START, N, N, N, Key::CONFIG, N, Key::TOGGLE, N, Key::EXIT, N, N, N};
const Key ACTIVE_P[12] = {N, N, N, N, N, N, Key::TOGGLE, N, Key::STOP, N, N, N};
const Key CONFIG_P[12] = {
    Key::NEXT, Key::DIGIT_7, Key::DIGIT_4, Key::DIGIT_1,
    Key::SHIFT, Key::DIGIT_8, Key::DIGIT_5, Key::DIGIT_2,
    Key::CLR, Key::DIGIT_9, Key::DIGIT_6, Key::DIGIT_3
};
const Key SHIFT_P[12] = {Key::NEXT, N, N, N, Key::SHIFT, Key::DIGIT_0, N, N, Key::CLR, Key::DOT, N, N};

const Key READY_L[12] = {Key::EXIT, N, N, N, Key::CONFIG, N, Key::TOGGLE, N, Key::START, N, N, N};
const Key ACTIVE_L[12] = {Key::STOP, N, N, N, N, N, Key::TOGGLE, N, N, N, N, N};
const Key CONFIG_L[12] = {
    Key::CLR, Key::DIGIT_9, Key::DIGIT_8, Key::DIGIT_7,
    Key::SHIFT, Key::DIGIT_6, Key::DIGIT_5, Key::DIGIT_4,
    Key::NEXT, Key::DIGIT_3, Key::DIGIT_2, Key::DIGIT_1
};
const Key SHIFT_L[12] = {Key::CLR, Key::DOT, Key::DIGIT_0, N, Key::SHIFT, N, N, N, Key::NEXT, N, N, N};

}  // namespace

Mpr121Keypad::Mpr121Keypad(Clock* clock, KeypadOrientation orientation)
    : clock_(clock), mpr_(new Adafruit_MPR121()), orientation_(orientation), last_pad_(-1), last_us_(0) {}

Mpr121Keypad::~Mpr121Keypad() {
    delete mpr_;
}

bool Mpr121Keypad::begin() {
    if (!mpr_->begin()) {
        Logger::error("[Keypad] MPR121 not found");
        return false;
    }
    Logger::info("[Keypad] MPR121 ready (%s)",
                 orientation_ == KeypadOrientation::LANDSCAPE ? "landscape" : "portrait");
    return true;
}

const Key* Mpr121Keypad::table(KeyMap keymap) const {
    bool landscape = orientation_ == KeypadOrientation::LANDSCAPE;
    switch (keymap) {
        case KeyMap::READY: return landscape ? READY_L : READY_P;
        case KeyMap::ACTIVE: return landscape ? ACTIVE_L : ACTIVE_P;
        case KeyMap::CONFIG: return landscape ? CONFIG_L : CONFIG_P;
    }
    return READY_P;
}

const Key* Mpr121Keypad::shiftTable() const {
    return orientation_ == KeypadOrientation::LANDSCAPE ? SHIFT_L : SHIFT_P;
}

int Mpr121Keypad::touchedPad() {
    uint16_t touched = mpr_->touched();
    if (!touched) return -1;

    int pad = 0;
    while (pad < (int)NUM_PADS && !(touched & (1 << pad))) pad++;
    if (pad >= (int)NUM_PADS) return -1;

    uint64_t now = clock_->micros();
    if (pad == last_pad_ && now < last_us_ + DEBOUNCE_US) {
        return -1;
    }
    last_pad_ = pad;
    last_us_ = now;
    return pad;
}

Key Mpr121Keypad::poll(KeyMap keymap) {
    int pad = touchedPad();
    if (pad < 0) return Key::NONE;
    Key key = table(keymap)[pad];
    return key == Key::SHIFT ? Key::NONE : key;
}

Key Mpr121Keypad::wait(KeyMap keymap) {
    const Key* normal = table(keymap);
    const Key* current = normal;
    bool shift = false;

    while (true) {
        int pad = touchedPad();
        if (pad < 0 || current[pad] == Key::NONE) {
            clock_->sleepMicros(WAIT_POLL_US);
            continue;
        }
        if (current[pad] != Key::SHIFT) {
            Logger::debug("[Keypad] pad %d -> %s", pad, keyToString(current[pad]));
            return current[pad];
        }
        shift = !shift;
        current = shift ? shiftTable() : normal;
    }
}

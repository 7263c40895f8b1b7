#include "../include/key_input.hpp"

const char* keyToString(Key key) {
    switch (key) {
        case Key::NONE: return "NONE";
        case Key::START: return "START";
        case Key::CONFIG: return "CONFIG";
        case Key::TOGGLE: return "TOGGLE";
        case Key::EXIT: return "EXIT";
        case Key::STOP: return "STOP";
        case Key::NEXT: return "NEXT";
        case Key::CLR: return "CLR";
        case Key::SHIFT: return "SHIFT";
        case Key::DOT: return ".";
        case Key::DIGIT_0: return "0";
        case Key::DIGIT_1: return "1";
        case Key::DIGIT_2: return "2";
        case Key::DIGIT_3: return "3";
        case Key::DIGIT_4: return "4";
        case Key::DIGIT_5: return "5";
        case Key::DIGIT_6: return "6";
        case Key::DIGIT_7: return "7";
        case Key::DIGIT_8: return "8";
        case Key::DIGIT_9: return "9";
    }
    return "UNKNOWN";
}

#pragma once

enum class Key {
    NONE,
    START,
    CONFIG,
    TOGGLE,
    EXIT,
    STOP,
    NEXT,
    CLR,
    SHIFT,
    DOT,
    DIGIT_0,
    DIGIT_1,
    DIGIT_2,
    DIGIT_3,
    DIGIT_4,
    DIGIT_5,
    DIGIT_6,
    DIGIT_7,
    DIGIT_8,
    DIGIT_9
};

enum class KeyMap {
    READY,
    ACTIVE,
    CONFIG
};

class KeyInput {
public:
    virtual ~KeyInput() {}
    // Non-blocking, Key::NONE when nothing from keymap is pressed.
    virtual Key poll(KeyMap keymap) = 0;
    // Blocks until a key from keymap is pressed, only used outside sessions.
    virtual Key wait(KeyMap keymap) = 0;
};

inline bool isDigitKey(Key key) {
    return key >= Key::DIGIT_0 && key <= Key::DIGIT_9;
}

inline char keyChar(Key key) {
    if (isDigitKey(key)) return (char)('0' + ((int)key - (int)Key::DIGIT_0));
    if (key == Key::DOT) return '.';
    return '\0';
}

inline Key digitKey(int digit) {
    return (Key)((int)Key::DIGIT_0 + digit);
}

const char* keyToString(Key key);

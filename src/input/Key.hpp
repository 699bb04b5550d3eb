#pragma once

#include <cstdint>

#include "../helpers/Memory.hpp"

enum eKeyCode : uint8_t {
    INPUT_KEY_NONE = 0,
    INPUT_KEY_CHAR,
    INPUT_KEY_ENTER,
    INPUT_KEY_ESCAPE,
    INPUT_KEY_BACKSPACE,
    INPUT_KEY_DELETE,
    INPUT_KEY_TAB,
    INPUT_KEY_BACKTAB,
    INPUT_KEY_LEFT,
    INPUT_KEY_RIGHT,
    INPUT_KEY_UP,
    INPUT_KEY_DOWN,
    INPUT_KEY_HOME,
    INPUT_KEY_END,
    INPUT_KEY_FUNCTION,
};

struct SKeyEvent {
    eKeyCode code = INPUT_KEY_NONE;
    char32_t ch   = 0; // INPUT_KEY_CHAR: the character, INPUT_KEY_FUNCTION: the F-key number
    bool     ctrl = false;

    static SKeyEvent character(char32_t c) {
        return SKeyEvent{.code = INPUT_KEY_CHAR, .ch = c};
    }

    static SKeyEvent control(char c) {
        return SKeyEvent{.code = INPUT_KEY_CHAR, .ch = sc<char32_t>(c), .ctrl = true};
    }

    static SKeyEvent special(eKeyCode code) {
        return SKeyEvent{.code = code};
    }

    static SKeyEvent function(uint8_t n) {
        return SKeyEvent{.code = INPUT_KEY_FUNCTION, .ch = n};
    }

    bool isChar(char32_t c) const {
        return code == INPUT_KEY_CHAR && !ctrl && ch == c;
    }

    bool isCtrl(char c) const {
        return code == INPUT_KEY_CHAR && ctrl && ch == sc<char32_t>(c);
    }

    bool isFunction(uint8_t n) const {
        return code == INPUT_KEY_FUNCTION && ch == n;
    }

    bool isPrintable() const {
        return code == INPUT_KEY_CHAR && !ctrl && ch >= 0x20 && ch != 0x7F;
    }
};

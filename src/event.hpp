#pragma once

#include <cstdint>
#include <variant>

namespace panedash {

enum class KeyCode {
    Char,       // printable character, see KeyEvent::ch
    Esc,
    Enter,
    Tab,
    BackTab,
    Backspace,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    Delete,
    F,          // function key, number in KeyEvent::ch
    Unknown
};

enum KeyModifiers : uint8_t {
    KEY_MOD_NONE = 0,
    KEY_MOD_SHIFT = 1 << 0,
    KEY_MOD_CONTROL = 1 << 1,
    KEY_MOD_ALT = 1 << 2,
};

enum class KeyEventKind {
    Press,
    Repeat,
    Release
};

struct KeyEvent {
    KeyCode code = KeyCode::Unknown;
    char32_t ch = 0;
    uint8_t modifiers = KEY_MOD_NONE;
    KeyEventKind kind = KeyEventKind::Press;

    static KeyEvent character(char32_t c, uint8_t mods = KEY_MOD_NONE,
                              KeyEventKind kind = KeyEventKind::Press) {
        return KeyEvent{KeyCode::Char, c, mods, kind};
    }
    static KeyEvent key(KeyCode code, uint8_t mods = KEY_MOD_NONE,
                        KeyEventKind kind = KeyEventKind::Press) {
        return KeyEvent{code, 0, mods, kind};
    }
};

struct MouseEvent {
    uint16_t column = 0;
    uint16_t row = 0;
    uint32_t buttons = 0;  // backend-specific button/state bits
};

struct ResizeEvent {
    uint16_t columns = 0;
    uint16_t rows = 0;
};

using Event = std::variant<KeyEvent, MouseEvent, ResizeEvent>;

} // namespace panedash

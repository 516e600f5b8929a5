#pragma once

#include "../event.hpp"

namespace panedash {

// Decodes one character read from a terminal in raw mode. Control bytes
// become the matching letter with the Control modifier; tab, enter,
// backspace and escape become their key codes.
[[nodiscard]] KeyEvent decode_key_char(char32_t ch);

// Same, for a character that arrived right after ESC (Alt+key)
[[nodiscard]] KeyEvent decode_alt_key_char(char32_t ch);

} // namespace panedash

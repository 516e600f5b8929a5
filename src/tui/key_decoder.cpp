#include "key_decoder.hpp"

namespace panedash {

namespace {

constexpr char32_t kNul = 0x00;
constexpr char32_t kBackspace = 0x08;
constexpr char32_t kTab = 0x09;
constexpr char32_t kLineFeed = 0x0A;
constexpr char32_t kCarriageReturn = 0x0D;
constexpr char32_t kEscape = 0x1B;
constexpr char32_t kDelete = 0x7F;

} // namespace

KeyEvent decode_key_char(char32_t ch) {
    switch (ch) {
        case kEscape:
            return KeyEvent::key(KeyCode::Esc);
        case kTab:
            return KeyEvent::key(KeyCode::Tab);
        case kLineFeed:
        case kCarriageReturn:
            return KeyEvent::key(KeyCode::Enter);
        case kBackspace:
        case kDelete:
            return KeyEvent::key(KeyCode::Backspace);
        case kNul:
            return KeyEvent::character(U' ', KEY_MOD_CONTROL);
        default:
            break;
    }

    // Ctrl+A .. Ctrl+Z
    if (ch >= 0x01 && ch <= 0x1A) {
        return KeyEvent::character(U'a' + (ch - 0x01), KEY_MOD_CONTROL);
    }
    if (ch < 0x20) {
        return KeyEvent::key(KeyCode::Unknown, KEY_MOD_CONTROL);
    }
    return KeyEvent::character(ch);
}

KeyEvent decode_alt_key_char(char32_t ch) {
    KeyEvent key = decode_key_char(ch);
    key.modifiers |= KEY_MOD_ALT;
    return key;
}

} // namespace panedash

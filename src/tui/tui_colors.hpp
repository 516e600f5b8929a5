#pragma once

#include <cstdint>

namespace panedash {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    static constexpr Color from_hex(uint32_t rgb) {
        return Color{static_cast<uint8_t>((rgb >> 16) & 0xFF),
                     static_cast<uint8_t>((rgb >> 8) & 0xFF),
                     static_cast<uint8_t>(rgb & 0xFF)};
    }

    constexpr bool operator==(const Color&) const = default;
};

// Tailwind slate tones
namespace slate {
inline constexpr Color c50 = Color::from_hex(0xf8fafc);
inline constexpr Color c100 = Color::from_hex(0xf1f5f9);
inline constexpr Color c200 = Color::from_hex(0xe2e8f0);
inline constexpr Color c300 = Color::from_hex(0xcbd5e1);
inline constexpr Color c400 = Color::from_hex(0x94a3b8);
inline constexpr Color c500 = Color::from_hex(0x64748b);
inline constexpr Color c600 = Color::from_hex(0x475569);
inline constexpr Color c700 = Color::from_hex(0x334155);
inline constexpr Color c800 = Color::from_hex(0x1e293b);
inline constexpr Color c900 = Color::from_hex(0x0f172a);
inline constexpr Color c950 = Color::from_hex(0x020617);
} // namespace slate

// Nearest xterm 256-colour palette index (16..255; the first 16 entries are
// terminal-defined and never chosen)
[[nodiscard]] int rgb_to_xterm256(Color c);

// Nearest of the 8 basic curses colours (COLOR_BLACK..COLOR_WHITE)
[[nodiscard]] int rgb_to_ansi8(Color c);

// Initialize ncurses colour support. Returns false when the terminal has
// no colours.
bool init_colors();

// Palette index for an RGB colour on the current terminal: xterm-256 when
// available, otherwise the basic 8 colours
[[nodiscard]] int palette_index(Color c);

} // namespace panedash

#pragma once

#include "tui_colors.hpp"
#include <cstdint>
#include <optional>

namespace panedash {

enum Modifier : uint8_t {
    MODIFIER_NONE = 0,
    MODIFIER_BOLD = 1 << 0,
    MODIFIER_DIM = 1 << 1,
    MODIFIER_UNDERLINE = 1 << 2,
    MODIFIER_REVERSE = 1 << 3,
};

// Cell style. Unset colours leave the underlying cell untouched when patched.
struct Style {
    std::optional<Color> fg;
    std::optional<Color> bg;
    uint8_t modifiers = MODIFIER_NONE;

    Style& with_fg(Color c) { fg = c; return *this; }
    Style& with_bg(Color c) { bg = c; return *this; }
    Style& with_modifier(uint8_t m) { modifiers |= m; return *this; }

    [[nodiscard]] Style patched(const Style& other) const {
        Style out = *this;
        if (other.fg) out.fg = other.fg;
        if (other.bg) out.bg = other.bg;
        out.modifiers |= other.modifiers;
        return out;
    }

    bool operator==(const Style&) const = default;
};

inline Style fg(Color c) { return Style{c, std::nullopt, MODIFIER_NONE}; }
inline Style bg(Color c) { return Style{std::nullopt, c, MODIFIER_NONE}; }

} // namespace panedash

#pragma once

#include "line.hpp"
#include <optional>

namespace panedash {

enum Borders : uint8_t {
    BORDERS_NONE = 0,
    BORDERS_TOP = 1 << 0,
    BORDERS_RIGHT = 1 << 1,
    BORDERS_BOTTOM = 1 << 2,
    BORDERS_LEFT = 1 << 3,
    BORDERS_ALL = BORDERS_TOP | BORDERS_RIGHT | BORDERS_BOTTOM | BORDERS_LEFT,
};

// Characters used to draw each part of a border
struct BorderSet {
    const char* top_left;
    const char* top_right;
    const char* bottom_left;
    const char* bottom_right;
    const char* vertical_left;
    const char* vertical_right;
    const char* horizontal_top;
    const char* horizontal_bottom;
};

namespace border {
inline constexpr BorderSet kPlain = {"┌", "┐", "└", "┘", "│", "│", "─", "─"};
inline constexpr BorderSet kThick = {"┏", "┓", "┗", "┛", "┃", "┃", "━", "━"};
inline constexpr BorderSet kFull = {"█", "█", "█", "█", "█", "█", "█", "█"};
} // namespace border

// Container with optional borders, a title on the top row and a background
class Block {
public:
    Block() = default;

    Block& borders(uint8_t b) { borders_ = b; return *this; }
    Block& border_set(const BorderSet& set) { border_set_ = set; return *this; }
    Block& border_style(const Style& s) { border_style_ = s; return *this; }
    Block& style(const Style& s) { style_ = s; return *this; }
    Block& bg(Color c) { style_.bg = c; return *this; }
    Block& title(Line line) { title_ = std::move(line); return *this; }

    [[nodiscard]] uint8_t get_borders() const { return borders_; }
    [[nodiscard]] const std::optional<Line>& get_title() const { return title_; }

    // Area left for content once borders and title are taken out
    [[nodiscard]] Rect inner(const Rect& area) const;

    void render(const Rect& area, Buffer& buf) const;

private:
    void render_borders(const Rect& area, Buffer& buf) const;
    void render_title(const Rect& area, Buffer& buf) const;

    uint8_t borders_ = BORDERS_NONE;
    BorderSet border_set_ = border::kPlain;
    Style border_style_;
    Style style_;
    std::optional<Line> title_;
};

} // namespace panedash

#pragma once

#include "../buffer.hpp"
#include <string>
#include <utility>

namespace panedash {

enum class Alignment {
    Left,
    Center,
    Right
};

// Single line of styled text
class Line {
public:
    Line() = default;
    explicit Line(std::string text) : text_(std::move(text)) {}

    Line& style(const Style& s) { style_ = s; return *this; }
    Line& fg(Color c) { style_.fg = c; return *this; }
    Line& bg(Color c) { style_.bg = c; return *this; }
    Line& alignment(Alignment a) { alignment_ = a; return *this; }
    Line& centered() { return alignment(Alignment::Center); }

    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] const Style& get_style() const { return style_; }
    [[nodiscard]] Alignment get_alignment() const { return alignment_; }

    // Width in columns
    [[nodiscard]] uint16_t width() const;

    // Draws on the first row of `area`; the whole row takes the line's style
    void render(const Rect& area, Buffer& buf) const;

private:
    std::string text_;
    Style style_;
    Alignment alignment_ = Alignment::Left;
};

} // namespace panedash

#pragma once

#include "style.hpp"
#include "../layout/rect.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace panedash {

struct Cell {
    std::string symbol = " ";  // one UTF-8 encoded, single-column character
    Style style;

    bool operator==(const Cell&) const = default;
};

// Grid of styled cells covering `area`. A frame is drawn into a buffer and
// the terminal backend writes the whole buffer out at once.
class Buffer {
public:
    Buffer() = default;
    explicit Buffer(const Rect& area);

    [[nodiscard]] const Rect& area() const { return area_; }

    // Cell at absolute coordinates; throws std::out_of_range outside the area
    [[nodiscard]] Cell& cell(uint16_t x, uint16_t y);
    [[nodiscard]] const Cell& cell(uint16_t x, uint16_t y) const;

    // Writes UTF-8 text starting at (x, y), one character per column, clipped
    // to the buffer. `max_width` limits the number of columns written.
    // Returns the column after the last one written.
    uint16_t set_string(uint16_t x, uint16_t y, std::string_view text, const Style& style,
                        uint16_t max_width = UINT16_MAX);

    // Patches the style of every cell in `rect` (clipped)
    void set_style(const Rect& rect, const Style& style);

    // Blanks every cell
    void reset();

    // Resizes to `area`, blanking all cells
    void resize(const Rect& area);

    // Text of one row, for diagnostics and tests
    [[nodiscard]] std::string row_text(uint16_t y) const;

private:
    [[nodiscard]] size_t index_of(uint16_t x, uint16_t y) const;

    Rect area_;
    std::vector<Cell> cells_;
};

// Splits UTF-8 text into single-character strings. Invalid bytes become U+FFFD.
[[nodiscard]] std::vector<std::string> split_utf8(std::string_view text);

} // namespace panedash

#pragma once

#include <algorithm>
#include <cstdint>

namespace panedash {

// Margin applied on each side of a rect
struct Margin {
    uint16_t horizontal = 0;
    uint16_t vertical = 0;

    constexpr Margin() = default;
    constexpr explicit Margin(uint16_t uniform) : horizontal(uniform), vertical(uniform) {}
    constexpr Margin(uint16_t h, uint16_t v) : horizontal(h), vertical(v) {}
};

// Rectangular area of the terminal, in cells. (x, y) is the top-left corner.
struct Rect {
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;

    [[nodiscard]] constexpr uint32_t area() const {
        return static_cast<uint32_t>(width) * height;
    }
    [[nodiscard]] constexpr bool is_empty() const { return width == 0 || height == 0; }

    // One past the last column / row
    [[nodiscard]] constexpr uint16_t right() const {
        return static_cast<uint16_t>(std::min<uint32_t>(uint32_t{x} + width, UINT16_MAX));
    }
    [[nodiscard]] constexpr uint16_t bottom() const {
        return static_cast<uint16_t>(std::min<uint32_t>(uint32_t{y} + height, UINT16_MAX));
    }

    [[nodiscard]] constexpr bool contains(uint16_t px, uint16_t py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }

    // True if `other` lies entirely inside this rect (empty rects count when
    // their origin is inside or on the edge)
    [[nodiscard]] constexpr bool contains(const Rect& other) const {
        return other.x >= x && other.y >= y &&
               other.right() <= right() && other.bottom() <= bottom();
    }

    [[nodiscard]] constexpr bool intersects(const Rect& other) const {
        return x < other.right() && other.x < right() &&
               y < other.bottom() && other.y < bottom();
    }

    // Shrinks the rect by the margin; saturates to an empty rect
    [[nodiscard]] constexpr Rect inner(Margin m) const {
        uint32_t dw = 2u * m.horizontal;
        uint32_t dh = 2u * m.vertical;
        if (width < dw || height < dh) {
            return Rect{x, y, 0, 0};
        }
        return Rect{static_cast<uint16_t>(x + m.horizontal),
                    static_cast<uint16_t>(y + m.vertical),
                    static_cast<uint16_t>(width - dw),
                    static_cast<uint16_t>(height - dh)};
    }

    // Clips this rect to `other`
    [[nodiscard]] constexpr Rect intersection(const Rect& other) const {
        uint16_t x1 = std::max(x, other.x);
        uint16_t y1 = std::max(y, other.y);
        uint16_t x2 = std::min(right(), other.right());
        uint16_t y2 = std::min(bottom(), other.bottom());
        if (x2 <= x1 || y2 <= y1) {
            return Rect{x1, y1, 0, 0};
        }
        return Rect{x1, y1, static_cast<uint16_t>(x2 - x1), static_cast<uint16_t>(y2 - y1)};
    }

    constexpr bool operator==(const Rect&) const = default;
};

} // namespace panedash

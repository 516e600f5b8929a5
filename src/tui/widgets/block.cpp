#include "block.hpp"
#include <algorithm>

namespace panedash {

Rect Block::inner(const Rect& area) const {
    uint32_t x = area.x;
    uint32_t y = area.y;
    uint32_t right = area.right();
    uint32_t bottom = area.bottom();

    if (borders_ & BORDERS_LEFT) x = std::min(x + 1, right);
    if (borders_ & BORDERS_RIGHT) right = std::max(right - (right > x ? 1u : 0u), x);
    if ((borders_ & BORDERS_TOP) || title_) y = std::min(y + 1, bottom);
    if (borders_ & BORDERS_BOTTOM) bottom = std::max(bottom - (bottom > y ? 1u : 0u), y);

    return Rect{static_cast<uint16_t>(x), static_cast<uint16_t>(y),
                static_cast<uint16_t>(right - x), static_cast<uint16_t>(bottom - y)};
}

void Block::render(const Rect& area, Buffer& buf) const {
    Rect r = area.intersection(buf.area());
    if (r.is_empty()) return;

    buf.set_style(r, style_);
    render_borders(r, buf);
    render_title(r, buf);
}

void Block::render_borders(const Rect& area, Buffer& buf) const {
    const uint16_t last_x = static_cast<uint16_t>(area.right() - 1);
    const uint16_t last_y = static_cast<uint16_t>(area.bottom() - 1);

    if (borders_ & BORDERS_LEFT) {
        for (uint16_t y = area.y; y < area.bottom(); ++y) {
            buf.set_string(area.x, y, border_set_.vertical_left, border_style_);
        }
    }
    if (borders_ & BORDERS_RIGHT) {
        for (uint16_t y = area.y; y < area.bottom(); ++y) {
            buf.set_string(last_x, y, border_set_.vertical_right, border_style_);
        }
    }
    if (borders_ & BORDERS_TOP) {
        for (uint16_t x = area.x; x < area.right(); ++x) {
            buf.set_string(x, area.y, border_set_.horizontal_top, border_style_);
        }
    }
    if (borders_ & BORDERS_BOTTOM) {
        for (uint16_t x = area.x; x < area.right(); ++x) {
            buf.set_string(x, last_y, border_set_.horizontal_bottom, border_style_);
        }
    }

    // Corners
    if ((borders_ & BORDERS_TOP) && (borders_ & BORDERS_LEFT)) {
        buf.set_string(area.x, area.y, border_set_.top_left, border_style_);
    }
    if ((borders_ & BORDERS_TOP) && (borders_ & BORDERS_RIGHT)) {
        buf.set_string(last_x, area.y, border_set_.top_right, border_style_);
    }
    if ((borders_ & BORDERS_BOTTOM) && (borders_ & BORDERS_LEFT)) {
        buf.set_string(area.x, last_y, border_set_.bottom_left, border_style_);
    }
    if ((borders_ & BORDERS_BOTTOM) && (borders_ & BORDERS_RIGHT)) {
        buf.set_string(last_x, last_y, border_set_.bottom_right, border_style_);
    }
}

void Block::render_title(const Rect& area, Buffer& buf) const {
    if (!title_) return;

    // Title sits on the top row, between the side borders
    uint16_t left = (borders_ & BORDERS_LEFT) ? 1 : 0;
    uint16_t right = (borders_ & BORDERS_RIGHT) ? 1 : 0;
    if (area.width <= left + right) return;

    const auto available = static_cast<uint16_t>(area.width - left - right);
    const uint16_t w = std::min(title_->width(), available);
    auto x = static_cast<uint16_t>(area.x + left);
    switch (title_->get_alignment()) {
        case Alignment::Left:
            break;
        case Alignment::Center:
            x = static_cast<uint16_t>(x + (available - w) / 2);
            break;
        case Alignment::Right:
            x = static_cast<uint16_t>(x + available - w);
            break;
    }

    // Only the title's own cells take its style, the rest of the border row
    // keeps the border style
    Line title = *title_;
    title.alignment(Alignment::Left);
    title.render(Rect{x, area.y, w, 1}, buf);
}

} // namespace panedash

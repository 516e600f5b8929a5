#include "line.hpp"
#include <algorithm>

namespace panedash {

uint16_t Line::width() const {
    return static_cast<uint16_t>(std::min<size_t>(split_utf8(text_).size(), UINT16_MAX));
}

void Line::render(const Rect& area, Buffer& buf) const {
    Rect r = area.intersection(buf.area());
    if (r.is_empty()) return;

    Rect row{r.x, r.y, r.width, 1};
    buf.set_style(row, style_);

    uint16_t w = std::min(width(), r.width);
    uint16_t x = r.x;
    switch (alignment_) {
        case Alignment::Left:
            break;
        case Alignment::Center:
            x = static_cast<uint16_t>(r.x + (r.width - w) / 2);
            break;
        case Alignment::Right:
            x = static_cast<uint16_t>(r.right() - w);
            break;
    }
    buf.set_string(x, r.y, text_, style_, w);
}

} // namespace panedash

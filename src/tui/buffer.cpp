#include "buffer.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace panedash {

namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";

size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

} // namespace

std::vector<std::string> split_utf8(std::string_view text) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_length(static_cast<unsigned char>(text[i]));
        bool valid = len > 0 && i + len <= text.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(text[i + k]) & 0xC0) == 0x80;
        }
        if (!valid) {
            out.emplace_back(kReplacementChar);
            ++i;
            continue;
        }
        out.emplace_back(text.substr(i, len));
        i += len;
    }
    return out;
}

Buffer::Buffer(const Rect& area) {
    resize(area);
}

size_t Buffer::index_of(uint16_t x, uint16_t y) const {
    if (!area_.contains(x, y)) {
        throw std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") outside buffer");
    }
    return static_cast<size_t>(y - area_.y) * area_.width + (x - area_.x);
}

Cell& Buffer::cell(uint16_t x, uint16_t y) {
    return cells_[index_of(x, y)];
}

const Cell& Buffer::cell(uint16_t x, uint16_t y) const {
    return cells_[index_of(x, y)];
}

uint16_t Buffer::set_string(uint16_t x, uint16_t y, std::string_view text, const Style& style,
                            uint16_t max_width) {
    if (y < area_.y || y >= area_.bottom()) return x;

    uint32_t limit = std::min<uint32_t>(area_.right(), uint32_t{x} + max_width);
    uint32_t col = x;
    for (auto& ch : split_utf8(text)) {
        if (col >= limit) break;
        if (col >= area_.x) {
            Cell& c = cells_[index_of(static_cast<uint16_t>(col), y)];
            c.symbol = std::move(ch);
            c.style = c.style.patched(style);
        }
        ++col;
    }
    return static_cast<uint16_t>(col);
}

void Buffer::set_style(const Rect& rect, const Style& style) {
    Rect r = rect.intersection(area_);
    for (uint16_t y = r.y; y < r.bottom(); ++y) {
        for (uint16_t x = r.x; x < r.right(); ++x) {
            Cell& c = cells_[index_of(x, y)];
            c.style = c.style.patched(style);
        }
    }
}

void Buffer::reset() {
    for (auto& c : cells_) {
        c = Cell{};
    }
}

void Buffer::resize(const Rect& area) {
    area_ = area;
    cells_.assign(area_.area(), Cell{});
}

std::string Buffer::row_text(uint16_t y) const {
    std::string out;
    for (uint16_t x = area_.x; x < area_.right(); ++x) {
        out += cell(x, y).symbol;
    }
    return out;
}

} // namespace panedash

#include "bar_graph.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace panedash {

namespace {

constexpr uint32_t kBrailleDotsPerCell = 4;
constexpr uint32_t kSolidEighthsPerCell = 8;

// Braille dot bits, bottom row first
constexpr std::array<uint8_t, 4> kLeftDots = {0x40, 0x04, 0x02, 0x01};
constexpr std::array<uint8_t, 4> kRightDots = {0x80, 0x20, 0x10, 0x08};

constexpr std::array<const char*, 9> kEighths = {
    " ", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"
};

// UTF-8 encoding of U+2800 + bits
std::string braille_symbol(uint8_t bits) {
    std::string s(3, '\0');
    s[0] = static_cast<char>(0xE2);
    s[1] = static_cast<char>(0xA0 | (bits >> 6));
    s[2] = static_cast<char>(0x80 | (bits & 0x3F));
    return s;
}

uint32_t units_in_row(uint32_t units, uint16_t row, uint32_t per_cell) {
    uint32_t below = uint32_t{row} * per_cell;
    if (units <= below) return 0;
    return std::min(units - below, per_cell);
}

} // namespace

BarGraph::BarGraph(std::vector<double> data)
    : data_(std::move(data))
    , gradient_(gradients::plasma())
{
    if (!data_.empty()) {
        data_max_ = *std::max_element(data_.begin(), data_.end());
    }
}

size_t BarGraph::bars_per_width(uint16_t width) const {
    if (bar_style_ == BarStyle::Braille) {
        return size_t{width} * 2;
    }
    return width;
}

double BarGraph::normalise(double value) const {
    double lo = min_.value_or(0.0);
    double hi = max_.value_or(data_max_);
    if (!(hi > lo) || std::isnan(value)) {
        return 0.0;
    }
    return std::clamp((value - lo) / (hi - lo), 0.0, 1.0);
}

uint32_t BarGraph::bar_units(double value, uint16_t height) const {
    uint32_t per_cell = bar_style_ == BarStyle::Braille ? kBrailleDotsPerCell : kSolidEighthsPerCell;
    double total = static_cast<double>(height) * per_cell;
    return static_cast<uint32_t>(std::lround(normalise(value) * total));
}

Color BarGraph::cell_color(double bar_value, uint16_t row_from_bottom, uint16_t height) const {
    if (color_mode_ == ColorMode::VerticalGradient) {
        double t = height > 1 ? static_cast<double>(row_from_bottom) / (height - 1) : 0.0;
        return gradient_.at(t);
    }
    return gradient_.at(normalise(bar_value));
}

void BarGraph::render(const Rect& area, Buffer& buf) const {
    Rect r = area.intersection(buf.area());
    if (r.is_empty() || data_.empty()) return;

    if (bar_style_ == BarStyle::Braille) {
        render_braille(r, buf);
    } else {
        render_solid(r, buf);
    }
}

void BarGraph::render_braille(const Rect& area, Buffer& buf) const {
    const size_t bars = std::min(data_.size(), bars_per_width(area.width));

    for (size_t left = 0; left < bars; left += 2) {
        const size_t right = left + 1;
        const bool has_right = right < bars;
        const auto x = static_cast<uint16_t>(area.x + left / 2);

        uint32_t left_units = bar_units(data_[left], area.height);
        uint32_t right_units = has_right ? bar_units(data_[right], area.height) : 0;
        double cell_value = has_right ? std::max(data_[left], data_[right]) : data_[left];

        for (uint16_t row = 0; row < area.height; ++row) {
            uint32_t l = units_in_row(left_units, row, kBrailleDotsPerCell);
            uint32_t rr = units_in_row(right_units, row, kBrailleDotsPerCell);
            if (l == 0 && rr == 0) break;

            uint8_t bits = 0;
            for (uint32_t d = 0; d < l; ++d) bits |= kLeftDots[d];
            for (uint32_t d = 0; d < rr; ++d) bits |= kRightDots[d];

            const auto y = static_cast<uint16_t>(area.bottom() - 1 - row);
            buf.set_string(x, y, braille_symbol(bits), fg(cell_color(cell_value, row, area.height)));
        }
    }
}

void BarGraph::render_solid(const Rect& area, Buffer& buf) const {
    const size_t bars = std::min(data_.size(), bars_per_width(area.width));

    for (size_t i = 0; i < bars; ++i) {
        const auto x = static_cast<uint16_t>(area.x + i);
        uint32_t units = bar_units(data_[i], area.height);

        for (uint16_t row = 0; row < area.height; ++row) {
            uint32_t e = units_in_row(units, row, kSolidEighthsPerCell);
            if (e == 0) break;

            const auto y = static_cast<uint16_t>(area.bottom() - 1 - row);
            buf.set_string(x, y, kEighths[e], fg(cell_color(data_[i], row, area.height)));
        }
    }
}

} // namespace panedash

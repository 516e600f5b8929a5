#include "gradient.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace panedash {

Gradient::Gradient(std::vector<Color> stops)
    : stops_(std::move(stops))
{
    if (stops_.empty()) {
        throw std::invalid_argument("gradient needs at least one colour stop");
    }
}

Color Gradient::at(double t) const {
    if (stops_.size() == 1 || std::isnan(t)) {
        return stops_.front();
    }

    t = std::clamp(t, 0.0, 1.0);
    double scaled = t * static_cast<double>(stops_.size() - 1);
    auto lo = static_cast<size_t>(std::floor(scaled));
    if (lo >= stops_.size() - 1) {
        return stops_.back();
    }
    double frac = scaled - static_cast<double>(lo);

    const Color& a = stops_[lo];
    const Color& b = stops_[lo + 1];
    auto mix = [frac](uint8_t x, uint8_t y) {
        return static_cast<uint8_t>(std::lround(x + (static_cast<double>(y) - x) * frac));
    };
    return Color{mix(a.r, b.r), mix(a.g, b.g), mix(a.b, b.b)};
}

namespace gradients {

Gradient plasma() {
    return Gradient({
        Color::from_hex(0x0d0887),
        Color::from_hex(0x46039f),
        Color::from_hex(0x7201a8),
        Color::from_hex(0x9c179e),
        Color::from_hex(0xbd3786),
        Color::from_hex(0xd8576b),
        Color::from_hex(0xed7953),
        Color::from_hex(0xfb9f3a),
        Color::from_hex(0xfdca26),
        Color::from_hex(0xf0f921),
    });
}

Gradient blues() {
    return Gradient({
        Color::from_hex(0xf7fbff),
        Color::from_hex(0xdeebf7),
        Color::from_hex(0xc6dbef),
        Color::from_hex(0x9ecae1),
        Color::from_hex(0x6baed6),
        Color::from_hex(0x4292c6),
        Color::from_hex(0x2171b5),
        Color::from_hex(0x08519c),
        Color::from_hex(0x08306b),
    });
}

} // namespace gradients

std::optional<Gradient> gradient_preset(std::string_view name) {
    if (name == "plasma") return gradients::plasma();
    if (name == "blues") return gradients::blues();
    return std::nullopt;
}

} // namespace panedash

#pragma once

#include "../buffer.hpp"
#include "../gradient.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace panedash {

enum class BarStyle {
    Braille,  // two bars per cell, four dot rows per cell
    Solid     // one bar per cell, eighth-block resolution
};

enum class ColorMode {
    BarValue,          // each bar coloured by its own value
    VerticalGradient   // colour follows the row height
};

// Vertical bar graph drawn left to right, bottom up. Bar heights are
// proportional to (value - min) / (max - min); min defaults to 0 and max to
// the largest value in the data. Uses the plasma gradient unless told
// otherwise.
class BarGraph {
public:
    explicit BarGraph(std::vector<double> data);

    BarGraph& with_gradient(Gradient gradient) { gradient_ = std::move(gradient); return *this; }
    BarGraph& with_bar_style(BarStyle style) { bar_style_ = style; return *this; }
    BarGraph& with_color_mode(ColorMode mode) { color_mode_ = mode; return *this; }
    BarGraph& with_max(double max) { max_ = max; return *this; }
    BarGraph& with_min(double min) { min_ = min; return *this; }

    [[nodiscard]] const std::vector<double>& data() const { return data_; }

    // Bars that fit across `width` cells for the current bar style
    [[nodiscard]] size_t bars_per_width(uint16_t width) const;

    // Filled sub-rows of a bar in an area `height` cells tall: dots for
    // braille (4 per cell), eighths for solid blocks (8 per cell)
    [[nodiscard]] uint32_t bar_units(double value, uint16_t height) const;

    void render(const Rect& area, Buffer& buf) const;

private:
    [[nodiscard]] double normalise(double value) const;
    [[nodiscard]] Color cell_color(double bar_value, uint16_t row_from_bottom, uint16_t height) const;
    void render_braille(const Rect& area, Buffer& buf) const;
    void render_solid(const Rect& area, Buffer& buf) const;

    std::vector<double> data_;
    Gradient gradient_;
    BarStyle bar_style_ = BarStyle::Braille;
    ColorMode color_mode_ = ColorMode::BarValue;
    std::optional<double> max_;
    std::optional<double> min_;
    double data_max_ = 0.0;
};

} // namespace panedash

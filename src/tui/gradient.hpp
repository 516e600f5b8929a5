#pragma once

#include "tui_colors.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace panedash {

// Continuous colour map over [0, 1], linear between evenly spaced stops
class Gradient {
public:
    explicit Gradient(std::vector<Color> stops);

    // Colour at position t; t is clamped to [0, 1]
    [[nodiscard]] Color at(double t) const;

    [[nodiscard]] const std::vector<Color>& stops() const { return stops_; }

private:
    std::vector<Color> stops_;
};

namespace gradients {
// matplotlib "plasma"
[[nodiscard]] Gradient plasma();
// ColorBrewer "Blues" (9 classes)
[[nodiscard]] Gradient blues();
} // namespace gradients

// Looks a preset up by name ("plasma", "blues")
[[nodiscard]] std::optional<Gradient> gradient_preset(std::string_view name);

} // namespace panedash

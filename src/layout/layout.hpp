#pragma once

#include "rect.hpp"
#include <array>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace panedash {

enum class Direction {
    Horizontal,
    Vertical
};

// Sizing rule for one segment of a split
struct Constraint {
    enum class Kind {
        Length,      // exactly `value` cells
        Percentage,  // `value` percent of the available length
        Min,         // at least `value` cells, grows like Fill(1)
        Max,         // grows like Fill(1), never beyond `value` cells
        Fill         // proportional share, `value` is the weight
    };

    Kind kind = Kind::Fill;
    uint16_t value = 1;

    static constexpr Constraint length(uint16_t n) { return {Kind::Length, n}; }
    static constexpr Constraint percentage(uint16_t p) { return {Kind::Percentage, p}; }
    static constexpr Constraint min(uint16_t n) { return {Kind::Min, n}; }
    static constexpr Constraint max(uint16_t n) { return {Kind::Max, n}; }
    static constexpr Constraint fill(uint16_t weight) { return {Kind::Fill, weight}; }

    constexpr bool operator==(const Constraint&) const = default;
};

// Splits a rect along one axis into segments sized by constraints.
//
// The area is first shrunk by the margin, then `spacing` cells are reserved
// between consecutive segments. Fixed sizes are granted first, in order; the
// remaining length is shared between the flexible segments using
// largest-remainder apportionment, so the result is deterministic and always
// sums to the available length when at least one flexible segment exists.
class Layout {
public:
    Layout(Direction direction, std::vector<Constraint> constraints);

    static Layout vertical(std::initializer_list<Constraint> constraints);
    static Layout horizontal(std::initializer_list<Constraint> constraints);

    Layout& margin(uint16_t uniform);
    Layout& margin(Margin m);
    Layout& spacing(uint16_t cells);

    [[nodiscard]] std::vector<Rect> split(const Rect& area) const;

    template <size_t N>
    [[nodiscard]] std::array<Rect, N> areas(const Rect& area) const {
        if (constraints_.size() != N) {
            throw std::invalid_argument("layout has " + std::to_string(constraints_.size()) +
                                        " constraints, " + std::to_string(N) + " areas requested");
        }
        auto rects = split(area);
        std::array<Rect, N> out{};
        for (size_t i = 0; i < N; ++i) {
            out[i] = rects[i];
        }
        return out;
    }

    [[nodiscard]] Direction direction() const { return direction_; }
    [[nodiscard]] const std::vector<Constraint>& constraints() const { return constraints_; }

    // Segment lengths for a given available length (margin and spacing
    // already removed). Exposed for tests.
    [[nodiscard]] static std::vector<uint16_t> solve(const std::vector<Constraint>& constraints,
                                                     uint16_t available);

private:
    Direction direction_;
    std::vector<Constraint> constraints_;
    Margin margin_;
    uint16_t spacing_ = 0;
};

} // namespace panedash

#include "tui_colors.hpp"
#include <algorithm>
#include <array>
#include <cstdlib>
#include <limits>

#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1
#endif
#include <ncurses.h>

namespace panedash {

namespace {

constexpr std::array<int, 6> kCubeLevels = {0, 95, 135, 175, 215, 255};

int distance_sq(int r1, int g1, int b1, int r2, int g2, int b2) {
    int dr = r1 - r2;
    int dg = g1 - g2;
    int db = b1 - b2;
    return dr * dr + dg * dg + db * db;
}

int nearest_cube_level(int v) {
    int best = 0;
    for (int i = 1; i < static_cast<int>(kCubeLevels.size()); ++i) {
        if (std::abs(kCubeLevels[i] - v) < std::abs(kCubeLevels[best] - v)) {
            best = i;
        }
    }
    return best;
}

} // namespace

int rgb_to_xterm256(Color c) {
    // 6x6x6 colour cube
    int ri = nearest_cube_level(c.r);
    int gi = nearest_cube_level(c.g);
    int bi = nearest_cube_level(c.b);
    int cube_index = 16 + 36 * ri + 6 * gi + bi;
    int cube_dist = distance_sq(c.r, c.g, c.b, kCubeLevels[ri], kCubeLevels[gi], kCubeLevels[bi]);

    // 24-step grey ramp: 8, 18, ..., 238
    int avg = (c.r + c.g + c.b) / 3;
    int grey_step = std::clamp((avg - 8 + 5) / 10, 0, 23);
    int grey = 8 + 10 * grey_step;
    int grey_dist = distance_sq(c.r, c.g, c.b, grey, grey, grey);

    return grey_dist < cube_dist ? 232 + grey_step : cube_index;
}

int rgb_to_ansi8(Color c) {
    // xterm's default rendering of the basic colours, in curses order
    static constexpr std::array<std::array<int, 3>, 8> kBasic = {{
        {0, 0, 0},        // COLOR_BLACK
        {205, 0, 0},      // COLOR_RED
        {0, 205, 0},      // COLOR_GREEN
        {205, 205, 0},    // COLOR_YELLOW
        {0, 0, 238},      // COLOR_BLUE
        {205, 0, 205},    // COLOR_MAGENTA
        {0, 205, 205},    // COLOR_CYAN
        {229, 229, 229},  // COLOR_WHITE
    }};

    int best = 0;
    int best_dist = std::numeric_limits<int>::max();
    for (int i = 0; i < static_cast<int>(kBasic.size()); ++i) {
        int d = distance_sq(c.r, c.g, c.b, kBasic[i][0], kBasic[i][1], kBasic[i][2]);
        if (d < best_dist) {
            best_dist = d;
            best = i;
        }
    }
    return best;
}

bool init_colors() {
    if (!has_colors()) {
        return false;
    }

    // Unset colours map to -1, which needs the terminal's default colours
    if (start_color() == ERR || use_default_colors() == ERR) {
        return false;
    }
    return true;
}

int palette_index(Color c) {
    if (COLORS >= 256) {
        return rgb_to_xterm256(c);
    }
    return rgb_to_ansi8(c);
}

} // namespace panedash

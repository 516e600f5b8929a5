#pragma once

#include "../interfaces/i_event_source.hpp"
#include "../interfaces/i_terminal.hpp"
#include "buffer.hpp"
#include <map>
#include <utility>

// Opaque curses screen; <ncurses.h> stays out of this header because its
// macros (move, erase, clear, ...) collide with standard library names.
struct screen;

namespace panedash {

// Full-screen ncurses terminal. Owns the curses screen for its lifetime:
// construction puts the terminal in raw mode, destruction restores it.
class NcursesTerminal : public ITerminal, public IEventSource {
public:
    NcursesTerminal();
    ~NcursesTerminal() override;

    NcursesTerminal(const NcursesTerminal&) = delete;
    NcursesTerminal& operator=(const NcursesTerminal&) = delete;

    void draw(const std::function<void(Frame&)>& render) override;
    Event read_event() override;

private:
    void flush();
    [[nodiscard]] short pair_for(const Style& style);

    struct screen* screen_ = nullptr;
    Buffer buffer_;
    bool has_colors_ = false;

    // (fg, bg) palette indices -> colour pair number
    std::map<std::pair<int, int>, short> pairs_;
    int next_pair_ = 1;

    static constexpr int kEscapeDelayMs = 25;
};

} // namespace panedash

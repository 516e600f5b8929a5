#include "ncurses_terminal.hpp"
#include "../errors.hpp"
#include "key_decoder.hpp"
#include "tui_colors.hpp"
#include <climits>
#include <clocale>
#include <cstdio>
#include <string>

#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1
#endif
#include <ncurses.h>

namespace panedash {

namespace {

attr_t attributes_for(const Style& style) {
    attr_t attrs = A_NORMAL;
    if (style.modifiers & MODIFIER_BOLD) attrs |= A_BOLD;
    if (style.modifiers & MODIFIER_DIM) attrs |= A_DIM;
    if (style.modifiers & MODIFIER_UNDERLINE) attrs |= A_UNDERLINE;
    if (style.modifiers & MODIFIER_REVERSE) attrs |= A_REVERSE;
    return attrs;
}

Event function_key_event(wint_t key) {
    switch (key) {
        case KEY_RESIZE:
            return ResizeEvent{static_cast<uint16_t>(COLS), static_cast<uint16_t>(LINES)};
        case KEY_MOUSE: {
            MEVENT mouse{};
            if (getmouse(&mouse) != OK) {
                return MouseEvent{};
            }
            return MouseEvent{static_cast<uint16_t>(mouse.x), static_cast<uint16_t>(mouse.y),
                              static_cast<uint32_t>(mouse.bstate)};
        }
        case KEY_UP: return KeyEvent::key(KeyCode::Up);
        case KEY_DOWN: return KeyEvent::key(KeyCode::Down);
        case KEY_LEFT: return KeyEvent::key(KeyCode::Left);
        case KEY_RIGHT: return KeyEvent::key(KeyCode::Right);
        case KEY_HOME: return KeyEvent::key(KeyCode::Home);
        case KEY_END: return KeyEvent::key(KeyCode::End);
        case KEY_PPAGE: return KeyEvent::key(KeyCode::PageUp);
        case KEY_NPAGE: return KeyEvent::key(KeyCode::PageDown);
        case KEY_IC: return KeyEvent::key(KeyCode::Insert);
        case KEY_DC: return KeyEvent::key(KeyCode::Delete);
        case KEY_BACKSPACE: return KeyEvent::key(KeyCode::Backspace);
        case KEY_ENTER: return KeyEvent::key(KeyCode::Enter);
        case KEY_BTAB: return KeyEvent::key(KeyCode::BackTab, KEY_MOD_SHIFT);
        default:
            break;
    }

    if (key >= KEY_F0 && key <= KEY_F(63)) {
        KeyEvent f = KeyEvent::key(KeyCode::F);
        f.ch = static_cast<char32_t>(key - KEY_F0);
        return f;
    }
    return KeyEvent::key(KeyCode::Unknown);
}

} // namespace

NcursesTerminal::NcursesTerminal() {
    std::setlocale(LC_ALL, "");

    screen_ = newterm(nullptr, stdout, stdin);
    if (screen_ == nullptr) {
        throw TerminalError("failed to initialize terminal (is TERM set?)");
    }
    set_term(screen_);

    // Raw mode so Ctrl+C arrives as a key instead of SIGINT
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor; unsupported on some terminals, harmless
    set_escdelay(kEscapeDelayMs);
    mousemask(ALL_MOUSE_EVENTS, nullptr);

    has_colors_ = init_colors();
}

NcursesTerminal::~NcursesTerminal() {
    if (screen_ != nullptr) {
        endwin();
        delscreen(screen_);
        screen_ = nullptr;
    }
}

void NcursesTerminal::draw(const std::function<void(Frame&)>& render) {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);
    if (max_y < 0 || max_x < 0) {
        throw TerminalError("failed to query terminal size");
    }

    buffer_.resize(Rect{0, 0, static_cast<uint16_t>(max_x), static_cast<uint16_t>(max_y)});
    Frame frame(buffer_);
    render(frame);
    flush();
}

void NcursesTerminal::flush() {
    const Rect& area = buffer_.area();

    for (uint16_t y = area.y; y < area.bottom(); ++y) {
        for (uint16_t x = area.x; x < area.right(); ++x) {
            const Cell& cell = buffer_.cell(x, y);
            wattr_set(stdscr, attributes_for(cell.style), pair_for(cell.style), nullptr);

            // Writing the bottom-right cell fails because the cursor cannot
            // advance past it; the cell is still drawn
            bool last_cell = (x + 1 == area.right()) && (y + 1 == area.bottom());
            if (mvwaddstr(stdscr, y, x, cell.symbol.c_str()) == ERR && !last_cell) {
                throw TerminalError("failed to draw at (" + std::to_string(x) + ", " +
                                    std::to_string(y) + ")");
            }
        }
    }
    wattr_set(stdscr, A_NORMAL, 0, nullptr);

    if (wnoutrefresh(stdscr) == ERR || doupdate() == ERR) {
        throw TerminalError("failed to refresh terminal");
    }
}

short NcursesTerminal::pair_for(const Style& style) {
    if (!has_colors_) {
        return 0;
    }

    int fg = style.fg ? palette_index(*style.fg) : -1;
    int bg = style.bg ? palette_index(*style.bg) : -1;

    auto key = std::make_pair(fg, bg);
    auto it = pairs_.find(key);
    if (it != pairs_.end()) {
        return it->second;
    }

    // Out of pairs: fall back to the default colours
    if (next_pair_ >= COLOR_PAIRS || next_pair_ > SHRT_MAX) {
        return 0;
    }

    auto pair = static_cast<short>(next_pair_++);
    if (init_pair(pair, static_cast<short>(fg), static_cast<short>(bg)) == ERR) {
        throw TerminalError("failed to allocate colour pair " + std::to_string(pair));
    }
    pairs_.emplace(key, pair);
    return pair;
}

Event NcursesTerminal::read_event() {
    wint_t ch = 0;
    int rc = wget_wch(stdscr, &ch);
    if (rc == ERR) {
        throw TerminalError("failed to read input event");
    }
    if (rc == KEY_CODE_YES) {
        return function_key_event(ch);
    }

    if (ch == 0x1B) {
        // ESC followed immediately by another character is Alt+character
        nodelay(stdscr, TRUE);
        wint_t next = 0;
        int next_rc = wget_wch(stdscr, &next);
        nodelay(stdscr, FALSE);
        if (next_rc == OK) {
            return decode_alt_key_char(static_cast<char32_t>(next));
        }
        if (next_rc == KEY_CODE_YES) {
            // Not an Alt combination; keep the key for the next read
            ungetch(static_cast<int>(next));
        }
        return KeyEvent::key(KeyCode::Esc);
    }

    return decode_key_char(static_cast<char32_t>(ch));
}

} // namespace panedash

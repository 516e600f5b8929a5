#include "random_sample_source.hpp"
#include "tui/ncurses_terminal.hpp"
#include "tui/tui_app.hpp"
#include <iostream>

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    try {
        panedash::RandomSampleSource samples;
        panedash::TuiApp app(&samples);

        // The terminal is restored by its destructor, so by the time an
        // error reaches the handler below the screen is back to normal
        panedash::NcursesTerminal terminal;
        app.run(terminal, terminal);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

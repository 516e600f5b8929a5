#include "tui_app.hpp"

namespace panedash {

TuiApp::TuiApp(ISampleSource* samples)
    : dashboard_(samples)
{
}

void TuiApp::run(ITerminal& terminal, IEventSource& events) {
    while (running_) {
        terminal.draw([this](Frame& frame) { render(frame); });
        handle_event(events.read_event());
    }
}

void TuiApp::render(Frame& frame) {
    dashboard_.render(frame);
}

void TuiApp::handle_event(const Event& event) {
    // Only presses count: terminals that report releases would otherwise
    // trigger every binding twice. Mouse and resize need no handling, the
    // next frame is laid out from the current screen size anyway.
    if (const auto* key = std::get_if<KeyEvent>(&event)) {
        if (key->kind == KeyEventKind::Press) {
            on_key_event(*key);
        }
    }
}

void TuiApp::on_key_event(const KeyEvent& key) {
    switch (key.code) {
        case KeyCode::Esc:
            quit();
            return;

        case KeyCode::Char:
            // Shift is part of typing 'Q', so only Control and Alt disqualify
            if ((key.ch == U'q' || key.ch == U'Q') &&
                (key.modifiers & (KEY_MOD_CONTROL | KEY_MOD_ALT)) == 0) {
                quit();
            } else if ((key.ch == U'c' || key.ch == U'C') && key.modifiers == KEY_MOD_CONTROL) {
                quit();
            }
            return;

        default:
            return;
    }
}

void TuiApp::quit() {
    running_ = false;
}

} // namespace panedash

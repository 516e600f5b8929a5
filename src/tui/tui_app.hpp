#pragma once

#include "../event.hpp"
#include "../interfaces/i_event_source.hpp"
#include "../interfaces/i_sample_source.hpp"
#include "../interfaces/i_terminal.hpp"
#include "tui_dashboard.hpp"

namespace panedash {

class TuiApp {
public:
    // Non-owning constructor: TuiApp uses but does not own the sample source.
    // The pointer must be non-null and must outlive the TuiApp instance.
    explicit TuiApp(ISampleSource* samples);

    // Draw a frame, then block for one event, until quit() is called.
    // Errors from the terminal or the event source propagate unchanged.
    void run(ITerminal& terminal, IEventSource& events);

    // Dispatches one input event. Only key presses change state.
    void handle_event(const Event& event);

    // Esc, q/Q, or Ctrl+C quit; everything else is ignored
    void on_key_event(const KeyEvent& key);

    void quit();

    [[nodiscard]] bool is_running() const { return running_; }

private:
    void render(Frame& frame);

    Dashboard dashboard_;
    bool running_ = true;
};

} // namespace panedash

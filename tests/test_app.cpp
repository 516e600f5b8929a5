#include "minitest.hpp"
#include "test_support.hpp"
#include "tui/tui_app.hpp"

using namespace panedash;
using panedash::testing::FixedSampleSource;
using panedash::testing::RecordingTerminal;
using panedash::testing::ScriptedEventSource;

namespace {

bool quits_on(const KeyEvent& key) {
    FixedSampleSource samples({0.5});
    TuiApp app(&samples);
    app.on_key_event(key);
    return !app.is_running();
}

} // namespace

TEST(app_starts_running) {
    FixedSampleSource samples({0.5});
    TuiApp app(&samples);
    ASSERT_TRUE(app.is_running());
}

TEST(app_quit_keys) {
    ASSERT_TRUE(quits_on(KeyEvent::key(KeyCode::Esc)));
    ASSERT_TRUE(quits_on(KeyEvent::key(KeyCode::Esc, KEY_MOD_ALT)));
    ASSERT_TRUE(quits_on(KeyEvent::character(U'q')));
    ASSERT_TRUE(quits_on(KeyEvent::character(U'Q')));
    ASSERT_TRUE(quits_on(KeyEvent::character(U'Q', KEY_MOD_SHIFT)));
    ASSERT_TRUE(quits_on(KeyEvent::character(U'c', KEY_MOD_CONTROL)));
    ASSERT_TRUE(quits_on(KeyEvent::character(U'C', KEY_MOD_CONTROL)));
}

TEST(app_ignores_other_keys) {
    ASSERT_FALSE(quits_on(KeyEvent::character(U'c')));
    ASSERT_FALSE(quits_on(KeyEvent::character(U'C')));
    ASSERT_FALSE(quits_on(KeyEvent::character(U'c', KEY_MOD_ALT)));
    ASSERT_FALSE(quits_on(KeyEvent::character(U'c', KEY_MOD_CONTROL | KEY_MOD_SHIFT)));
    ASSERT_FALSE(quits_on(KeyEvent::character(U'q', KEY_MOD_CONTROL)));
    ASSERT_FALSE(quits_on(KeyEvent::character(U'Q', KEY_MOD_ALT)));
    ASSERT_FALSE(quits_on(KeyEvent::character(U'x')));
    ASSERT_FALSE(quits_on(KeyEvent::character(U'x', KEY_MOD_CONTROL)));
    ASSERT_FALSE(quits_on(KeyEvent::key(KeyCode::Enter)));
    ASSERT_FALSE(quits_on(KeyEvent::key(KeyCode::Tab)));
    ASSERT_FALSE(quits_on(KeyEvent::key(KeyCode::Unknown, KEY_MOD_CONTROL)));
}

TEST(app_quit_is_idempotent) {
    FixedSampleSource samples({0.5});
    TuiApp app(&samples);
    app.on_key_event(KeyEvent::character(U'q'));
    ASSERT_FALSE(app.is_running());
    app.on_key_event(KeyEvent::key(KeyCode::Esc));
    app.on_key_event(KeyEvent::character(U'x'));
    app.quit();
    ASSERT_FALSE(app.is_running());
}

TEST(app_only_key_presses_change_state) {
    FixedSampleSource samples({0.5});
    TuiApp app(&samples);

    app.handle_event(ResizeEvent{80, 24});
    ASSERT_TRUE(app.is_running());
    app.handle_event(MouseEvent{3, 4, 0});
    ASSERT_TRUE(app.is_running());
    app.handle_event(KeyEvent::character(U'q', KEY_MOD_NONE, KeyEventKind::Release));
    ASSERT_TRUE(app.is_running());
    app.handle_event(KeyEvent::character(U'q', KEY_MOD_NONE, KeyEventKind::Repeat));
    ASSERT_TRUE(app.is_running());
    app.handle_event(KeyEvent::character(U'q'));
    ASSERT_FALSE(app.is_running());
}

TEST(app_run_draws_then_reads_until_quit) {
    FixedSampleSource samples({0.25, 0.75});
    TuiApp app(&samples);
    RecordingTerminal terminal(120, 40);
    ScriptedEventSource events({
        ResizeEvent{100, 30},
        MouseEvent{1, 1, 0},
        KeyEvent::character(U'q', KEY_MOD_NONE, KeyEventKind::Release),
        KeyEvent::character(U'q'),
        KeyEvent::character(U'x'),
    });

    app.run(terminal, events);

    ASSERT_FALSE(app.is_running());
    ASSERT_EQ(terminal.frames(), 4);
    ASSERT_EQ(events.reads(), 4);
    ASSERT_EQ(events.remaining(), 1u);

    std::string header = terminal.last_frame().row_text(4).substr(4, 22);
    ASSERT_EQ(header, "Blocks without borders");
}

TEST(app_run_returns_immediately_after_quit) {
    FixedSampleSource samples({0.5});
    TuiApp app(&samples);
    app.quit();

    RecordingTerminal terminal(80, 24);
    ScriptedEventSource events(std::deque<Event>{});
    app.run(terminal, events);
    ASSERT_EQ(terminal.frames(), 0);
    ASSERT_EQ(events.reads(), 0);
}

TEST(app_run_propagates_event_errors) {
    FixedSampleSource samples({0.5});
    TuiApp app(&samples);
    RecordingTerminal terminal(80, 24);
    ScriptedEventSource events({KeyEvent::character(U'x')});

    ASSERT_THROWS(app.run(terminal, events), TerminalError);
    ASSERT_EQ(terminal.frames(), 2);
    ASSERT_TRUE(app.is_running());
}

TEST(app_run_propagates_draw_errors) {
    FixedSampleSource samples({0.5});
    TuiApp app(&samples);
    RecordingTerminal terminal(80, 24);
    terminal.fail_next_draw();
    ScriptedEventSource events({KeyEvent::character(U'q')});

    ASSERT_THROWS(app.run(terminal, events), TerminalError);
    ASSERT_EQ(events.reads(), 0);
}

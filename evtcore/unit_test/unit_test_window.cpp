// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "config.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/window.h"
#include "evtcore/event_cx.h"
#include "evtcore/node.h"
#include "evtcore/unit_test/test_node.h"

using namespace evt;
using test::TestNode;
using Tree = test::TestTree;

namespace {

void MoveTo(Window& window, int x, int y)
{
    window.HandleInput(input::CursorMoved { DVec2(x, y) });
}

void Mouse(Window& window, ElementState state, MouseButton button = MouseButton::Left)
{
    window.HandleInput(input::MouseInput { state, button });
}

void Click(Window& window, int x, int y)
{
    MoveTo(window, x, y);
    Mouse(window, ElementState::Pressed);
    Mouse(window, ElementState::Released);
}

void KeyPress(Window& window, const Key& key, PhysicalKey code)
{
    KeyEvent event;
    event.physical_key = code;
    event.logical_key  = key;
    event.key_without_modifiers = key;
    event.state = ElementState::Pressed;
    window.HandleInput(input::KeyboardInput { event, false });

    event.state = ElementState::Released;
    window.HandleInput(input::KeyboardInput { event, false });
}

void SetModifiers(Window& window, Modifiers modifiers)
{
    window.HandleInput(input::ModifiersChanged { modifiers });
}

void Touch(Window& window, TouchPhase phase, std::uint64_t id, int x, int y)
{
    window.HandleInput(input::Touch { phase, id, DVec2(x, y) });
}

// Record the commands received by the node. Commands in the used
// list are used, everything else is left unused.
void RecordCommands(TestNode* node, std::vector<Command>* log, std::vector<Command> used = {})
{
    node->on_event = [log, used](EventCx&, const Event& event) {
        const auto* cmd = std::get_if<CommandEvent>(&event);
        if (cmd == nullptr)
            return IsUsed::Unused;
        log->push_back(cmd->cmd);
        for (const auto u : used)
        {
            if (u == cmd->cmd)
                return IsUsed::Used;
        }
        return IsUsed::Unused;
    };
}

PopupDescriptor MakePopup(const TestNode* node, const TestNode* parent)
{
    PopupDescriptor desc;
    desc.id     = node->id;
    desc.parent = parent->id;
    desc.rect   = parent->rect;
    return desc;
}

} // namespace

void unit_test_nav_fallback()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);

    tree.d->on_configure = [d=tree.d](ConfigCx& cx) {
        cx.RegisterNavFallback(d->id);
    };
    // later registrants don't replace the first
    tree.e->on_configure = [e=tree.e](ConfigCx& cx) {
        cx.RegisterNavFallback(e->id);
    };
    std::vector<Command> commands;
    RecordCommands(tree.d, &commands, {Command::Tab});

    window.FullConfigure();
    TEST_REQUIRE(window.GetState().GetNavFallback() == tree.d->id);
    window.FlushPending();

    // no nav focus, the tab goes to the fallback
    KeyPress(window, NamedKey::Tab, 15);
    TEST_REQUIRE(commands == std::vector<Command>{Command::Tab});
    window.FlushPending();
    TEST_REQUIRE(!window.GetState().GetNavFocus().has_value());

    // the fallback doesn't use the tab, the focus moves
    commands.clear();
    RecordCommands(tree.d, &commands);
    KeyPress(window, NamedKey::Tab, 15);
    TEST_REQUIRE(commands == std::vector<Command>{Command::Tab});
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.a->id);
    TEST_REQUIRE(tree.a->HasEvent("NavFocus"));

    // reconfiguring registers the fallback again
    window.FullConfigure();
    TEST_REQUIRE(window.GetState().GetNavFallback() == tree.d->id);
}

void unit_test_tab_navigation()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();
    window.FlushPending();

    const auto tab = [&window]() {
        KeyPress(window, NamedKey::Tab, 15);
        window.FlushPending();
        return window.GetState().GetNavFocus();
    };
    TEST_REQUIRE(tab() == tree.a->id);
    TEST_REQUIRE(tab() == tree.b->id);
    TEST_REQUIRE(tree.a->HasEvent("LostNavFocus"));
    TEST_REQUIRE(tree.b->HasEvent("NavFocus"));
    TEST_REQUIRE(tab() == tree.c->id);
    TEST_REQUIRE(tab() == tree.e->id);
    // wraps around
    TEST_REQUIRE(tab() == tree.a->id);

    // reverse
    SetModifiers(window, Modifiers(Modifier::Shift));
    TEST_REQUIRE(tab() == tree.e->id);
    TEST_REQUIRE(tab() == tree.c->id);
    SetModifiers(window, Modifiers());

    // disabled widgets are skipped
    window.GetState().SetDisabled(tree.e->id, true);
    TEST_REQUIRE(tab() == tree.a->id);

    // nav focus disabled in the window
    Tree other;
    auto config = std::make_shared<WindowConfig>();
    config->EnableNavFocus(false);
    Window no_nav(config, 2, runner, *other.root);
    no_nav.FullConfigure();
    KeyPress(no_nav, NamedKey::Tab, 15);
    no_nav.FlushPending();
    TEST_REQUIRE(!no_nav.GetState().GetNavFocus().has_value());
    Click(no_nav, 10, 10);
    no_nav.FlushPending();
    TEST_REQUIRE(!no_nav.GetState().GetNavFocus().has_value());
}

void unit_test_nav_focus_from()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();
    window.FlushPending();
    EventCx cx(window.GetState(), runner, *tree.root);

    // explicit start widget takes the focus itself
    cx.NextNavFocus(tree.b->id, false, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.b->id);
    TEST_REQUIRE(tree.b->CountEvents("NavFocus") == 1);

    // start widget already focused
    cx.NextNavFocus(tree.b->id, false, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.b->id);
    TEST_REQUIRE(tree.b->CountEvents("NavFocus") == 1);

    // no start widget advances past the current focus
    cx.NextNavFocus(std::nullopt, false, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.c->id);

    // reverse from an explicit start
    cx.NextNavFocus(tree.e->id, true, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.e->id);

    // start on a widget that isn't navigable
    cx.NextNavFocus(tree.d->id, false, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.e->id);
    cx.NextNavFocus(tree.d->id, true, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.c->id);
}

void unit_test_mouse_grab()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    std::vector<std::string> log;
    tree.b->on_event = [&log, b=tree.b](EventCx& cx, const Event& event) {
        if (const auto* start = std::get_if<PressStartEvent>(&event))
        {
            log.push_back(start->press.source.IsPrimary() ? "start:primary" : "start:other");
            TEST_REQUIRE(cx.GrabPress(start->press, b->id, GrabMode::Click));
            return IsUsed::Used;
        }
        else if (const auto* end = std::get_if<PressEndEvent>(&event))
        {
            log.push_back(end->success ? "end:true" : "end:false");
            return IsUsed::Used;
        }
        return IsUsed::Unused;
    };

    MoveTo(window, 10, 10);
    TEST_REQUIRE(window.GetState().IsHovered(tree.b->id));
    Mouse(window, ElementState::Pressed, MouseButton::Left);
    TEST_REQUIRE(window.GetState().GetPressState().HasMouseGrab());
    TEST_REQUIRE(window.GetState().IsDepressed(tree.b->id));

    // second button before the release of the first
    Mouse(window, ElementState::Pressed, MouseButton::Right);
    TEST_REQUIRE(log == (std::vector<std::string>{"start:primary", "end:false", "start:other"}));
    TEST_REQUIRE(window.GetState().GetPressState().GetMouseGrab()->button == MouseButton::Right);

    // releasing the first button no longer does anything
    Mouse(window, ElementState::Released, MouseButton::Left);
    TEST_REQUIRE(log.size() == 3);
    Mouse(window, ElementState::Released, MouseButton::Right);
    TEST_REQUIRE(log.back() == "end:true");
    TEST_REQUIRE(!window.GetState().GetPressState().HasMouseGrab());

    // nav focus follows the click
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.b->id);

    // click grab loses the depress when the cursor leaves the owner
    Mouse(window, ElementState::Pressed, MouseButton::Left);
    MoveTo(window, 60, 10);
    window.FlushPending();
    TEST_REQUIRE(!window.GetState().IsDepressed(tree.b->id));
    MoveTo(window, 10, 10);
    window.FlushPending();
    TEST_REQUIRE(window.GetState().IsDepressed(tree.b->id));
    Mouse(window, ElementState::Released, MouseButton::Left);
}

void unit_test_drag_grab()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    std::vector<Offset> moves;
    std::vector<std::optional<Id>> over;
    tree.c->on_event = [&moves, &over, c=tree.c](EventCx& cx, const Event& event) {
        if (const auto* start = std::get_if<PressStartEvent>(&event))
        {
            cx.GrabPress(start->press, c->id, GrabMode::Drag, CursorIcon::Grabbing);
            return IsUsed::Used;
        }
        else if (const auto* move = std::get_if<PressMoveEvent>(&event))
        {
            moves.push_back(move->delta);
            over.push_back(move->press.id);
        }
        return IsUsed::Unused;
    };

    MoveTo(window, 60, 10);
    Mouse(window, ElementState::Pressed);
    window.FlushPending();
    TEST_REQUIRE(runner.cursor_icons.back() == CursorIcon::Grabbing);

    // motion goes to the grab owner wherever the cursor is
    MoveTo(window, 65, 12);
    MoveTo(window, 150, 20);
    TEST_REQUIRE(moves == (std::vector<Offset>{Offset(5, 2), Offset(85, 8)}));
    TEST_REQUIRE(over[0] == tree.c->id);
    TEST_REQUIRE(over[1] == tree.e->id);
    TEST_REQUIRE(!tree.e->HasEvent("CursorMove"));

    Mouse(window, ElementState::Released);
    TEST_REQUIRE(tree.c->HasEvent("PressEnd"));
    window.FlushPending();
    TEST_REQUIRE(runner.cursor_icons.back() == CursorIcon::Default);
}

void unit_test_touch()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    std::vector<std::string> log;
    tree.b->on_event = [&log, b=tree.b](EventCx& cx, const Event& event) {
        if (const auto* start = std::get_if<PressStartEvent>(&event))
        {
            TEST_REQUIRE(start->press.source.IsTouch());
            cx.GrabPress(start->press, b->id, GrabMode::Drag);
            log.push_back("start");
            return IsUsed::Used;
        }
        else if (std::holds_alternative<PressMoveEvent>(event))
            log.push_back("move");
        else if (const auto* end = std::get_if<PressEndEvent>(&event))
            log.push_back(end->success ? "end:true" : "end:false");
        return IsUsed::Unused;
    };
    tree.e->on_event = [e=tree.e](EventCx& cx, const Event& event) {
        if (const auto* start = std::get_if<PressStartEvent>(&event))
        {
            cx.GrabPress(start->press, e->id, GrabMode::PanOnly);
            return IsUsed::Used;
        }
        return IsUsed::Unused;
    };

    Touch(window, TouchPhase::Started, 1, 10, 10);
    Touch(window, TouchPhase::Moved, 1, 20, 10);
    Touch(window, TouchPhase::Ended, 1, 20, 10);
    TEST_REQUIRE(log == (std::vector<std::string>{"start", "move", "end:true"}));
    TEST_REQUIRE(window.GetState().GetPressState().GetNumTouches() == 0);

    log.clear();
    Touch(window, TouchPhase::Started, 2, 10, 10);
    Touch(window, TouchPhase::Cancelled, 2, 10, 10);
    TEST_REQUIRE(log == (std::vector<std::string>{"start", "end:false"}));

    // unknown touch is ignored
    Touch(window, TouchPhase::Moved, 9, 10, 10);

    // pan updates are delivered on the frame update
    Touch(window, TouchPhase::Started, 3, 150, 20);
    TEST_REQUIRE(window.NeedFrameUpdate());
    Touch(window, TouchPhase::Moved, 3, 160, 20);
    TEST_REQUIRE(!tree.e->HasEvent("Pan"));
    window.FrameUpdate();
    TEST_REQUIRE(tree.e->CountEvents("Pan") == 1);
    // nothing moved, no pan
    window.FrameUpdate();
    TEST_REQUIRE(tree.e->CountEvents("Pan") == 1);
    Touch(window, TouchPhase::Ended, 3, 160, 20);
    TEST_REQUIRE(!window.NeedFrameUpdate());
    // pan grabs don't get a press end
    TEST_REQUIRE(!tree.e->HasEvent("PressEnd"));
}

void unit_test_timers()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    Instant now = Clock::now();
    const Instant start = now;
    window.GetState().SetClock([&now]() { return now; });

    using ms = std::chrono::milliseconds;
    auto& state = window.GetState();

    // earliest wins
    state.RequestTimer(tree.b->id, TimerHandle(1, true), ms(100));
    now += ms(10);
    state.RequestTimer(tree.b->id, TimerHandle(1, true), ms(50));
    TEST_REQUIRE(state.GetTimers().GetNumTimers() == 1);
    TEST_REQUIRE(window.GetNextResume() == start + ms(60));

    // latest wins
    state.RequestTimer(tree.c->id, TimerHandle(1, false), ms(100));
    state.RequestTimer(tree.c->id, TimerHandle(1, false), ms(10));
    TEST_REQUIRE(state.GetTimers().GetNumTimers() == 2);

    now = start + ms(59);
    window.UpdateTimers();
    TEST_REQUIRE(!tree.b->HasEvent("Timer"));

    now = start + ms(60);
    window.UpdateTimers();
    TEST_REQUIRE(tree.b->CountEvents("Timer") == 1);
    TEST_REQUIRE(!tree.c->HasEvent("Timer"));
    TEST_REQUIRE(window.GetNextResume() == start + ms(110));

    // zero delay fires on the next update, not inline
    state.RequestTimer(tree.e->id, TimerHandle(2, true), ms(0));
    TEST_REQUIRE(!tree.e->HasEvent("Timer"));
    window.UpdateTimers();
    TEST_REQUIRE(tree.e->CountEvents("Timer") == 1);

    now = start + ms(200);
    window.UpdateTimers();
    TEST_REQUIRE(tree.c->CountEvents("Timer") == 1);
    TEST_REQUIRE(!window.GetNextResume().has_value());

    // frame timers
    state.RequestFrameTimer(tree.a->id, TimerHandle(3, true));
    TEST_REQUIRE(window.NeedFrameUpdate());
    window.FrameUpdate();
    TEST_REQUIRE(tree.a->CountEvents("Timer") == 1);
    TEST_REQUIRE(!window.NeedFrameUpdate());
}

void unit_test_nested_popups()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    EventCx cx(window.GetState(), runner, *tree.root);
    // P1 shows the subtree at a, P2 the subtree at b inside it
    const auto p1 = cx.AddPopup(MakePopup(tree.a, tree.e), false);
    const auto p2 = cx.AddPopup(MakePopup(tree.b, tree.c), false);
    window.ConfirmPopupSized(p1);
    window.ConfirmPopupSized(p2);
    window.FlushPending();

    // popups are probed first
    TEST_REQUIRE(window.Probe(Coord(10, 10)) == tree.b->id);
    TEST_REQUIRE(window.Probe(Coord(60, 10)) == tree.c->id);

    // click inside P1 but outside P2
    Click(window, 60, 10);
    TEST_REQUIRE(window.GetState().GetPopups().GetSize() == 1);
    TEST_REQUIRE(runner.windows_closed == std::vector<WindowId>{p2});
    TEST_REQUIRE(tree.c->HasEvent("PressStart"));
    TEST_REQUIRE(!tree.c->HasEvent("PopupClosed"));
    window.FlushPending();
    TEST_REQUIRE(tree.c->CountEvents("PopupClosed") == 1);
    TEST_REQUIRE(window.GetState().GetPopups().GetSize() == 1);

    // escape closes the top popup
    KeyPress(window, NamedKey::Escape, 1);
    TEST_REQUIRE(window.GetState().GetPopups().IsEmpty());
    TEST_REQUIRE(runner.windows_closed == (std::vector<WindowId>{p2, p1}));
    window.FlushPending();
    TEST_REQUIRE(tree.e->CountEvents("PopupClosed") == 1);

    // reopening works the same
    const auto p3 = cx.AddPopup(MakePopup(tree.a, tree.e), false);
    TEST_REQUIRE(window.GetState().GetPopups().GetSize() == 1);
    // a popup that was never sized gives no PopupClosed
    Click(window, 150, 150);
    TEST_REQUIRE(window.GetState().GetPopups().IsEmpty());
    TEST_REQUIRE(runner.windows_closed.back() == p3);
    window.FlushPending();
    TEST_REQUIRE(tree.e->CountEvents("PopupClosed") == 1);

    // suspending the application closes the popups
    test::TestAppData app;
    Window other(std::make_shared<WindowConfig>(), 2, runner, *tree.root, &app);
    other.FullConfigure();
    EventCx other_cx(other.GetState(), runner, *tree.root, &app);
    other_cx.AddPopup(MakePopup(tree.a, tree.e), false);
    other.Suspended();
    TEST_REQUIRE(other.GetState().GetPopups().IsEmpty());
    TEST_REQUIRE(app.suspend_count == 1);
}

void unit_test_popup_focus_restore()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();
    window.HandleInput(input::Focused { true });

    auto& state = window.GetState();
    EventCx cx(state, runner, *tree.root);

    state.SetNavFocus(tree.e->id, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(state.GetNavFocus() == tree.e->id);

    cx.AddPopup(MakePopup(tree.a, tree.e), true);
    window.FlushPending();
    TEST_REQUIRE(!state.GetNavFocus().has_value());
    TEST_REQUIRE(tree.e->HasEvent("LostNavFocus"));

    state.SetNavFocus(tree.b->id, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(state.GetNavFocus() == tree.b->id);

    cx.AddPopup(MakePopup(tree.c, tree.b), true);
    window.FlushPending();
    TEST_REQUIRE(!state.GetNavFocus().has_value());

    // losing the window focus closes every popup, the first
    // popup's saved focus is restored last
    window.HandleInput(input::Focused { false });
    TEST_REQUIRE(state.GetPopups().IsEmpty());
    TEST_REQUIRE(!state.WindowHasFocus());
    window.FlushPending();
    TEST_REQUIRE(state.GetNavFocus() == tree.e->id);
}

void unit_test_accelerators()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);

    tree.b->on_configure = [b=tree.b](ConfigCx& cx) {
        cx.AddAccelKeys(b->id, {Key::Character("x")});
    };
    // the popup subtree gets its own layer without alt
    tree.d->on_configure = [d=tree.d](ConfigCx& cx) {
        cx.NewAccelLayer(d->id, true);
    };
    tree.e->on_configure = [e=tree.e](ConfigCx& cx) {
        cx.AddAccelKeys(e->id, {Key::Character("y")});
    };
    std::vector<Command> b_commands;
    std::vector<Command> e_commands;
    RecordCommands(tree.b, &b_commands, {Command::Activate});
    RecordCommands(tree.e, &e_commands, {Command::Activate});
    window.FullConfigure();

    // root layer needs alt
    KeyPress(window, Key::Character("x"), 45);
    TEST_REQUIRE(b_commands.empty());

    SetModifiers(window, Modifiers(Modifier::Alt));
    KeyPress(window, Key::Character("x"), 45);
    TEST_REQUIRE(b_commands == std::vector<Command>{Command::Activate});
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.b->id);

    // keys of a layer are only found while its popup is open
    KeyPress(window, Key::Character("y"), 46);
    TEST_REQUIRE(e_commands.empty());
    SetModifiers(window, Modifiers());

    EventCx cx(window.GetState(), runner, *tree.root);
    cx.AddPopup(MakePopup(tree.d, tree.a), false);
    KeyPress(window, Key::Character("y"), 46);
    TEST_REQUIRE(e_commands == std::vector<Command>{Command::Activate});

    // disabled target
    b_commands.clear();
    window.GetState().SetDisabled(tree.b->id, true);
    SetModifiers(window, Modifiers(Modifier::Alt));
    KeyPress(window, Key::Character("x"), 45);
    TEST_REQUIRE(b_commands.empty());
}

void unit_test_shortcut_routing()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    std::vector<Command> c_commands;
    std::vector<Command> a_commands;
    RecordCommands(tree.c, &c_commands, {Command::Copy});
    RecordCommands(tree.a, &a_commands, {Command::Paste});

    auto& state = window.GetState();
    state.SetNavFocus(tree.c->id, FocusSource::Key);
    window.FlushPending();

    // nav focus target first, the command bubbles up from there
    SetModifiers(window, Modifiers(Modifier::Ctrl));
    KeyPress(window, Key::Character("c"), 46);
    TEST_REQUIRE(c_commands == std::vector<Command>{Command::Copy});
    TEST_REQUIRE(a_commands.empty());
    KeyPress(window, Key::Character("v"), 47);
    TEST_REQUIRE(c_commands.back() == Command::Paste);
    TEST_REQUIRE(a_commands == std::vector<Command>{Command::Paste});

    // key down depresses, the key release clears the depress
    tree.c->on_event = [c=tree.c](EventCx& cx, const Event& event) {
        if (const auto* cmd = std::get_if<CommandEvent>(&event))
        {
            if (cmd->code.has_value())
                cx.DepressWithKey(c->id, cmd->code.value());
            return IsUsed::Used;
        }
        return IsUsed::Unused;
    };
    KeyEvent event;
    event.physical_key = 46;
    event.logical_key  = Key::Character("c");
    event.key_without_modifiers = Key::Character("c");
    window.HandleInput(input::KeyboardInput { event, false });
    TEST_REQUIRE(state.IsDepressed(tree.c->id));
    event.state = ElementState::Released;
    window.HandleInput(input::KeyboardInput { event, false });
    TEST_REQUIRE(!state.IsDepressed(tree.c->id));
    tree.c->on_event = nullptr;

    // unused exit and close are handled by the window
    SetModifiers(window, Modifiers(Modifier::Ctrl));
    KeyPress(window, Key::Character("q"), 16);
    TEST_REQUIRE(runner.exit_count == 0);
    window.FlushPending();
    TEST_REQUIRE(runner.exit_count == 1);

    SetModifiers(window, Modifiers(Modifier::Alt));
    KeyPress(window, NamedKey::F4, 62);
    TEST_REQUIRE(window.FlushPending().test(Action::Close));
}

void unit_test_hover()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    tree.b->on_event = [](EventCx& cx, const Event& event) {
        if (const auto* hover = std::get_if<MouseHoverEvent>(&event))
        {
            if (hover->hover)
                cx.SetHoverIcon(CursorIcon::Pointer);
            return IsUsed::Used;
        }
        return IsUsed::Unused;
    };

    auto& state = window.GetState();
    window.HandleInput(input::CursorEntered {});
    MoveTo(window, 10, 10);
    TEST_REQUIRE(state.IsHovered(tree.b->id));
    TEST_REQUIRE(state.IsHoveredRecursive(tree.a->id));
    TEST_REQUIRE(!state.IsHoveredRecursive(tree.d->id));
    TEST_REQUIRE(tree.b->CountEvents("MouseHover") == 1);
    TEST_REQUIRE(tree.b->HasEvent("CursorMove"));
    window.FlushPending();
    TEST_REQUIRE(runner.cursor_icons == std::vector<CursorIcon>{CursorIcon::Pointer});

    // moving within the same widget doesn't change the hover
    MoveTo(window, 20, 20);
    TEST_REQUIRE(tree.b->CountEvents("MouseHover") == 1);

    window.HandleInput(input::MouseWheel { ScrollDelta::MakeLines(0.0, -1.0) });
    TEST_REQUIRE(tree.b->HasEvent("Scroll"));
    TEST_REQUIRE(tree.a->HasEvent("Scroll"));

    MoveTo(window, 150, 150);
    TEST_REQUIRE(state.GetHover() == Id::Root());
    TEST_REQUIRE(tree.b->CountEvents("MouseHover") == 2);
    window.FlushPending();
    TEST_REQUIRE(runner.cursor_icons.back() == CursorIcon::Default);

    window.HandleInput(input::CursorLeft {});
    TEST_REQUIRE(!state.GetHover().has_value());

    // region moved re-probes the hover
    MoveTo(window, 10, 10);
    tree.b->rect.pos = Coord(150, 150);
    state.RegionMoved();
    window.FlushPending();
    TEST_REQUIRE(state.GetHover() == tree.a->id);

    // so does a reconfigure
    tree.b->rect.pos = Coord(0, 0);
    window.FullConfigure();
    TEST_REQUIRE(state.GetHover() == tree.b->id);
    TEST_REQUIRE(tree.a->events.back() == "MouseHover");
    window.FlushPending();
    TEST_REQUIRE(runner.cursor_icons.back() == CursorIcon::Pointer);

    // nothing to probe with the cursor outside the window
    window.HandleInput(input::CursorLeft {});
    tree.b->rect.pos = Coord(150, 150);
    window.FullConfigure();
    TEST_REQUIRE(!state.GetHover().has_value());
}

void unit_test_input_focus()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    std::vector<std::string> text;
    tree.c->on_event = [&text, c=tree.c](EventCx& cx, const Event& event) {
        if (const auto* start = std::get_if<PressStartEvent>(&event))
        {
            cx.RequestKeyFocus(c->id, ImePurpose::Normal, FocusSource::Pointer);
            return IsUsed::Used;
        }
        else if (const auto* commit = std::get_if<ImeCommitEvent>(&event))
        {
            text.push_back(commit->text);
            return IsUsed::Used;
        }
        else if (const auto* key = std::get_if<KeyInputEvent>(&event))
        {
            if (key->key.text.has_value())
                text.push_back(key->key.text.value());
            return IsUsed::Used;
        }
        return IsUsed::Unused;
    };

    auto& state = window.GetState();
    Click(window, 60, 10);
    TEST_REQUIRE(state.HasSelFocus(tree.c->id));
    TEST_REQUIRE(!tree.c->HasEvent("SelFocus"));
    window.FlushPending();
    TEST_REQUIRE(state.GetNavFocus() == tree.c->id);
    TEST_REQUIRE(state.HasKeyFocus(tree.c->id));
    TEST_REQUIRE(state.GetImeFocus() == tree.c->id);
    TEST_REQUIRE(tree.c->HasEvent("SelFocus"));
    TEST_REQUIRE(tree.c->HasEvent("KeyFocus"));
    TEST_REQUIRE(tree.c->HasEvent("ImeFocus"));
    TEST_REQUIRE(runner.ime_requests.size() == 1);
    TEST_REQUIRE(runner.ime_requests[0] == ImePurpose::Normal);

    window.HandleInput(input::ImePreedit { "ab", std::nullopt });
    TEST_REQUIRE(tree.c->HasEvent("ImePreedit"));
    window.HandleInput(input::ImeCommit { "abc" });

    KeyEvent event;
    event.physical_key = 20;
    event.logical_key  = Key::Character("q");
    event.key_without_modifiers = Key::Character("q");
    event.text = "q";
    window.HandleInput(input::KeyboardInput { event, false });
    TEST_REQUIRE(text == (std::vector<std::string>{"abc", "q"}));

    window.HandleInput(input::ImeDisabled {});
    TEST_REQUIRE(tree.c->HasEvent("LostImeFocus"));
    TEST_REQUIRE(!state.GetImeFocus().has_value());
    TEST_REQUIRE(state.HasKeyFocus(tree.c->id));

    // focus moving elsewhere takes the selection
    Click(window, 150, 20);
    window.FlushPending();
    TEST_REQUIRE(state.GetNavFocus() == tree.e->id);
    TEST_REQUIRE(!state.GetSelFocus().has_value());
    TEST_REQUIRE(tree.c->HasEvent("LostKeyFocus"));
    TEST_REQUIRE(tree.c->HasEvent("LostSelFocus"));

    // IME not available
    runner.ime_available = false;
    tree.c->events.clear();
    Click(window, 60, 10);
    window.FlushPending();
    TEST_REQUIRE(state.HasKeyFocus(tree.c->id));
    TEST_REQUIRE(!tree.c->HasEvent("ImeFocus"));
    TEST_REQUIRE(!state.GetImeFocus().has_value());
}

void unit_test_disable_focused()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    std::vector<std::string> log;
    tree.b->on_event = [&log, b=tree.b](EventCx& cx, const Event& event) {
        if (const auto* start = std::get_if<PressStartEvent>(&event))
        {
            cx.GrabPress(start->press, b->id, GrabMode::Drag);
            cx.RequestSelFocus(b->id, FocusSource::Pointer);
            return IsUsed::Used;
        }
        else if (const auto* end = std::get_if<PressEndEvent>(&event))
            log.push_back(end->success ? "end:true" : "end:false");
        return IsUsed::Unused;
    };

    auto& state = window.GetState();
    MoveTo(window, 10, 10);
    Mouse(window, ElementState::Pressed);
    window.FlushPending();
    TEST_REQUIRE(state.GetNavFocus() == tree.b->id);
    TEST_REQUIRE(state.GetSelFocus() == tree.b->id);
    TEST_REQUIRE(state.GetPressState().HasMouseGrab());

    state.SetDisabled(tree.b->id, true);
    TEST_REQUIRE(!state.GetNavFocus().has_value());
    TEST_REQUIRE(!state.GetSelFocus().has_value());
    TEST_REQUIRE(!state.GetPressState().HasMouseGrab());
    TEST_REQUIRE(state.GetAction() == ActionFlags(Action::Redraw));
    TEST_REQUIRE(log.empty());

    // the cancel and the focus loss are delivered on flush
    window.FlushPending();
    TEST_REQUIRE(log == std::vector<std::string>{"end:false"});
    TEST_REQUIRE(tree.b->HasEvent("LostNavFocus"));
    TEST_REQUIRE(tree.b->HasEvent("LostSelFocus"));

    // releasing the button after the grab was cancelled does nothing
    Mouse(window, ElementState::Released);
    TEST_REQUIRE(log.size() == 1);
}

void unit_test_queued_sends()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    test::TestAppData app;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root, &app);
    window.FullConfigure();

    std::vector<std::string> received;
    tree.c->on_messages = [&received](EventCx& cx) {
        while (auto str = cx.TryPop<std::string>())
            received.push_back(str.value());
    };
    tree.b->on_event = [c=tree.c](EventCx& cx, const Event& event) {
        if (!std::holds_alternative<CommandEvent>(event))
            return IsUsed::Unused;
        // the message in flight forces the send to be queued
        cx.Push(std::string("for app"));
        cx.Send(c->id, std::string("later"));
        return IsUsed::Used;
    };

    window.HandleAccessAction(tree.b->id, AccessAction { AccessAction::Type::Click, {} });
    TEST_REQUIRE(app.strings == std::vector<std::string>{"for app"});
    TEST_REQUIRE(received.empty());
    window.FlushPending();
    TEST_REQUIRE(received == std::vector<std::string>{"later"});

    // commands are always queued
    EventCx cx(window.GetState(), runner, *tree.root, &app);
    tree.e->events.clear();
    cx.SendCommand(tree.e->id, Command::Copy);
    TEST_REQUIRE(!tree.e->HasEvent("Command"));
    window.FlushPending();
    TEST_REQUIRE(tree.e->CountEvents("Command") == 1);

    // unused exit command sent to a widget exits
    cx.SendCommand(tree.e->id, Command::Exit);
    window.FlushPending();
    TEST_REQUIRE(runner.exit_count == 1);

    // application actions are accumulated
    app.action = ActionFlags(Action::ThemeSwitch);
    tree.e->on_event = [](EventCx& cx, const Event& event) {
        cx.Push(std::string("hello"));
        return IsUsed::Used;
    };
    cx.SendEvent(tree.e->id, CommandEvent { Command::Activate, std::nullopt });
    TEST_REQUIRE(window.FlushPending().test(Action::ThemeSwitch));
}

void unit_test_access_actions()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();

    unsigned increments = 0;
    unsigned decrements = 0;
    std::vector<double> values;
    std::vector<std::string> texts;
    tree.b->on_messages = [&](EventCx& cx) {
        if (cx.TryPop<msg::IncrementStep>())
            ++increments;
        else if (cx.TryPop<msg::DecrementStep>())
            ++decrements;
        else if (auto value = cx.TryPop<msg::SetValueF64>())
            values.push_back(value->value);
        else if (auto text = cx.TryPop<msg::SetValueText>())
            texts.push_back(text->value);
    };
    using Type = AccessAction::Type;

    window.HandleAccessAction(tree.b->id, AccessAction { Type::Click, {} });
    TEST_REQUIRE(tree.b->HasEvent("Command"));
    window.HandleAccessAction(tree.b->id, AccessAction { Type::Increment, {} });
    window.HandleAccessAction(tree.b->id, AccessAction { Type::Increment, {} });
    window.HandleAccessAction(tree.b->id, AccessAction { Type::Decrement, {} });
    TEST_REQUIRE(increments == 2);
    TEST_REQUIRE(decrements == 1);

    window.HandleAccessAction(tree.b->id, AccessAction { Type::SetValue, 2.5 });
    window.HandleAccessAction(tree.b->id, AccessAction { Type::SetValue, std::string("foo") });
    // mismatched data is ignored
    window.HandleAccessAction(tree.b->id, AccessAction { Type::SetValue, {} });
    TEST_REQUIRE(values == std::vector<double>{2.5});
    TEST_REQUIRE(texts == std::vector<std::string>{"foo"});

    window.HandleAccessAction(tree.b->id, AccessAction { Type::ScrollDown, {} });
    TEST_REQUIRE(tree.b->HasEvent("Scroll"));
    TEST_REQUIRE(tree.a->HasEvent("Scroll"));

    window.HandleAccessAction(tree.b->id, AccessAction { Type::ScrollIntoView, {} });
    TEST_REQUIRE(tree.a->scrolls.size() == 1);
    TEST_REQUIRE(tree.a->scrolls[0] == Scroll::MakeRect(tree.b->rect));

    window.HandleAccessAction(tree.b->id, AccessAction { Type::Focus, {} });
    window.FlushPending();
    TEST_REQUIRE(window.GetState().GetNavFocus() == tree.b->id);
    window.HandleAccessAction(tree.b->id, AccessAction { Type::Blur, {} });
    window.FlushPending();
    TEST_REQUIRE(!window.GetState().GetNavFocus().has_value());

    // stale and disabled targets are ignored
    tree.b->events.clear();
    window.HandleAccessAction(Id::FromPath({0, 9}), AccessAction { Type::Click, {} });
    window.GetState().SetDisabled(tree.b->id, true);
    window.HandleAccessAction(tree.b->id, AccessAction { Type::Click, {} });
    TEST_REQUIRE(!tree.b->HasEvent("Command"));
}

void unit_test_reconfigure()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root);
    window.FullConfigure();
    TEST_REQUIRE(window.FlushPending().test(Action::Resize));

    auto& state = window.GetState();
    MoveTo(window, 150, 20);
    state.SetNavFocus(tree.e->id, FocusSource::Key);
    window.FlushPending();
    TEST_REQUIRE(state.GetNavFocus() == tree.e->id);
    TEST_REQUIRE(state.GetHover() == tree.e->id);

    state.SetDisabled(tree.c->id, true);

    // e goes away
    tree.d->children.clear();
    tree.e = nullptr;
    window.FullConfigure();
    TEST_REQUIRE(!state.GetNavFocus().has_value());
    TEST_REQUIRE(!state.GetHover().has_value());
    // disabled state is set by the configure pass
    TEST_REQUIRE(!state.IsDisabled(tree.c->id));
    TEST_REQUIRE(tree.root->configure_count == 2);

    // update request on a widget updates its subtree only
    state.RequestUpdate(tree.b->id);
    state.RequestUpdate(tree.c->id);
    window.FlushPending();
    TEST_REQUIRE(tree.a->update_count == 1);
    TEST_REQUIRE(tree.b->update_count == 1);
    TEST_REQUIRE(tree.d->update_count == 0);

    // reconfigure on a subtree
    state.RequestReconfigure(tree.c->id);
    window.FlushPending();
    TEST_REQUIRE(tree.c->configure_count == 3);
    TEST_REQUIRE(tree.a->configure_count == 2);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_window.log");

    unit_test_nav_fallback();
    unit_test_tab_navigation();
    unit_test_nav_focus_from();
    unit_test_mouse_grab();
    unit_test_drag_grab();
    unit_test_touch();
    unit_test_timers();
    unit_test_nested_popups();
    unit_test_popup_focus_restore();
    unit_test_accelerators();
    unit_test_shortcut_routing();
    unit_test_hover();
    unit_test_input_focus();
    unit_test_disable_focused();
    unit_test_queued_sends();
    unit_test_access_actions();
    unit_test_reconfigure();
    return 0;
}
) // TEST_MAIN

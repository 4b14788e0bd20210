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

#include <memory>
#include <string>
#include <vector>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/event_state.h"
#include "evtcore/event_cx.h"
#include "evtcore/node.h"
#include "evtcore/unit_test/test_node.h"

using namespace evt;
using test::TestNode;
using Tree = test::TestTree;

namespace {
std::shared_ptr<const WindowConfig> MakeConfig()
{
    return std::make_shared<const WindowConfig>();
}

} // namespace

void unit_test_configure_ids()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx config(state);
    config.Configure(*tree.root, Id::Root());

    TEST_REQUIRE(tree.root->id == Id::Root());
    TEST_REQUIRE(tree.a->id == Id::FromPath({0}));
    TEST_REQUIRE(tree.b->id == Id::FromPath({0, 0}));
    TEST_REQUIRE(tree.c->id == Id::FromPath({0, 1}));
    TEST_REQUIRE(tree.d->id == Id::FromPath({1}));
    TEST_REQUIRE(tree.e->id == Id::FromPath({1, 0}));
    TEST_REQUIRE(tree.root->configure_count == 1);
    TEST_REQUIRE(tree.e->configure_count == 1);

    TEST_REQUIRE(FindNode(*tree.root, tree.c->id) == tree.c);
    TEST_REQUIRE(FindNode(*tree.root, tree.e->id) == tree.e);
    TEST_REQUIRE(FindNode(*tree.root, Id::FromPath({0, 5})) == nullptr);
    TEST_REQUIRE(FindNode(*tree.root, Id()) == nullptr);
    TEST_REQUIRE(FindNodeRect(*tree.root, tree.c->id).value() == tree.c->rect);

    TEST_REQUIRE(tree.root->Probe(Coord(10, 10)) == tree.b->id);
    TEST_REQUIRE(tree.root->Probe(Coord(60, 10)) == tree.c->id);
    TEST_REQUIRE(tree.root->Probe(Coord(10, 70)) == tree.a->id);
    TEST_REQUIRE(tree.root->Probe(Coord(150, 20)) == tree.e->id);
    TEST_REQUIRE(tree.root->Probe(Coord(150, 150)) == Id::Root());

    config.Update(*tree.a);
    TEST_REQUIRE(tree.a->update_count == 1);
    TEST_REQUIRE(tree.c->update_count == 1);
    TEST_REQUIRE(tree.d->update_count == 0);
}

void unit_test_event_bubbling()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());
    test::TestRunner runner;
    EventCx cx(state, runner, *tree.root);

    // reusable command (from a key) bubbles to every ancestor
    TEST_REQUIRE(cx.SendEvent(tree.b->id, CommandEvent { Command::Enter, 13 }) == IsUsed::Unused);
    TEST_REQUIRE(tree.b->events == std::vector<std::string>{"Command"});
    TEST_REQUIRE(tree.a->events == std::vector<std::string>{"Command"});
    TEST_REQUIRE(tree.root->events == std::vector<std::string>{"Command"});
    TEST_REQUIRE(tree.c->events.empty());
    TEST_REQUIRE(tree.d->events.empty());

    // the ancestor that uses the event stops the bubbling
    tree.ClearEvents();
    tree.a->on_event = [](EventCx&, const Event& event) {
        return std::holds_alternative<CommandEvent>(event) ? IsUsed::Used : IsUsed::Unused;
    };
    TEST_REQUIRE(cx.SendEvent(tree.b->id, CommandEvent { Command::Enter, 13 }) == IsUsed::Used);
    TEST_REQUIRE(tree.b->HasEvent("Command"));
    TEST_REQUIRE(tree.a->HasEvent("Command"));
    TEST_REQUIRE(tree.root->events.empty());

    // a targeted command is only offered to the target
    tree.ClearEvents();
    TEST_REQUIRE(cx.SendEvent(tree.b->id, CommandEvent { Command::Activate, std::nullopt }) == IsUsed::Unused);
    TEST_REQUIRE(tree.b->HasEvent("Command"));
    TEST_REQUIRE(tree.a->events.empty());

    // notifications are not reusable
    tree.ClearEvents();
    cx.SendEvent(tree.b->id, LostNavFocusEvent {});
    cx.SendEvent(tree.b->id, PressEndEvent {});
    TEST_REQUIRE(tree.b->events.size() == 2);
    TEST_REQUIRE(tree.a->events.empty());
    TEST_REQUIRE(tree.root->events.empty());

    // scroll events bubble
    tree.ClearEvents();
    cx.SendEvent(tree.e->id, ScrollEvent { ScrollDelta::MakeLines(0.0, 1.0) });
    TEST_REQUIRE(tree.e->HasEvent("Scroll"));
    TEST_REQUIRE(tree.d->HasEvent("Scroll"));
    TEST_REQUIRE(tree.root->HasEvent("Scroll"));
    TEST_REQUIRE(tree.a->events.empty());

    // stale target
    tree.ClearEvents();
    TEST_REQUIRE(cx.SendEvent(Id::FromPath({0, 7}), CommandEvent { Command::Enter, 13 }) == IsUsed::Unused);
    TEST_REQUIRE(tree.a->events.empty());
    TEST_REQUIRE(tree.root->events.empty());
}

void unit_test_message_handling()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());
    test::TestRunner runner;
    test::TestAppData app;
    app.action = ActionFlags(Action::Update);
    EventCx cx(state, runner, *tree.root, &app);

    tree.b->on_event = [](EventCx& cx, const Event& event) {
        cx.Push(std::string("to app"));
        cx.Push(42);
        return IsUsed::Used;
    };
    std::vector<int> ints;
    std::optional<std::size_t> last_child;
    tree.a->on_messages = [&ints, &last_child](EventCx& cx) {
        last_child = cx.GetLastChild();
        if (auto value = cx.TryPop<int>())
            ints.push_back(value.value());
        // string is not on top anymore but it's not ours to take
        TEST_REQUIRE(cx.TryPeek<std::string>() != nullptr);
    };
    unsigned root_calls = 0;
    tree.root->on_messages = [&root_calls](EventCx& cx) {
        ++root_calls;
        TEST_REQUIRE(cx.HasMessages());
    };

    TEST_REQUIRE(cx.SendEvent(tree.b->id, CommandEvent { Command::Activate, std::nullopt }) == IsUsed::Used);
    TEST_REQUIRE(ints == std::vector<int>{42});
    TEST_REQUIRE(last_child == std::size_t(0));
    TEST_REQUIRE(root_calls == 1);
    TEST_REQUIRE(app.strings == std::vector<std::string>{"to app"});
    TEST_REQUIRE(state.GetAction().test(Action::Update));
    TEST_REQUIRE(!state.GetMessages().HasAny());

    // messages nobody handles are dropped
    tree.a->on_messages = nullptr;
    tree.root->on_messages = nullptr;
    tree.b->on_event = [](EventCx& cx, const Event& event) {
        cx.Push(1.5f);
        return IsUsed::Used;
    };
    cx.SendEvent(tree.b->id, CommandEvent { Command::Activate, std::nullopt });
    TEST_REQUIRE(!state.GetMessages().HasAny());
    TEST_REQUIRE(app.strings.size() == 1);

    // a message sent when nothing is in flight is delivered right away
    // to the target's and the ancestors' message handlers
    std::vector<std::string> received;
    tree.c->on_messages = [&received](EventCx& cx) {
        if (auto str = cx.TryPop<std::string>())
            received.push_back(str.value());
    };
    cx.Send(tree.c->id, std::string("hello"));
    TEST_REQUIRE(received == std::vector<std::string>{"hello"});
    cx.Send(tree.b->id, std::string("nobody"));
    TEST_REQUIRE(received.size() == 1);
    TEST_REQUIRE(app.strings.size() == 2);
    TEST_REQUIRE(app.strings[1] == "nobody");

    // a message to a stale target is dropped
    cx.Send(Id::FromPath({4}), std::string("stale"));
    TEST_REQUIRE(app.strings.size() == 2);

    // a command is sent as a command event
    tree.ClearEvents();
    cx.Send(tree.c->id, Command::Copy);
    TEST_REQUIRE(tree.c->HasEvent("Command"));
}

void unit_test_scroll_side_channel()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());
    test::TestRunner runner;
    EventCx cx(state, runner, *tree.root);

    tree.b->on_event = [](EventCx& cx, const Event& event) {
        cx.SetScroll(Scroll::MakeOffset(Offset(0, 10)));
        return IsUsed::Used;
    };
    cx.SendEvent(tree.b->id, CommandEvent { Command::Down, std::nullopt });
    TEST_REQUIRE(tree.a->scrolls.size() == 1);
    TEST_REQUIRE(tree.a->scrolls[0] == Scroll::MakeOffset(Offset(0, 10)));
    TEST_REQUIRE(tree.root->scrolls.size() == 1);
    TEST_REQUIRE(tree.b->scrolls.empty());
    TEST_REQUIRE(tree.d->scrolls.empty());
    // the scroll doesn't leak out of the dispatch
    TEST_REQUIRE(!cx.GetScroll().IsSet());

    // an ancestor can consume the scroll request
    tree.ClearEvents();
    tree.a->on_event = nullptr;
    tree.c->on_event = [](EventCx& cx, const Event& event) {
        cx.SetScroll(Scroll::MakeScrolled());
        return IsUsed::Used;
    };
    cx.SendEvent(tree.c->id, CommandEvent { Command::Down, std::nullopt });
    TEST_REQUIRE(tree.a->scrolls.size() == 1);
    TEST_REQUIRE(tree.a->scrolls[0] == Scroll::MakeScrolled());
}

void unit_test_disabled()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());
    test::TestRunner runner;
    EventCx cx(state, runner, *tree.root);

    state.TakeAction();
    state.SetDisabled(tree.a->id, true);
    TEST_REQUIRE(state.GetAction().test(Action::Redraw));
    TEST_REQUIRE(state.IsDisabled(tree.a->id));
    TEST_REQUIRE(state.IsDisabled(tree.b->id));
    TEST_REQUIRE(state.IsDisabled(tree.c->id));
    TEST_REQUIRE(!state.IsDisabled(tree.root->id));
    TEST_REQUIRE(!state.IsDisabled(tree.d->id));
    TEST_REQUIRE(!state.IsDisabled(tree.e->id));

    // the event is redirected to the disabled ancestor and left unused
    TEST_REQUIRE(cx.SendEvent(tree.b->id, CommandEvent { Command::Activate, std::nullopt }) == IsUsed::Unused);
    TEST_REQUIRE(tree.b->events.empty());
    TEST_REQUIRE(tree.a->events.empty());
    TEST_REQUIRE(tree.root->events.empty());

    // a reusable event can still be used by an enabled ancestor
    TEST_REQUIRE(cx.SendEvent(tree.b->id, CommandEvent { Command::Enter, 13 }) == IsUsed::Unused);
    TEST_REQUIRE(tree.b->events.empty());
    TEST_REQUIRE(tree.a->events.empty());
    TEST_REQUIRE(tree.root->HasEvent("Command"));

    // notifications still pass
    tree.ClearEvents();
    cx.SendEvent(tree.b->id, LostNavFocusEvent {});
    cx.SendEvent(tree.b->id, MouseHoverEvent { false });
    cx.SendEvent(tree.b->id, MouseHoverEvent { true });
    TEST_REQUIRE(tree.b->events == (std::vector<std::string>{"LostNavFocus", "MouseHover"}));

    // nested disable, enabling the outer leaves the inner
    state.SetDisabled(tree.b->id, true);
    state.SetDisabled(tree.a->id, false);
    TEST_REQUIRE(!state.IsDisabled(tree.a->id));
    TEST_REQUIRE(!state.IsDisabled(tree.c->id));
    TEST_REQUIRE(state.IsDisabled(tree.b->id));

    tree.ClearEvents();
    cx.SendEvent(tree.c->id, CommandEvent { Command::Activate, std::nullopt });
    TEST_REQUIRE(tree.c->HasEvent("Command"));
}

void unit_test_disable_cancels_state()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());
    test::TestRunner runner;
    EventCx cx(state, runner, *tree.root);

    TEST_REQUIRE(cx.RequestSelFocus(tree.b->id, FocusSource::Pointer));
    TEST_REQUIRE(!cx.RequestSelFocus(tree.b->id, FocusSource::Pointer));
    TEST_REQUIRE(state.HasSelFocus(tree.b->id));

    Press press;
    press.source = PressSource::Mouse(MouseButton::Left, 1);
    press.id = tree.b->id;
    TEST_REQUIRE(cx.GrabPress(press, tree.b->id, GrabMode::Drag));
    TEST_REQUIRE(state.GetPressState().HasMouseGrab());
    // the owner is depressed to begin with
    TEST_REQUIRE(state.IsDepressed(tree.b->id));
    TEST_REQUIRE(!cx.SetGrabDepress(press.source, tree.b->id));
    TEST_REQUIRE(cx.SetGrabDepress(press.source, std::nullopt));
    TEST_REQUIRE(!state.IsDepressed(tree.b->id));
    TEST_REQUIRE(cx.SetGrabDepress(press.source, tree.b->id));
    // only one mouse grab at a time
    TEST_REQUIRE(!cx.GrabPress(press, tree.c->id, GrabMode::Click));

    cx.DepressWithKey(tree.c->id, 32);
    TEST_REQUIRE(state.IsDepressed(tree.c->id));

    // disabling a sibling subtree doesn't touch them
    state.SetDisabled(tree.d->id, true);
    TEST_REQUIRE(state.HasSelFocus(tree.b->id));
    TEST_REQUIRE(state.GetPressState().HasMouseGrab());

    state.TakeAction();
    state.SetDisabled(tree.a->id, true);
    TEST_REQUIRE(!state.HasSelFocus(tree.b->id));
    TEST_REQUIRE(!state.GetSelFocus().has_value());
    TEST_REQUIRE(!state.GetPressState().HasMouseGrab());
    TEST_REQUIRE(!state.IsDepressed(tree.b->id));
    TEST_REQUIRE(!state.IsDepressed(tree.c->id));
    TEST_REQUIRE(state.GetAction().test(Action::Redraw));
}

void unit_test_nav_focus_requests()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());

    state.TakeAction();
    state.SetNavFocus(tree.b->id, FocusSource::Key);
    TEST_REQUIRE(state.GetAction().test(Action::Redraw));
    state.TakeAction();
    // staging the same change again is a no-op
    state.SetNavFocus(tree.b->id, FocusSource::Key);
    TEST_REQUIRE(!state.GetAction().test(Action::Redraw));

    // nav focus disabled in the window configuration
    auto config = std::make_shared<WindowConfig>();
    config->EnableNavFocus(false);
    EventState other(config, 2);
    other.SetNavFocus(tree.b->id, FocusSource::Key);
    TEST_REQUIRE(other.GetAction().empty());
}

void unit_test_requests()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());
    test::TestRunner runner;
    EventCx cx(state, runner, *tree.root);

    // actions requested on behalf of a widget
    cx.RequestAction(tree.b->id, ActionFlags(Action::Update) | Action::Redraw);
    TEST_REQUIRE(state.GetAction().test(Action::Redraw));
    TEST_REQUIRE(!state.GetAction().test(Action::Update));

    // clipboard
    TEST_REQUIRE(!cx.GetClipboard().has_value());
    cx.SetClipboard("foo");
    TEST_REQUIRE(cx.GetClipboard() == std::string("foo"));
    runner.fail_clipboard = true;
    cx.SetClipboard("bar");
    TEST_REQUIRE(cx.GetClipboard() == std::string("foo"));
    TEST_REQUIRE(!cx.GetPrimary().has_value());

    // timers
    TEST_REQUIRE(!state.GetNextResume().has_value());
    cx.RequestTimer(tree.b->id, TimerHandle(1, true), std::chrono::milliseconds(100));
    TEST_REQUIRE(state.GetNextResume().has_value());
    TEST_REQUIRE(!state.NeedFrameUpdate());
    cx.RequestFrameTimer(tree.c->id, TimerHandle(2, true));
    TEST_REQUIRE(state.NeedFrameUpdate());

    // windows
    TEST_REQUIRE(cx.AddWindow(WindowDescriptor { "other", {100, 100} }) == 100);
    cx.CloseWindow(100);
    TEST_REQUIRE(runner.windows_closed == std::vector<WindowId>{100});
}

void unit_test_popups()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    EventState state(MakeConfig(), 1);
    ConfigCx(state).Configure(*tree.root, Id::Root());
    test::TestRunner runner;
    EventCx cx(state, runner, *tree.root);

    PopupDescriptor outer;
    outer.id     = tree.a->id;
    outer.parent = tree.e->id;
    outer.rect   = tree.e->rect;
    const auto w1 = cx.AddPopup(outer, false);

    PopupDescriptor inner;
    inner.id     = tree.b->id;
    inner.parent = tree.c->id;
    inner.rect   = tree.c->rect;
    const auto w2 = cx.AddPopup(inner, false);

    TEST_REQUIRE(w1 != w2);
    TEST_REQUIRE(state.GetPopups().GetSize() == 2);
    TEST_REQUIRE(runner.popups_opened == (std::vector<Id>{tree.a->id, tree.b->id}));
    // the parent of an open popup is drawn depressed
    TEST_REQUIRE(state.IsDepressed(tree.e->id));
    TEST_REQUIRE(state.IsDepressed(tree.c->id));

    // the popup's id cannot change
    PopupDescriptor moved = inner;
    moved.rect.pos = Coord(5, 5);
    TEST_REQUIRE(cx.RepositionPopup(w2, moved));
    TEST_REQUIRE(runner.reposition_count == 1);
    moved.id = tree.c->id;
    TEST_REQUIRE(!cx.RepositionPopup(w2, moved));
    TEST_REQUIRE(runner.reposition_count == 1);

    // c is inside the outer popup but not the inner
    cx.CloseNonAncestorsOf(tree.c->id);
    TEST_REQUIRE(state.GetPopups().GetSize() == 1);
    TEST_REQUIRE(runner.windows_closed == std::vector<WindowId>{w2});
    TEST_REQUIRE(!state.IsDepressed(tree.c->id));

    // closing an unknown popup does nothing
    cx.ClosePopup(12345);
    TEST_REQUIRE(state.GetPopups().GetSize() == 1);

    // closing the outer closes everything above it too
    cx.AddPopup(inner, false);
    cx.ClosePopup(w1);
    TEST_REQUIRE(state.GetPopups().IsEmpty());
    TEST_REQUIRE(runner.windows_closed.size() == 3);
    TEST_REQUIRE(runner.windows_closed[1] != w1);
    TEST_REQUIRE(runner.windows_closed[2] == w1);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_dispatch.log");

    unit_test_configure_ids();
    unit_test_event_bubbling();
    unit_test_message_handling();
    unit_test_scroll_side_channel();
    unit_test_disabled();
    unit_test_disable_cancels_state();
    unit_test_nav_focus_requests();
    unit_test_requests();
    unit_test_popups();
    return 0;
}
) // TEST_MAIN

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

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/press.h"

using evt::Id;
using evt::Coord;
using evt::DVec2;
using evt::GrabMode;
using evt::MouseButton;

void unit_test_mouse_grab()
{
    TEST_CASE(test::Type::Feature)

    const auto a = Id::FromPath({0});
    const auto b = Id::FromPath({1});

    evt::PressState press;
    TEST_REQUIRE(!press.HasMouseGrab());
    TEST_REQUIRE(!press.EndMouseGrab(true, a, Coord(0, 0)).has_value());

    TEST_REQUIRE(press.StartMouseGrab(a, MouseButton::Left, 1, Coord(5, 5), GrabMode::Click, std::nullopt));
    TEST_REQUIRE(press.HasMouseGrab());
    TEST_REQUIRE(press.IsDepressed(a));
    TEST_REQUIRE(!press.IsDepressed(b));

    // at most one mouse grab
    TEST_REQUIRE(!press.StartMouseGrab(b, MouseButton::Left, 1, Coord(5, 5), GrabMode::Click, std::nullopt));
    TEST_REQUIRE(!press.StartMouseGrab(a, MouseButton::Right, 1, Coord(5, 5), GrabMode::Click, std::nullopt));
    TEST_REQUIRE(!press.StartMouseGrab(a, MouseButton::Left, 1, Coord(5, 5), GrabMode::PanOnly, std::nullopt));
    TEST_REQUIRE(press.GetMouseGrab()->start_id == a);

    // the owner can upgrade the grab
    TEST_REQUIRE(press.StartMouseGrab(a, MouseButton::Left, 2, Coord(5, 5), GrabMode::Drag, evt::CursorIcon::Grabbing));
    TEST_REQUIRE(press.GetMouseGrab()->mode == GrabMode::Drag);
    TEST_REQUIRE(press.GetMouseGrab()->repetitions == 2);
    TEST_REQUIRE(press.GetMouseGrab()->icon == evt::CursorIcon::Grabbing);
    // but never downgrade
    TEST_REQUIRE(press.StartMouseGrab(a, MouseButton::Left, 1, Coord(5, 5), GrabMode::Click, std::nullopt));
    TEST_REQUIRE(press.GetMouseGrab()->mode == GrabMode::Drag);

    const auto ended = press.EndMouseGrab(true, b, Coord(7, 8));
    TEST_REQUIRE(ended.has_value());
    TEST_REQUIRE(ended->owner == a);
    TEST_REQUIRE(ended->depress == a);
    TEST_REQUIRE(ended->event.has_value());
    TEST_REQUIRE(ended->event->success);
    TEST_REQUIRE(ended->event->press.id == b);
    TEST_REQUIRE(ended->event->press.coord == Coord(7, 8));
    TEST_REQUIRE(ended->event->press.source == evt::PressSource::Mouse(MouseButton::Left, 2));
    TEST_REQUIRE(!press.HasMouseGrab());
    TEST_REQUIRE(!press.IsDepressed(a));
}

void unit_test_touch_grab()
{
    TEST_CASE(test::Type::Feature)

    const auto a = Id::FromPath({0});
    const auto b = Id::FromPath({1});

    evt::PressState press;
    TEST_REQUIRE(press.StartTouchGrab(1, a, Coord(0, 0), GrabMode::Click));
    TEST_REQUIRE(press.StartTouchGrab(2, b, Coord(0, 0), GrabMode::Drag));
    TEST_REQUIRE(press.GetNumTouches() == 2);
    // one grab per touch id
    TEST_REQUIRE(!press.StartTouchGrab(1, b, Coord(0, 0), GrabMode::Click));
    TEST_REQUIRE(press.StartTouchGrab(1, a, Coord(1, 1), GrabMode::Drag));
    TEST_REQUIRE(press.GetNumTouches() == 2);
    TEST_REQUIRE(press.GetTouch(1)->mode == GrabMode::Drag);

    TEST_REQUIRE(press.GetTouchIndex(2).value() == 1);
    TEST_REQUIRE(!press.GetTouchIndex(3).has_value());

    const auto ended = press.EndTouchGrab(0, false, Coord(3, 3));
    TEST_REQUIRE(ended.owner == a);
    TEST_REQUIRE(ended.event.has_value());
    TEST_REQUIRE(ended.event->success == false);
    TEST_REQUIRE(ended.event->press.source == evt::PressSource::Touch(1));
    TEST_REQUIRE(press.GetNumTouches() == 1);
    TEST_REQUIRE(press.GetTouchIndex(2).value() == 0);

    // touches beyond the limit are ignored
    evt::PressState many;
    for (unsigned i=0; i<EVT_MAX_TOUCHES; ++i)
        TEST_REQUIRE(many.StartTouchGrab(i, a, Coord(0, 0), GrabMode::Click));
    TEST_REQUIRE(!many.StartTouchGrab(EVT_MAX_TOUCHES, a, Coord(0, 0), GrabMode::Click));
}

void unit_test_cancel_grabs()
{
    TEST_CASE(test::Type::Feature)

    const auto parent = Id::FromPath({0});
    const auto child  = Id::FromPath({0, 2});
    const auto other  = Id::FromPath({1});

    evt::PressState press;
    TEST_REQUIRE(press.StartMouseGrab(child, MouseButton::Left, 1, Coord(0, 0), GrabMode::Drag, std::nullopt));
    TEST_REQUIRE(press.StartTouchGrab(1, other, Coord(0, 0), GrabMode::Click));
    TEST_REQUIRE(press.StartTouchGrab(2, child, Coord(4, 4), GrabMode::Click));

    const auto ended = press.CancelGrabsOn(parent, std::nullopt, Coord(9, 9));
    TEST_REQUIRE(ended.size() == 2);
    for (const auto& end : ended)
    {
        TEST_REQUIRE(end.owner == child);
        TEST_REQUIRE(end.event.has_value());
        TEST_REQUIRE(end.event->success == false);
    }
    TEST_REQUIRE(!press.HasMouseGrab());
    TEST_REQUIRE(press.GetNumTouches() == 1);
    TEST_REQUIRE(press.GetTouch(1)->start_id == other);

    // dropping is silent and exact
    TEST_REQUIRE(!press.DropGrabsOf(parent));
    TEST_REQUIRE(press.DropGrabsOf(other));
    TEST_REQUIRE(press.GetNumTouches() == 0);
}

void unit_test_click_move()
{
    TEST_CASE(test::Type::Feature)

    const auto a = Id::FromPath({0});
    const auto b = Id::FromPath({1});

    evt::PressState press;
    TEST_REQUIRE(press.StartMouseGrab(a, MouseButton::Left, 1, Coord(0, 0), GrabMode::Click, std::nullopt));
    TEST_REQUIRE(!press.FlushClickMove(a));
    TEST_REQUIRE(press.IsDepressed(a));

    // moved off the owner, the owner is no longer depressed
    TEST_REQUIRE(press.FlushClickMove(b));
    TEST_REQUIRE(!press.IsDepressed(a));
    TEST_REQUIRE(!press.IsDepressed(b));
    TEST_REQUIRE(!press.FlushClickMove(std::nullopt));

    // and back on
    TEST_REQUIRE(press.FlushClickMove(a));
    TEST_REQUIRE(press.IsDepressed(a));

    TEST_REQUIRE(press.SetGrabDepress(evt::PressSource::Mouse(MouseButton::Left, 1), b));
    TEST_REQUIRE(press.IsDepressed(b));
    TEST_REQUIRE(!press.SetGrabDepress(evt::PressSource::Mouse(MouseButton::Left, 1), b));
    TEST_REQUIRE(!press.SetGrabDepress(evt::PressSource::Mouse(MouseButton::Right, 1), a));
    TEST_REQUIRE(!press.SetGrabDepress(evt::PressSource::Touch(5), a));
}

void unit_test_compute_pan()
{
    TEST_CASE(test::Type::Feature)

    // translation only is the average motion
    {
        const auto pan = evt::ComputePan(GrabMode::PanOnly, DVec2(0.0, 0.0), DVec2(2.0, 0.0),
                                                            DVec2(10.0, 0.0), DVec2(14.0, 0.0));
        TEST_REQUIRE(pan.alpha == DVec2(1.0, 0.0));
        TEST_REQUIRE(pan.delta == DVec2(3.0, 0.0));
    }
    // pinch out to double distance
    {
        const auto pan = evt::ComputePan(GrabMode::PanScale, DVec2(0.0, 0.0), DVec2(0.0, 0.0),
                                                             DVec2(10.0, 0.0), DVec2(20.0, 0.0));
        TEST_REQUIRE(pan.alpha == DVec2(2.0, 0.0));
        TEST_REQUIRE(pan.delta == DVec2(0.0, 0.0));
    }
    // quarter turn
    {
        const auto pan = evt::ComputePan(GrabMode::PanRotate, DVec2(0.0, 0.0), DVec2(0.0, 0.0),
                                                              DVec2(10.0, 0.0), DVec2(0.0, 20.0));
        TEST_REQUIRE(pan.alpha == DVec2(0.0, 1.0));
        TEST_REQUIRE(pan.delta == DVec2(0.0, 5.0));
    }
    // quarter turn and scale
    {
        const auto pan = evt::ComputePan(GrabMode::PanFull, DVec2(0.0, 0.0), DVec2(0.0, 0.0),
                                                            DVec2(10.0, 0.0), DVec2(0.0, 20.0));
        TEST_REQUIRE(pan.alpha == DVec2(0.0, 2.0));
        TEST_REQUIRE(pan.delta == DVec2(0.0, 0.0));
    }
    TEST_REQUIRE(evt::IsIdentity(evt::PanEvent {}));
}

void unit_test_pan_grab()
{
    TEST_CASE(test::Type::Feature)

    const auto a = Id::FromPath({0});

    // single source pan
    {
        evt::PressState press;
        TEST_REQUIRE(press.StartMouseGrab(a, MouseButton::Left, 1, Coord(10, 10), GrabMode::PanOnly, std::nullopt));
        TEST_REQUIRE(press.GetNumPans() == 1);
        // no motion, no pan
        TEST_REQUIRE(press.FlushPans().empty());

        press.UpdatePanCoord(press.GetMouseGrab()->pan, Coord(15, 8));
        auto pans = press.FlushPans();
        TEST_REQUIRE(pans.size() == 1);
        TEST_REQUIRE(pans[0].first == a);
        TEST_REQUIRE(pans[0].second.delta == DVec2(5.0, -2.0));
        // motion is consumed
        TEST_REQUIRE(press.FlushPans().empty());

        // pan grabs receive no PressEnd
        const auto ended = press.EndMouseGrab(true, a, Coord(15, 8));
        TEST_REQUIRE(ended.has_value());
        TEST_REQUIRE(!ended->event.has_value());
        TEST_REQUIRE(press.GetNumPans() == 0);
    }

    // two touches on the same widget combine into one pan grab
    {
        evt::PressState press;
        TEST_REQUIRE(press.StartTouchGrab(1, a, Coord(0, 0), GrabMode::PanScale));
        TEST_REQUIRE(press.StartTouchGrab(2, a, Coord(10, 0), GrabMode::PanScale));
        TEST_REQUIRE(press.GetNumPans() == 1);
        TEST_REQUIRE(press.GetPanGrab(0).n == 2);

        press.UpdatePanCoord(press.GetTouch(2)->pan, Coord(20, 0));
        const auto pans = press.FlushPans();
        TEST_REQUIRE(pans.size() == 1);
        TEST_REQUIRE(pans[0].second.alpha == DVec2(2.0, 0.0));

        press.EndTouchGrab(0, true, Coord(0, 0));
        TEST_REQUIRE(press.GetNumPans() == 1);
        TEST_REQUIRE(press.GetPanGrab(0).n == 1);
        press.EndTouchGrab(0, true, Coord(20, 0));
        TEST_REQUIRE(press.GetNumPans() == 0);
    }

    // at most two pan grabs
    {
        evt::PressState press;
        TEST_REQUIRE(press.StartTouchGrab(1, Id::FromPath({0}), Coord(0, 0), GrabMode::PanOnly));
        TEST_REQUIRE(press.StartTouchGrab(2, Id::FromPath({1}), Coord(0, 0), GrabMode::PanOnly));
        TEST_REQUIRE(press.StartTouchGrab(3, Id::FromPath({2}), Coord(0, 0), GrabMode::PanOnly));
        TEST_REQUIRE(press.GetNumPans() == EVT_MAX_PAN_GRABS);
        TEST_REQUIRE(!press.GetTouch(3)->pan.IsValid());
    }
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_press.log");

    unit_test_mouse_grab();
    unit_test_touch_grab();
    unit_test_cancel_grabs();
    unit_test_click_move();
    unit_test_compute_pan();
    unit_test_pan_grab();
    return 0;
}
) // TEST_MAIN

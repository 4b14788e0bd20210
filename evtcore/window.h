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

#pragma once

#include "config.h"

#include <memory>
#include <optional>
#include <vector>

#include "evtcore/types.h"
#include "evtcore/id.h"
#include "evtcore/event.h"
#include "evtcore/input.h"
#include "evtcore/focus.h"
#include "evtcore/event_state.h"

namespace evt
{
    class Node;
    class Runner;
    class AppData;
    class EventCx;

    // Window is the entry point of the event core for the platform
    // layer. It owns the event state of one window and binds it to the
    // widget tree and the platform.
    //
    // The platform layer is expected to
    //  - call FullConfigure before delivering any input
    //  - deliver the platform events through HandleInput
    //  - call UpdateTimers when the time returned by GetNextResume
    //    has passed
    //  - call FrameUpdate before rendering a frame
    //  - call FlushPending once per loop iteration before the loop
    //    goes idle and act on the returned actions.
    class Window
    {
    public:
        Window(std::shared_ptr<const WindowConfig> config, WindowId window,
               Runner& runner, Node& root, AppData* data = nullptr);
        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        inline EventState& GetState() noexcept
        { return mState; }
        inline const EventState& GetState() const noexcept
        { return mState; }
        inline WindowId GetWindowId() const noexcept
        { return mState.GetWindowId(); }

        // Configure the whole widget tree. The widget Ids are (re)assigned
        // and the focus and grab state held on Ids that no longer exist
        // is dropped.
        void FullConfigure();

        // Handle a platform input event.
        void HandleInput(const InputEvent& event);

        // Handle an accessibility action on the target widget.
        void HandleAccessAction(const Id& id, const AccessAction& action);

        // Deliver the pending pan updates and the frame timers.
        void FrameUpdate();

        // Deliver the timer events that have expired.
        void UpdateTimers();

        // The popup window has received its initial layout.
        void ConfirmPopupSized(WindowId window);

        // The application was suspended. Closes all popups.
        void Suspended();

        // Commit all pending state changes and deliver the pending
        // events. Returns the accumulated actions.
        ActionFlags FlushPending();

        inline std::optional<Instant> GetNextResume() const
        { return mState.GetNextResume(); }
        inline bool NeedFrameUpdate() const noexcept
        { return mState.NeedFrameUpdate(); }

        // Find the deepest widget under the window coordinate. Open
        // popups are probed first from the top.
        std::optional<Id> Probe(const Coord& coord) const;
    private:
        void OnFocused(EventCx& cx, const input::Focused& focused);
        void OnModifiers(EventCx& cx, const input::ModifiersChanged& modifiers);
        void OnKeyboardInput(EventCx& cx, const input::KeyboardInput& input);
        void OnCursorMoved(EventCx& cx, const input::CursorMoved& moved);
        void OnCursorLeft(EventCx& cx);
        void OnMouseWheel(EventCx& cx, const input::MouseWheel& wheel);
        void OnMouseInput(EventCx& cx, const input::MouseInput& input);
        void OnTouch(EventCx& cx, const input::Touch& touch);
        void OnImeDisabled(EventCx& cx);
        void StartKeyEvent(EventCx& cx, const KeyEvent& event);
        // Route a shortcut command. Returns true if some widget used it.
        bool RouteCommand(EventCx& cx, Command cmd, PhysicalKey code);
        void SetHover(EventCx& cx, const std::optional<Id>& hover);

        void FlushNavFocus(EventCx& cx);
        void FlushInputFocus(EventCx& cx);
        void FlushAsync(EventCx& cx);
        void FlushRegionMoved(EventCx& cx);
        void FlushCursorIcon();
        // Find the nav focus target for the advance request.
        std::optional<Id> FindNavTarget(const NavFocusState::Advance& advance) const;
        // Drop the state held on Ids that no longer exist.
        void Revalidate(EventCx& cx);
        bool Exists(const Id& id) const;
    private:
        EventState mState;
        Runner& mRunner;
        Node& mRoot;
        AppData* mAppData = nullptr;
    };

} // namespace

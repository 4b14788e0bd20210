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

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "base/threadpool.h"
#include "evtcore/types.h"
#include "evtcore/id.h"
#include "evtcore/event.h"
#include "evtcore/message.h"
#include "evtcore/timer.h"
#include "evtcore/press.h"
#include "evtcore/focus.h"
#include "evtcore/popup.h"
#include "evtcore/async.h"
#include "evtcore/event_config.h"

namespace evt
{
    // EventState is the per window state of the event core. It's owned
    // by the window and mutated only by the dispatch and flush steps and
    // the widgets' requests made through the contexts.
    //
    // Most requests only stage a change, the actual change is committed
    // (and the related events delivered) during the next flush.
    class EventState
    {
    public:
        using ClockFunc = std::function<Instant ()>;

        EventState(std::shared_ptr<const WindowConfig> config, WindowId window);
        EventState(const EventState&) = delete;
        EventState& operator=(const EventState&) = delete;

        inline const WindowConfig& GetConfig() const noexcept
        { return *mConfig; }
        inline WindowId GetWindowId() const noexcept
        { return mWindowId; }

        // Replace the clock used for timers and click counting.
        void SetClock(ClockFunc clock);
        Instant Now() const;

        // Whether the widget is disabled, i.e. the widget or any of its
        // ancestors has been disabled.
        bool IsDisabled(const Id& id) const noexcept;
        inline bool HasNavFocus(const Id& id) const noexcept
        { return mNavFocus.HasFocus(id); }
        inline const std::optional<Id>& GetNavFocus() const noexcept
        { return mNavFocus.GetFocus(); }
        inline const std::optional<Id>& GetNavFallback() const noexcept
        { return mNavFocus.GetFallback(); }
        inline bool HasSelFocus(const Id& id) const noexcept
        { return mInputFocus.HasSelFocus(id); }
        inline const std::optional<Id>& GetSelFocus() const noexcept
        { return mInputFocus.GetSelFocus(); }
        inline bool HasKeyFocus(const Id& id) const noexcept
        { return mInputFocus.HasKeyFocus(id); }
        inline std::optional<Id> GetKeyFocus() const
        { return mInputFocus.GetKeyFocus(); }
        inline std::optional<Id> GetImeFocus() const
        { return mInputFocus.GetImeFocus(); }
        inline bool IsHovered(const Id& id) const noexcept
        { return mHover.has_value() && mHover.value() == id; }
        // Whether the widget or any of its descendants is hovered.
        inline bool IsHoveredRecursive(const Id& id) const noexcept
        { return mHover.has_value() && id.IsAncestorOf(mHover.value()); }
        inline const std::optional<Id>& GetHover() const noexcept
        { return mHover; }
        // Whether the widget should be drawn depressed. This is the case
        // when a key activated the widget and is still held, when a press
        // grab has the widget as its depress target or when the widget
        // opened a popup.
        bool IsDepressed(const Id& id) const noexcept;
        inline Modifiers GetModifiers() const noexcept
        { return mModifiers; }
        inline bool WindowHasFocus() const noexcept
        { return mWindowHasFocus; }

        inline const PressState& GetPressState() const noexcept
        { return mPress; }
        inline const PopupStack& GetPopups() const noexcept
        { return mPopups; }
        inline const TimerQueue& GetTimers() const noexcept
        { return mTimers; }
        inline const AccelLayers& GetAccelLayers() const noexcept
        { return mAccelLayers; }

        // Disable or enable the widget and its descendants. Disabling
        // cancels the focus and the press grabs held under the widget.
        void SetDisabled(const Id& id, bool disabled);

        // Set the navigation focus to the widget. This is a no-op if the
        // widget already has the focus or if the navigation focus has
        // been disabled.
        void SetNavFocus(const Id& id, FocusSource source);
        void ClearNavFocus();
        // Advance the navigation focus to the next (or previous) navigable
        // widget after the current focus. With an explicit target the
        // search starts at the target and the target itself is a
        // candidate. No-op when the target already has the focus.
        void NextNavFocus(const std::optional<Id>& target, bool reverse, FocusSource source);
        // Set the navigation focus to the target if it's navigable or
        // to its closest navigable ancestor.
        void RequestNavFocus(const Id& target, FocusSource source);

        // Request selection focus for the widget. The navigation focus
        // follows. Returns false if the widget already had the focus.
        bool RequestSelFocus(const Id& target, FocusSource source);
        // Request key (character) focus for the widget, with IME when
        // a purpose is given. Implies selection focus.
        bool RequestKeyFocus(const Id& target, std::optional<ImePurpose> ime, FocusSource source);
        void CancelImeFocus(const Id& target);

        // Request a timer event after the delay. A zero delay fires on
        // the next timer update.
        void RequestTimer(const Id& id, TimerHandle handle, std::chrono::milliseconds delay);
        // Request a timer event on the next rendered frame.
        void RequestFrameTimer(const Id& id, TimerHandle handle);

        // Request an update pass on the widget. Multiple requests within
        // one pass are merged into their common ancestor.
        void RequestUpdate(const Id& id);
        // Request a configure pass on the widget subtree.
        void RequestReconfigure(const Id& id);

        void RegisterNavFallback(const Id& id);
        void NewAccelLayer(const Id& id, bool alt_bypass);
        void EnableAltBypass(const Id& id, bool alt_bypass);
        void AddAccelKeys(const Id& id, const std::vector<Key>& keys);

        // Draw the widget as depressed until the key is released.
        void DepressWithKey(const Id& id, PhysicalKey code);

        // Set the cursor icon to use while the mouse hovers the widget
        // under the cursor.
        inline void SetHoverIcon(CursorIcon icon) noexcept
        { mHoverIcon = icon; }

        inline void Redraw() noexcept
        { mAction.set(Action::Redraw); }
        inline void RegionMoved() noexcept
        { mAction.set(Action::RegionMoved); }
        inline void WindowAction(ActionFlags action) noexcept
        { mAction |= action; }
        // Request actions on behalf of the widget.
        void RequestAction(const Id& id, ActionFlags action);

        // Request the application to exit. Executed during the flush.
        inline void Exit() noexcept
        { mPendingExit = true; }
        // Request the window to close. Executed during the flush.
        inline void CloseWindow() noexcept
        { mPendingClose = true; }

        inline const ActionFlags& GetAction() const noexcept
        { return mAction; }
        inline ActionFlags TakeAction() noexcept
        { return mAction.take_all(); }

        // Get the time of the next timer event if any.
        std::optional<Instant> GetNextResume() const;
        // Whether there's anything to do on the next frame.
        bool NeedFrameUpdate() const noexcept;
        // Whether there are any pending asynchronous messages.
        bool HasPendingAsync() const;

        inline MessageStack& GetMessages() noexcept
        { return mMessages; }
    private:
        friend class EventCx;
        friend class Window;

        void QueueEvent(const Id& id, Event event);
        // Clear the selection focus if it is incompatible with the new
        // navigation focus target.
        void ClearIncompatibleSelFocus(const Id& target);
    private:
        std::shared_ptr<const WindowConfig> mConfig;
        const WindowId mWindowId = 0;
        ClockFunc mClock;
        bool mWindowHasFocus = false;
        Modifiers mModifiers;
        std::vector<Id> mDisabled;

        NavFocusState mNavFocus;
        InputFocusState mInputFocus;
        AccelLayers mAccelLayers;

        // mouse state
        std::optional<Id> mHover;
        CursorIcon mHoverIcon = CursorIcon::Default;
        CursorIcon mOldHoverIcon = CursorIcon::Default;
        bool mCursorInWindow = false;
        Coord mLastCoord = {0, 0};
        // Window coordinate of the latest touch event.
        Coord mLastTouchCoord = {0, 0};
        std::optional<MouseButton> mLastClickButton;
        unsigned mLastClickRepetitions = 0;
        Instant mLastClickTimeout;

        PressState mPress;
        std::unordered_map<PhysicalKey, Id> mKeyDepress;
        PopupStack mPopups;
        TimerQueue mTimers;

        // Events owed to widgets, delivered at the start of the flush.
        std::vector<std::pair<Id, Event>> mPendingEvents;
        // Parents of popups closed after being sized.
        std::vector<std::pair<Id, WindowId>> mPopupRemoved;
        std::deque<std::pair<Id, Erased>> mSendQueue;
        std::optional<Id> mPendingUpdate;
        bool mPendingReconfigure = false;
        bool mPendingExit = false;
        bool mPendingClose = false;

        std::vector<std::pair<Id, std::unique_ptr<PendingMessage>>> mFutures;
        std::shared_ptr<CompletionQueue> mCompletions;
        std::vector<base::TaskHandle> mTasks;

        MessageStack mMessages;
        ActionFlags mAction;
    };

} // namespace

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

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "evtcore/types.h"
#include "evtcore/id.h"
#include "evtcore/event.h"
#include "evtcore/message.h"
#include "evtcore/popup.h"
#include "evtcore/runner.h"
#include "evtcore/async.h"
#include "evtcore/event_state.h"

namespace evt
{
    class Node;

    // EventCx is the context for dispatching events to the widget tree.
    // It's passed to the widgets' event and message handlers and provides
    // the widget facing API of the event core.
    //
    // An event is sent to a target Id and travels from the root down to
    // the target. The target handles the event first and when it leaves
    // the event unused, each ancestor (closest first) may handle the
    // event when the event is reusable. Messages pushed during the pass
    // are offered to the ancestors' message handlers on the way back up
    // and finally to the application data.
    class EventCx
    {
    public:
        EventCx(EventState& state, Runner& runner, Node& root, AppData* data = nullptr) noexcept
          : mState(state)
          , mRunner(runner)
          , mRoot(root)
          , mAppData(data)
        {}
        EventCx(const EventCx&) = delete;
        EventCx& operator=(const EventCx&) = delete;

        inline EventState& GetState() noexcept
        { return mState; }
        inline const EventState& GetState() const noexcept
        { return mState; }
        inline Runner& GetRunner() noexcept
        { return mRunner; }
        inline const WindowConfig& GetConfig() const noexcept
        { return mState.GetConfig(); }

        // === messages ===
        template<typename T>
        void Push(T&& msg)
        { mState.mMessages.Push(std::forward<T>(msg)); }

        inline void PushErased(Erased msg)
        { mState.mMessages.PushErased(std::move(msg)); }

        template<typename T>
        std::optional<T> TryPop()
        { return mState.mMessages.TryPop<T>(); }

        template<typename T>
        const T* TryPeek() const
        { return mState.mMessages.TryPeek<T>(); }
        template<typename T>
        const T* TryObserve() const
        { return mState.mMessages.TryObserve<T>(); }

        inline bool HasMessages() const noexcept
        { return mState.mMessages.HasAny(); }

        // Set the scroll request for the ancestors. A scroll view
        // ancestor handles the request in its HandleScroll and may
        // replace it with a new request for its own ancestors.
        inline void SetScroll(const Scroll& scroll) noexcept
        { mScroll = scroll; }
        inline const Scroll& GetScroll() const noexcept
        { return mScroll; }

        // Index of the child through which the last event passed when
        // called from an ancestor's handler.
        inline std::optional<std::size_t> GetLastChild() const noexcept
        { return mLastChild; }

        // Send the message to the widget. When it's safe to do so the
        // message is delivered immediately, otherwise it is queued and
        // delivered during the next flush. A Command message is delivered
        // as a command event and a ScrollDelta as a scroll event.
        template<typename T>
        void Send(const Id& id, T&& msg)
        { SendErased(id, Erased(std::forward<T>(msg))); }

        void SendErased(const Id& id, Erased msg);

        // Send a command to the widget, always queued.
        void SendCommand(const Id& id, Command cmd);

        // Send the event to the widget immediately.
        IsUsed SendEvent(const Id& id, Event event);

        // Push the result of the future as a message to the widget once
        // the future becomes ready.
        template<typename T>
        void PushAsync(const Id& id, std::future<T> future)
        {
            mState.mFutures.emplace_back(id, std::make_unique<FutureMessage<T>>(std::move(future)));
        }
        void PushAsyncErased(const Id& id, std::unique_ptr<PendingMessage> pending);

        // Run the function on the worker thread pool and push the result
        // as a message to the widget. Without a thread pool the function
        // runs immediately and the result is delivered during the flush.
        template<typename T>
        void PushSpawn(const Id& id, std::function<T ()> func)
        {
            auto task = std::make_unique<MessageTask<T>>(std::move(func), id,
                mState.mCompletions, mRunner.GetWaker());
            SubmitTask(std::move(task));
        }

        // === press grabs ===

        // Grab the press for the owner. Subsequent motion and the release
        // of the press source are delivered to the owner according to the
        // grab mode. Returns false if the grab could not be started.
        bool GrabPress(const Press& press, const Id& owner, GrabMode mode,
                       std::optional<CursorIcon> icon = std::nullopt);
        // Replace any grab held by the owner with a new drag grab. The
        // replaced grabs receive no PressEnd.
        bool GrabPressUnique(const Press& press, const Id& owner,
                             std::optional<CursorIcon> icon = std::nullopt);
        // Set the widget drawn as depressed by the grab of the press
        // source. Returns true if the target changed.
        bool SetGrabDepress(const PressSource& source, const std::optional<Id>& target);
        // Update the cursor icon of the mouse grab owned by the widget.
        void UpdateGrabCursor(const Id& id, CursorIcon icon);

        // === popups and windows ===

        // Open a popup window. If set_focus is true the current nav
        // focus is cleared and restored when the popup closes.
        WindowId AddPopup(const PopupDescriptor& desc, bool set_focus);
        // Reposition an open popup. The popup's Id cannot change.
        bool RepositionPopup(WindowId window, const PopupDescriptor& desc);
        // Close the popup window and all popups above it.
        void ClosePopup(WindowId window, bool restore_focus = true);
        // Close every popup that doesn't contain the widget, starting
        // from the top of the stack. With no widget all popups close.
        void CloseNonAncestorsOf(const std::optional<Id>& id, bool restore_focus = true);
        WindowId AddWindow(const WindowDescriptor& desc);
        // Close a window. The window may be a popup or this window.
        void CloseWindow(WindowId window);
        void Exit();

        // === clipboard ===
        std::optional<std::string> GetClipboard();
        void SetClipboard(const std::string& content);
        std::optional<std::string> GetPrimary();
        void SetPrimary(const std::string& content);

        // === state ===
        inline bool IsDisabled(const Id& id) const noexcept
        { return mState.IsDisabled(id); }
        inline bool HasNavFocus(const Id& id) const noexcept
        { return mState.HasNavFocus(id); }
        inline bool HasSelFocus(const Id& id) const noexcept
        { return mState.HasSelFocus(id); }
        inline bool HasKeyFocus(const Id& id) const noexcept
        { return mState.HasKeyFocus(id); }
        inline bool IsHovered(const Id& id) const noexcept
        { return mState.IsHovered(id); }
        inline bool IsDepressed(const Id& id) const noexcept
        { return mState.IsDepressed(id); }
        inline Modifiers GetModifiers() const noexcept
        { return mState.GetModifiers(); }
        inline void SetNavFocus(const Id& id, FocusSource source)
        { mState.SetNavFocus(id, source); }
        inline void ClearNavFocus()
        { mState.ClearNavFocus(); }
        inline void NextNavFocus(const std::optional<Id>& target, bool reverse, FocusSource source)
        { mState.NextNavFocus(target, reverse, source); }
        inline bool RequestSelFocus(const Id& id, FocusSource source)
        { return mState.RequestSelFocus(id, source); }
        inline bool RequestKeyFocus(const Id& id, std::optional<ImePurpose> ime, FocusSource source)
        { return mState.RequestKeyFocus(id, ime, source); }
        inline void CancelImeFocus(const Id& id)
        { mState.CancelImeFocus(id); }
        inline void SetDisabled(const Id& id, bool disabled)
        { mState.SetDisabled(id, disabled); }
        inline void RequestTimer(const Id& id, TimerHandle handle, std::chrono::milliseconds delay)
        { mState.RequestTimer(id, handle, delay); }
        inline void RequestFrameTimer(const Id& id, TimerHandle handle)
        { mState.RequestFrameTimer(id, handle); }
        inline void RequestUpdate(const Id& id)
        { mState.RequestUpdate(id); }
        inline void DepressWithKey(const Id& id, PhysicalKey code)
        { mState.DepressWithKey(id, code); }
        inline void SetHoverIcon(CursorIcon icon)
        { mState.SetHoverIcon(icon); }
        inline void Redraw()
        { mState.Redraw(); }
        inline void RegionMoved()
        { mState.RegionMoved(); }
        inline void RequestAction(const Id& id, ActionFlags action)
        { mState.RequestAction(id, action); }
    private:
        friend class Window;

        IsUsed SendRecurse(Node& node, const Id& id, const Event& event);
        bool ReplayRecurse(Node& node, const Id& id);
        void ScrollRecurse(Node& node, const Id& id, const Scroll& scroll);
        // Deliver a deferred message, see Send.
        void SendOrReplay(const Id& id, Erased msg);
        // Replay the message through the message handlers of the target
        // and its ancestors.
        void Replay(const Id& id, Erased msg);
        // Set the scroll request at the target and let its ancestors
        // handle it.
        void ScrollTo(const Id& id, const Scroll& scroll);
        // Offer the messages left on the stack to the application and
        // drop the rest.
        void HandleUnhandled();
        void ClosePopupAt(std::size_t index, bool restore_focus);
        void SubmitTask(std::unique_ptr<base::ThreadTask> task);
    private:
        EventState& mState;
        Runner& mRunner;
        Node& mRoot;
        AppData* mAppData = nullptr;
        Scroll mScroll;
        std::optional<std::size_t> mLastChild;
        bool mTargetIsDisabled = false;
    };

} // namespace

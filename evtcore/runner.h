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
#include <string>

#include "evtcore/types.h"
#include "evtcore/popup.h"

namespace base {
    class ThreadPool;
} // namespace

namespace evt
{
    class MessageStack;

    // Waker is used to revive an idle event loop from another thread,
    // for example when an asynchronous task has completed.
    class Waker
    {
    public:
        virtual ~Waker() = default;
        virtual void Wake() = 0;
    };

    struct WindowDescriptor {
        std::string title;
        Offset size = {0, 0};
    };

    // Runner is the interface to the platform (windowing system) for the
    // event core. The platform operations can fail, in which case the
    // failure is logged and the operation has no effect.
    class Runner
    {
    public:
        virtual ~Runner() = default;

        // Create a new popup window for the given descriptor.
        virtual WindowId AddPopup(const PopupDescriptor& desc) = 0;
        // Move (or resize) an existing popup window.
        virtual void RepositionPopup(WindowId window, const PopupDescriptor& desc) = 0;
        // Create a new top level window.
        virtual WindowId AddWindow(const WindowDescriptor& desc) = 0;
        // Close a window or popup window.
        virtual void CloseWindow(WindowId window) = 0;

        // Get the clipboard contents. Returns nullopt on failure.
        virtual std::optional<std::string> GetClipboard() = 0;
        // Set the clipboard contents. Returns false on failure.
        virtual bool SetClipboard(const std::string& content) = 0;
        // Get the primary selection buffer contents where supported.
        virtual std::optional<std::string> GetPrimary() = 0;
        virtual bool SetPrimary(const std::string& content) = 0;

        virtual void SetCursorIcon(CursorIcon icon) = 0;

        // Enable the IME with the given purpose or disable it with nullopt.
        // Returns false if the IME cannot be enabled.
        virtual bool SetImeAllowed(std::optional<ImePurpose> purpose) = 0;

        // Request the application to exit.
        virtual void Exit() = 0;

        virtual std::shared_ptr<Waker> GetWaker() = 0;

        // Get the worker pool for spawned tasks if any. Without a pool
        // the tasks run synchronously on the calling thread.
        virtual base::ThreadPool* GetThreadPool()
        { return nullptr; }
    };

    // AppData is the top level application hook. It receives the
    // messages that no widget handled.
    class AppData
    {
    public:
        virtual ~AppData() = default;

        // Handle the messages on the stack. Any message the application
        // handles must be popped. Returns the actions required.
        virtual ActionFlags HandleMessages(MessageStack& messages) = 0;

        // The application was suspended.
        virtual void Suspended() {}
    };

} // namespace

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

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "evtcore/types.h"
#include "evtcore/id.h"
#include "evtcore/event.h"

namespace evt
{
    // Index of a pan grab and the index of the source within the pan grab.
    struct PanIndex {
        static constexpr std::size_t None = std::numeric_limits<std::size_t>::max();
        std::size_t grab  = None;
        std::size_t index = 0;

        inline bool IsValid() const noexcept
        { return grab != None; }
    };

    struct MouseGrab {
        MouseButton button = MouseButton::Left;
        unsigned repetitions = 1;
        // The widget that owns the grab.
        Id start_id;
        // The widget drawn as depressed.
        std::optional<Id> depress;
        // Last known coordinate of the cursor.
        Coord coord = {0, 0};
        GrabMode mode = GrabMode::Click;
        PanIndex pan;
        std::optional<CursorIcon> icon;
    };

    struct TouchGrab {
        std::uint64_t touch_id = 0;
        Id start_id;
        std::optional<Id> depress;
        // The widget currently under the touch point.
        std::optional<Id> over;
        Coord coord = {0, 0};
        GrabMode mode = GrabMode::Click;
        PanIndex pan;
    };

    struct PanGrab {
        Id id;
        GrabMode mode = GrabMode::PanOnly;
        bool source_is_touch = false;
        // Number of sources (mouse or touch points) attached.
        unsigned n = 0;
        // Old and new coordinates of the first sources.
        std::array<std::pair<DVec2, DVec2>, EVT_MAX_PAN_GRABS> coords;
    };

    // Compute the pan transform from the motion of two points p -> q.
    // With a single source the pan is a plain translation.
    PanEvent ComputePan(GrabMode mode, const DVec2& p1, const DVec2& q1,
                        const DVec2& p2, const DVec2& q2);

    bool IsIdentity(const PanEvent& pan) noexcept;
    bool IsFinite(const PanEvent& pan) noexcept;

    // A press (mouse button or touch) grab that has been ended and
    // the PressEnd event that must be delivered to the grab owner.
    struct EndedGrab {
        Id owner;
        // Pan grabs receive no PressEnd.
        std::optional<PressEndEvent> event;
        // The depressed widget, which must be redrawn.
        std::optional<Id> depress;
    };

    // PressState tracks the press grabs of one window. There's at most
    // one mouse grab and at most one grab for every touch identifier.
    // Up to two pan grabs combine the motion of their sources.
    class PressState
    {
    public:
        // Start a mouse grab for the given widget or update the existing
        // grab. An existing grab owned by a different widget, for a
        // different button or with a different pan-ness cannot be
        // updated and false is returned.
        bool StartMouseGrab(const Id& id, MouseButton button, unsigned repetitions,
                            const Coord& coord, GrabMode mode, std::optional<CursorIcon> icon);

        // Start a touch grab for the given widget or update the existing
        // grab. Returns false if the grab cannot be started.
        bool StartTouchGrab(std::uint64_t touch_id, const Id& id, const Coord& coord, GrabMode mode);

        // End the mouse grab. Returns nullopt if there's no grab.
        std::optional<EndedGrab> EndMouseGrab(bool success, const std::optional<Id>& over, const Coord& coord);

        // End the touch grab at the given index.
        EndedGrab EndTouchGrab(std::size_t index, bool success, const Coord& coord);

        // End all grabs owned by the target or any of its descendants.
        std::vector<EndedGrab> CancelGrabsOn(const Id& target, const std::optional<Id>& hover, const Coord& mouse_coord);

        // Silently drop all grabs owned exactly by the given widget.
        // Returns true if any grab was dropped.
        bool DropGrabsOf(const Id& owner);

        inline MouseGrab* GetMouseGrab() noexcept
        { return mMouseGrab ? &mMouseGrab.value() : nullptr; }
        inline const MouseGrab* GetMouseGrab() const noexcept
        { return mMouseGrab ? &mMouseGrab.value() : nullptr; }
        inline bool HasMouseGrab() const noexcept
        { return mMouseGrab.has_value(); }

        TouchGrab* GetTouch(std::uint64_t touch_id) noexcept;
        std::optional<std::size_t> GetTouchIndex(std::uint64_t touch_id) const noexcept;
        inline TouchGrab& GetTouchGrab(std::size_t index) noexcept
        { return mTouchGrabs[index]; }
        inline std::size_t GetNumTouches() const noexcept
        { return mTouchGrabs.size(); }
        inline std::size_t GetNumPans() const noexcept
        { return mPanGrabs.size(); }
        inline const PanGrab& GetPanGrab(std::size_t index) const noexcept
        { return mPanGrabs[index]; }

        // Record new coordinates for a pan source.
        void UpdatePanCoord(const PanIndex& pan, const Coord& coord);

        // Compute the pan events from the accumulated motion of the
        // pan sources. Each returned pan is addressed to the owner of
        // the pan grab.
        std::vector<std::pair<Id, PanEvent>> FlushPans();

        // Update the depressed widget of click grabs to follow the pointer.
        // Returns true if any depress target changed.
        bool FlushClickMove(const std::optional<Id>& hover);

        // Set the depress target of the grab of the given source.
        // Returns true if the target changed.
        bool SetGrabDepress(const PressSource& source, const std::optional<Id>& target);

        bool IsDepressed(const Id& id) const noexcept;

        void Clear();
    private:
        PanIndex SetPanOn(const Id& id, GrabMode mode, bool source_is_touch, const Coord& coord);
        void RemovePanGrab(const PanIndex& pan);
        void RemovePan(std::size_t index);
    private:
        std::optional<MouseGrab> mMouseGrab;
        std::vector<TouchGrab> mTouchGrabs;
        std::vector<PanGrab> mPanGrabs;
    };

} // namespace

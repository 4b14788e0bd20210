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

#include <optional>
#include <vector>

#include "evtcore/types.h"
#include "evtcore/id.h"

namespace evt
{
    // Describes a popup window. The popup covers the widget subtree
    // rooted at id and is placed next to the parent widget.
    struct PopupDescriptor {
        // The root of the widget subtree shown in the popup.
        Id id;
        // The widget that opened the popup.
        Id parent;
        // The parent rect the popup is placed next to.
        Rect rect;
        // Preferred placement relative to the parent rect.
        Direction direction = Direction::Down;
    };

    struct PopupState {
        WindowId window = 0;
        PopupDescriptor desc;
        // Nav focus to restore when the popup is closed.
        std::optional<Id> old_nav_focus;
        // Set once the platform has done the initial layout.
        bool is_sized = false;
    };

    // The stack of open popups of a window. A popup higher on the stack
    // is assumed to be a descendant of the popups below it.
    class PopupStack
    {
    public:
        void Push(PopupState popup);

        // Replace the descriptor of the popup. The popup's id cannot
        // change, a request that would change it is rejected and false
        // is returned.
        bool Reposition(WindowId window, const PopupDescriptor& desc);

        // Remove the popup at the given index. The index must be valid.
        PopupState Remove(std::size_t index);

        // Mark the popup as sized. Returns false if no such popup.
        bool ConfirmSized(WindowId window);

        std::optional<std::size_t> FindIndex(WindowId window) const;

        // Find the topmost popup whose subtree contains the id.
        std::optional<std::size_t> FindCovering(const Id& id) const;

        const PopupState* GetTop() const noexcept;
        // Get the top popup if it has been sized.
        const PopupState* GetTopSized() const noexcept;

        // Whether the widget is the parent of any open popup.
        bool IsParentOfAny(const Id& id) const noexcept;

        inline std::size_t GetSize() const noexcept
        { return mPopups.size(); }
        inline bool IsEmpty() const noexcept
        { return mPopups.empty(); }
        inline const PopupState& operator[](std::size_t index) const
        { return mPopups[index]; }
    private:
        std::vector<PopupState> mPopups;
    };

} // namespace

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

#include <map>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

#include "evtcore/types.h"
#include "evtcore/id.h"

namespace evt
{
    // Direction of a navigation focus search.
    enum class NavAdvance {
        // Select the target itself or its closest navigable ancestor.
        None,
        // Select the next navigable widget.
        Forward,
        // Select the previous navigable widget.
        Reverse
    };

    // Navigation focus of a window. Changes of the focus are staged and
    // committed during the flush. The staging state is a small state
    // machine, Idle -> SetTo | Advance -> Idle.
    class NavFocusState
    {
    public:
        struct Idle {};
        // Set the focus to the target (or clear it).
        struct SetTo {
            std::optional<Id> target;
            FocusSource source = FocusSource::Synthetic;
        };
        // Search for the focus target starting from the target (or the
        // current focus when there's no target).
        struct Advance {
            std::optional<Id> target;
            NavAdvance advance = NavAdvance::None;
            // Whether the starting point itself may be selected.
            bool inclusive = false;
            FocusSource source = FocusSource::Synthetic;
        };
        using Pending = std::variant<Idle, SetTo, Advance>;

        inline const std::optional<Id>& GetFocus() const noexcept
        { return mFocus; }
        inline bool HasFocus(const Id& id) const noexcept
        { return mFocus.has_value() && mFocus.value() == id; }
        inline const std::optional<Id>& GetFallback() const noexcept
        { return mFallback; }
        inline const Pending& GetPending() const noexcept
        { return mPending; }
        inline bool HasPending() const noexcept
        { return !std::holds_alternative<Idle>(mPending); }

        // Register the nav fallback. The first registered widget wins
        // and later registrations are ignored. Returns true if the
        // widget became the fallback.
        bool RegisterFallback(const Id& id);

        // Stage setting the focus to the target. Returns false when
        // the request is a no-op, i.e. the target already has focus
        // or the same change is already staged.
        bool StageSet(const std::optional<Id>& target, FocusSource source);

        // Stage a focus search.
        void StageAdvance(const std::optional<Id>& target, NavAdvance advance, bool inclusive, FocusSource source);

        // Take the staged change leaving the state Idle.
        Pending TakePending();

        // Commit the new focus and return the previous focus.
        std::optional<Id> Commit(const std::optional<Id>& focus);

        // Clear the focus immediately if the focused widget is the target
        // or a descendant of it. Staged changes to widgets under the
        // target are dropped. Returns the widget that lost focus.
        std::optional<Id> ClearOn(const Id& target);

        // Reset everything, used when the tree is reconfigured.
        void ResetFallback();
        void Reset();
    private:
        std::optional<Id> mFocus;
        std::optional<Id> mFallback;
        Pending mPending;
    };

    // Selection, key (character) and IME focus of a window. These are
    // all held by the same widget. Key focus implies selection focus
    // and IME focus implies key focus.
    class InputFocusState
    {
    public:
        struct Idle {};
        struct StagedTo {
            Id target;
            FocusSource source = FocusSource::Synthetic;
        };
        using PendingSel = std::variant<Idle, StagedTo>;

        // Notifications owed to a widget that lost focus.
        struct Lost {
            Id id;
            bool sel = false;
            bool key = false;
            bool ime = false;
        };

        // All the staged changes that must be committed.
        struct Pending {
            std::optional<Lost> lost;
            PendingSel sel;
            bool new_key = false;
            std::optional<ImePurpose> new_ime;
        };

        inline const std::optional<Id>& GetSelFocus() const noexcept
        { return mFocus; }
        std::optional<Id> GetKeyFocus() const;
        std::optional<Id> GetImeFocus() const;
        inline bool HasKeyFocus() const noexcept
        { return mFocus.has_value() && mKeyFocus; }
        inline bool HasSelFocus(const Id& id) const noexcept
        { return mFocus.has_value() && mFocus.value() == id; }
        inline bool HasKeyFocus(const Id& id) const noexcept
        { return HasSelFocus(id) && mKeyFocus; }
        inline std::optional<ImePurpose> GetImePurpose() const noexcept
        { return mImePurpose; }
        bool HasPendingChanges() const noexcept;

        // Clear the focus if it's held by the target exactly.
        bool ClearOn(const Id& target);

        // Clear the focus if it's held by the target or any descendant.
        bool ClearUnder(const Id& target);

        // Request selection focus. Returns false if the target already
        // has selection focus.
        bool RequestSel(const Id& target, FocusSource source);

        // Request key focus for the current selection focus holder with
        // an optional IME purpose.
        void RequestKey(std::optional<ImePurpose> ime);

        // Cancel the IME focus of the target. Returns false if the
        // target doesn't have IME focus.
        bool CancelIme(const Id& target);

        // The IME was enabled (or not) on the platform for the pending
        // IME request.
        void SetImeEnabled(bool enabled, std::optional<ImePurpose> purpose);

        // The IME was disabled by some external cause.
        void ImeDisabled();

        Pending TakePending();

        void Reset();
    private:
        void RecordLost(const Id& id, bool sel, bool key, bool ime);
    private:
        std::optional<Id> mFocus;
        bool mKeyFocus = false;
        bool mImeFocus = false;
        std::optional<ImePurpose> mImePurpose;
        std::optional<Lost> mLost;
        PendingSel mPendingSel;
        bool mNewKeyFocus = false;
        std::optional<ImePurpose> mNewIme;
    };

    // Accelerator key layers. Each layer is rooted at some widget and
    // the keys registered by the widgets inside the layer are bound
    // in the nearest enclosing layer.
    class AccelLayers
    {
    public:
        // Create a new layer rooted at the given widget. If alt_bypass
        // is set the keys in this layer are active without Alt.
        void NewLayer(const Id& id, bool alt_bypass);

        // Enable alt bypass on the layer nearest to the given widget.
        void EnableAltBypass(const Id& id, bool alt_bypass);

        // Bind the keys to the target in the nearest enclosing layer.
        // The first binding of any key wins. Returns false if there's
        // no layer for the widget.
        bool AddKeys(const Id& id, const std::vector<Key>& keys);

        // Look up the binding for the key in the nearest layer that
        // encloses the scope. If alt is not held only layers with alt
        // bypass are considered.
        std::optional<Id> Lookup(const Id& scope, const Key& key, bool alt) const;

        bool HasLayer(const Id& id) const;
        inline std::size_t GetNumLayers() const noexcept
        { return mLayers.size(); }

        void Clear();
    private:
        struct Layer {
            bool alt_bypass = false;
            std::unordered_map<Key, Id> keys;
        };
        Layer* FindLayer(const Id& id);
        const Layer* FindLayer(const Id& id) const;
    private:
        std::map<Id, Layer> mLayers;
    };

} // namespace

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

#include "warnpush.h"
#  include <nlohmann/json_fwd.hpp>
#include "warnpop.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "evtcore/types.h"
#include "evtcore/event.h"

namespace evt
{
    // When mouse drag on a widget's background may pan the content.
    enum class MousePan {
        Never, WithAlt, WithCtrl, Always
    };

    bool IsMousePanEnabled(MousePan pan, Modifiers modifiers) noexcept;

    // Event handling configuration. The event core only reads this.
    struct EventConfig {
        // Delay before opening or closing menus on hover.
        unsigned menu_delay_ms = 250;
        // Delay before a touch press turns into a text selection.
        unsigned touch_select_delay_ms = 1000;
        // Time after which kinetic scrolling stops without input.
        unsigned kinetic_timeout_ms = 50;
        // Kinetic scrolling velocity decay, multiplicative and subtractive.
        double kinetic_decay_mul = 0.625;
        double kinetic_decay_sub = 200.0;
        // Velocity decay while the kinetic scroll is grabbed.
        double kinetic_grab_sub = 10000.0;
        // Scroll distance of one wheel line in em units.
        double scroll_dist_em = 4.5;
        // Pointer travel (in logical pixels) before a press becomes a pan.
        double pan_dist_thresh = 5.0;
        MousePan mouse_pan = MousePan::Always;
        MousePan mouse_text_pan = MousePan::WithCtrl;
        // Whether the mouse wheel may be used for actions such as
        // changing a spinner's value.
        bool mouse_wheel_actions = true;
        // Whether mouse clicks set the navigation focus.
        bool mouse_nav_focus = true;
        // Whether touches set the navigation focus.
        bool touch_nav_focus = true;
        // Maximum time between clicks counted as repeated clicks.
        unsigned double_click_timeout_ms = 1000;

        void IntoJson(nlohmann::json& json) const;
        // Read the configuration from JSON. Missing fields keep their
        // current values. Returns false if any field was rejected.
        bool FromJson(const nlohmann::json& json);
    };

    // Keyboard shortcut bindings, mapping key presses with modifiers
    // into commands.
    class Shortcuts
    {
    public:
        // Load the default platform bindings.
        void LoadDefaults();

        // Bind the key with modifiers to the command. Replaces any
        // previous binding.
        void Insert(Modifiers modifiers, const Key& key, Command cmd);

        // Remove the binding. Returns true if the binding existed.
        bool Remove(Modifiers modifiers, const Key& key);

        // Match the key press to a command. A key without an explicit
        // binding that is pressed without modifiers (other than Shift)
        // maps through CommandFromKey.
        std::optional<Command> TryMatch(Modifiers modifiers, const Key& key) const;

        inline std::size_t GetNumBindings() const noexcept
        { return mBindings.size(); }

        void IntoJson(nlohmann::json& json) const;
        // Read (additional) bindings from JSON, overriding existing
        // bindings. Returns false if any binding was rejected.
        bool FromJson(const nlohmann::json& json);

        void Clear();
    private:
        struct Shortcut {
            Modifiers modifiers;
            Key key;
            bool operator==(const Shortcut& other) const noexcept
            { return modifiers == other.modifiers && key == other.key; }
        };
        struct ShortcutHash {
            std::size_t operator()(const Shortcut& shortcut) const noexcept;
        };
        std::unordered_map<Shortcut, Command, ShortcutHash> mBindings;
    };

    // Per window configuration. Combines the shared event configuration
    // with window specific settings.
    class WindowConfig
    {
    public:
        WindowConfig();
        explicit WindowConfig(const EventConfig& config);

        inline const EventConfig& GetEventConfig() const noexcept
        { return mConfig; }
        inline EventConfig& GetEventConfig() noexcept
        { return mConfig; }
        inline const Shortcuts& GetShortcuts() const noexcept
        { return mShortcuts; }
        inline Shortcuts& GetShortcuts() noexcept
        { return mShortcuts; }

        // Whether navigation focus is enabled in this window.
        inline bool IsNavFocusEnabled() const noexcept
        { return mNavFocus; }
        inline void EnableNavFocus(bool on_off) noexcept
        { mNavFocus = on_off; }

        inline void SetScaleFactor(double scale) noexcept
        { mScaleFactor = scale; }
        inline double GetScaleFactor() const noexcept
        { return mScaleFactor; }
        // Set the font size in pixels per em.
        inline void SetDpem(double dpem) noexcept
        { mDpem = dpem; }

        // Get the scroll distance in pixels for a number of lines.
        Offset ScrollDistance(const DVec2& lines) const noexcept;
        // Get the pan distance threshold in pixels.
        double PanDistanceThreshold() const noexcept;
        bool IsMousePanEnabled(Modifiers modifiers) const noexcept;
        bool IsMouseTextPanEnabled(Modifiers modifiers) const noexcept;
        bool IsMouseNavFocusEnabled() const noexcept
        { return mNavFocus && mConfig.mouse_nav_focus; }
        bool IsTouchNavFocusEnabled() const noexcept
        { return mNavFocus && mConfig.touch_nav_focus; }

        std::chrono::milliseconds GetMenuDelay() const noexcept
        { return std::chrono::milliseconds(mConfig.menu_delay_ms); }
        std::chrono::milliseconds GetTouchSelectDelay() const noexcept
        { return std::chrono::milliseconds(mConfig.touch_select_delay_ms); }
        std::chrono::milliseconds GetKineticTimeout() const noexcept
        { return std::chrono::milliseconds(mConfig.kinetic_timeout_ms); }
        std::chrono::milliseconds GetDoubleClickTimeout() const noexcept
        { return std::chrono::milliseconds(mConfig.double_click_timeout_ms); }

        // Load the event configuration and shortcut overrides from a JSON file.
        bool LoadFile(const std::string& file);
        // Save the event configuration and shortcuts into a JSON file.
        bool SaveFile(const std::string& file) const;
    private:
        EventConfig mConfig;
        Shortcuts mShortcuts;
        bool mNavFocus = true;
        double mScaleFactor = 1.0;
        double mDpem = 16.0;
    };

} // namespace

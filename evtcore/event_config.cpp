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

#include "warnpush.h"
#  include <nlohmann/json.hpp>
#include "warnpop.h"

#include <cmath>

#include "base/hash.h"
#include "base/json.h"
#include "base/logging.h"
#include "evtcore/event_config.h"

namespace {
using namespace evt;

template<typename T>
bool ReadField(const nlohmann::json& json, const char* name, T* out)
{
    if (!json.contains(name))
        return true;
    T value = *out;
    if (!base::JsonReadSafe(json, name, &value))
    {
        WARN("Rejected event config value. [field='%1']", name);
        return false;
    }
    *out = value;
    return true;
}

} // namespace

namespace evt
{

bool IsMousePanEnabled(MousePan pan, Modifiers modifiers) noexcept
{
    if (pan == MousePan::Never)
        return false;
    else if (pan == MousePan::WithAlt)
        return modifiers.test(Modifier::Alt);
    else if (pan == MousePan::WithCtrl)
        return modifiers.test(Modifier::Ctrl);
    return true;
}

void EventConfig::IntoJson(nlohmann::json& json) const
{
    base::JsonWrite(json, "menu_delay_ms",           menu_delay_ms);
    base::JsonWrite(json, "touch_select_delay_ms",   touch_select_delay_ms);
    base::JsonWrite(json, "kinetic_timeout_ms",      kinetic_timeout_ms);
    base::JsonWrite(json, "kinetic_decay_mul",       kinetic_decay_mul);
    base::JsonWrite(json, "kinetic_decay_sub",       kinetic_decay_sub);
    base::JsonWrite(json, "kinetic_grab_sub",        kinetic_grab_sub);
    base::JsonWrite(json, "scroll_dist_em",          scroll_dist_em);
    base::JsonWrite(json, "pan_dist_thresh",         pan_dist_thresh);
    base::JsonWrite(json, "mouse_pan",               mouse_pan);
    base::JsonWrite(json, "mouse_text_pan",          mouse_text_pan);
    base::JsonWrite(json, "mouse_wheel_actions",     mouse_wheel_actions);
    base::JsonWrite(json, "mouse_nav_focus",         mouse_nav_focus);
    base::JsonWrite(json, "touch_nav_focus",         touch_nav_focus);
    base::JsonWrite(json, "double_click_timeout_ms", double_click_timeout_ms);
}

bool EventConfig::FromJson(const nlohmann::json& json)
{
    if (!json.is_object())
        return false;

    bool ok = true;
    ok &= ReadField(json, "menu_delay_ms",           &menu_delay_ms);
    ok &= ReadField(json, "touch_select_delay_ms",   &touch_select_delay_ms);
    ok &= ReadField(json, "kinetic_timeout_ms",      &kinetic_timeout_ms);
    ok &= ReadField(json, "kinetic_decay_mul",       &kinetic_decay_mul);
    ok &= ReadField(json, "kinetic_decay_sub",       &kinetic_decay_sub);
    ok &= ReadField(json, "kinetic_grab_sub",        &kinetic_grab_sub);
    ok &= ReadField(json, "scroll_dist_em",          &scroll_dist_em);
    ok &= ReadField(json, "pan_dist_thresh",         &pan_dist_thresh);
    ok &= ReadField(json, "mouse_pan",               &mouse_pan);
    ok &= ReadField(json, "mouse_text_pan",          &mouse_text_pan);
    ok &= ReadField(json, "mouse_wheel_actions",     &mouse_wheel_actions);
    ok &= ReadField(json, "mouse_nav_focus",         &mouse_nav_focus);
    ok &= ReadField(json, "touch_nav_focus",         &touch_nav_focus);
    ok &= ReadField(json, "double_click_timeout_ms", &double_click_timeout_ms);
    return ok;
}

std::size_t Shortcuts::ShortcutHash::operator()(const Shortcut& shortcut) const noexcept
{
    std::size_t hash = 0;
    hash = base::hash_combine(hash, shortcut.modifiers);
    hash = base::hash_combine(hash, shortcut.key.GetHash());
    return hash;
}

void Shortcuts::LoadDefaults()
{
    const Modifiers none;
    const Modifiers shift(Modifier::Shift);
    const Modifiers alt(Modifier::Alt);
    const Modifiers ctrl(Modifier::Ctrl);
    const Modifiers ctrl_shift = ctrl | Modifier::Shift;

    Insert(none, NamedKey::F1,  Command::Help);
    Insert(none, NamedKey::F2,  Command::Rename);
    Insert(none, NamedKey::F3,  Command::FindNext);
    Insert(none, NamedKey::F5,  Command::Refresh);
    Insert(none, NamedKey::F7,  Command::SpellCheck);
    Insert(none, NamedKey::F8,  Command::Debug);
    Insert(none, NamedKey::F10, Command::Menu);
    Insert(none, NamedKey::F11, Command::Fullscreen);

    Insert(shift, NamedKey::F3, Command::FindPrevious);

    Insert(alt, NamedKey::F4,         Command::Close);
    Insert(alt, NamedKey::ArrowLeft,  Command::NavPrevious);
    Insert(alt, NamedKey::ArrowRight, Command::NavNext);
    Insert(alt, NamedKey::ArrowUp,    Command::NavParent);
    Insert(alt, NamedKey::ArrowDown,  Command::NavDown);

    const std::pair<const char*, Command> ctrl_chars[] = {
        {"a", Command::SelectAll},
        {"b", Command::Bold},
        {"c", Command::Copy},
        {"f", Command::Find},
        {"i", Command::Italic},
        {"k", Command::Link},
        {"n", Command::New},
        {"o", Command::Open},
        {"p", Command::Print},
        {"q", Command::Exit},
        {"r", Command::FindReplace},
        {"s", Command::Save},
        {"t", Command::TabNew},
        {"u", Command::Underline},
        {"v", Command::Paste},
        {"w", Command::Close},
        {"x", Command::Cut},
        {"y", Command::Redo},
        {"z", Command::Undo}
    };
    for (const auto& pair : ctrl_chars)
        Insert(ctrl, Key::Character(pair.first), pair.second);

    Insert(ctrl, NamedKey::Tab,        Command::TabNext);
    Insert(ctrl, NamedKey::ArrowUp,    Command::ViewUp);
    Insert(ctrl, NamedKey::ArrowDown,  Command::ViewDown);
    Insert(ctrl, NamedKey::ArrowLeft,  Command::WordLeft);
    Insert(ctrl, NamedKey::ArrowRight, Command::WordRight);
    Insert(ctrl, NamedKey::Backspace,  Command::DelWordBack);
    Insert(ctrl, NamedKey::Delete,     Command::DelWord);
    Insert(ctrl, NamedKey::Home,       Command::DocHome);
    Insert(ctrl, NamedKey::End,        Command::DocEnd);
    Insert(ctrl, NamedKey::PageUp,     Command::TabPrevious);
    Insert(ctrl, NamedKey::PageDown,   Command::TabNext);

    // with shift the selection is extended
    Insert(ctrl_shift, NamedKey::ArrowUp,    Command::ViewUp);
    Insert(ctrl_shift, NamedKey::ArrowDown,  Command::ViewDown);
    Insert(ctrl_shift, NamedKey::ArrowLeft,  Command::WordLeft);
    Insert(ctrl_shift, NamedKey::ArrowRight, Command::WordRight);
    Insert(ctrl_shift, NamedKey::Backspace,  Command::DelWordBack);
    Insert(ctrl_shift, NamedKey::Delete,     Command::DelWord);
    Insert(ctrl_shift, NamedKey::Home,       Command::DocHome);
    Insert(ctrl_shift, NamedKey::End,        Command::DocEnd);
    Insert(ctrl_shift, NamedKey::PageUp,     Command::TabPrevious);
    Insert(ctrl_shift, NamedKey::PageDown,   Command::TabNext);
    Insert(ctrl_shift, NamedKey::Tab,        Command::TabPrevious);
    Insert(ctrl_shift, Key::Character("a"),  Command::Deselect);
    Insert(ctrl_shift, Key::Character("z"),  Command::Redo);
}

void Shortcuts::Insert(Modifiers modifiers, const Key& key, Command cmd)
{
    mBindings[Shortcut { modifiers, key }] = cmd;
}

bool Shortcuts::Remove(Modifiers modifiers, const Key& key)
{
    return mBindings.erase(Shortcut { modifiers, key }) == 1;
}

std::optional<Command> Shortcuts::TryMatch(Modifiers modifiers, const Key& key) const
{
    auto it = mBindings.find(Shortcut { modifiers, key });
    if (it != mBindings.end())
        return it->second;

    modifiers.set(Modifier::Shift, false);
    if (modifiers.empty())
        return CommandFromKey(key);
    return std::nullopt;
}

void Shortcuts::IntoJson(nlohmann::json& json) const
{
    auto array = nlohmann::json::array();
    for (const auto& pair : mBindings)
    {
        const auto& shortcut = pair.first;
        nlohmann::json item;
        base::JsonWrite(item, "modifiers", shortcut.modifiers);
        if (shortcut.key.IsNamed())
            base::JsonWrite(item, "named", shortcut.key.GetNamed().value());
        else base::JsonWrite(item, "key", shortcut.key.GetCharacter());
        base::JsonWrite(item, "command", pair.second);
        base::JsonAppend(array, std::move(item));
    }
    json["shortcuts"] = std::move(array);
}

bool Shortcuts::FromJson(const nlohmann::json& json)
{
    if (!json.contains("shortcuts"))
        return true;

    bool ok = true;
    const bool is_array = base::JsonForEach(json["shortcuts"], [this, &ok](const nlohmann::json& item) {
        Modifiers modifiers;
        Command cmd = Command::Activate;
        NamedKey named = NamedKey::Enter;
        std::string character;
        if (item.contains("modifiers") && !base::JsonReadSafe(item, "modifiers", &modifiers))
        {
            WARN("Rejected shortcut with invalid modifiers.");
            ok = false;
            return true;
        }
        if (!base::JsonReadSafe(item, "command", &cmd))
        {
            WARN("Rejected shortcut with invalid command.");
            ok = false;
            return true;
        }
        if (base::JsonReadSafe(item, "named", &named))
            Insert(modifiers, named, cmd);
        else if (base::JsonReadSafe(item, "key", &character) && !character.empty())
            Insert(modifiers, Key::Character(character), cmd);
        else
        {
            WARN("Rejected shortcut without a key. [command=%1]", cmd);
            ok = false;
        }
        return true;
    });
    if (!is_array)
    {
        WARN("Shortcuts is not a JSON array.");
        return false;
    }
    return ok;
}

void Shortcuts::Clear()
{
    mBindings.clear();
}

WindowConfig::WindowConfig()
{
    mShortcuts.LoadDefaults();
}

WindowConfig::WindowConfig(const EventConfig& config)
  : mConfig(config)
{
    mShortcuts.LoadDefaults();
}

Offset WindowConfig::ScrollDistance(const DVec2& lines) const noexcept
{
    const auto dist = mConfig.scroll_dist_em * mDpem;
    return Offset(static_cast<int>(std::round(dist * lines.x)),
                  static_cast<int>(std::round(dist * lines.y)));
}

double WindowConfig::PanDistanceThreshold() const noexcept
{
    return mConfig.pan_dist_thresh * mScaleFactor;
}

bool WindowConfig::IsMousePanEnabled(Modifiers modifiers) const noexcept
{
    return evt::IsMousePanEnabled(mConfig.mouse_pan, modifiers);
}

bool WindowConfig::IsMouseTextPanEnabled(Modifiers modifiers) const noexcept
{
    return evt::IsMousePanEnabled(mConfig.mouse_text_pan, modifiers);
}

bool WindowConfig::LoadFile(const std::string& file)
{
    const auto& [ok, json, error] = base::JsonParseFile(file);
    if (!ok)
    {
        ERROR("Failed to parse event config file. [file='%1', error='%2']", file, error);
        return false;
    }
    bool success = true;
    if (json.contains("events"))
        success &= mConfig.FromJson(json["events"]);
    success &= mShortcuts.FromJson(json);
    INFO("Loaded event config. [file='%1']", file);
    return success;
}

bool WindowConfig::SaveFile(const std::string& file) const
{
    nlohmann::json json;
    nlohmann::json events;
    mConfig.IntoJson(events);
    json["events"] = std::move(events);
    mShortcuts.IntoJson(json);

    const auto& [ok, error] = base::JsonWriteFile(json, file);
    if (!ok)
    {
        ERROR("Failed to write event config file. [file='%1', error='%2']", file, error);
        return false;
    }
    return true;
}

} // namespace

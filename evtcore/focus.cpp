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

#include "base/logging.h"
#include "evtcore/focus.h"

namespace evt
{

bool NavFocusState::RegisterFallback(const Id& id)
{
    if (mFallback.has_value())
        return false;
    DEBUG("Register nav fallback. [id=%1]", id);
    mFallback = id;
    return true;
}

bool NavFocusState::StageSet(const std::optional<Id>& target, FocusSource source)
{
    if (const auto* set = std::get_if<SetTo>(&mPending))
    {
        if (set->target == target)
            return false;
    }
    else if (std::holds_alternative<Idle>(mPending) && mFocus == target)
        return false;

    mPending = SetTo { target, source };
    return true;
}

void NavFocusState::StageAdvance(const std::optional<Id>& target, NavAdvance advance, bool inclusive, FocusSource source)
{
    mPending = Advance { target, advance, inclusive, source };
}

NavFocusState::Pending NavFocusState::TakePending()
{
    Pending ret = std::move(mPending);
    mPending = Idle {};
    return ret;
}

std::optional<Id> NavFocusState::Commit(const std::optional<Id>& focus)
{
    auto old = std::move(mFocus);
    mFocus = focus;
    DEBUG("Nav focus changed. [old=%1, new=%2]", old, focus);
    return old;
}

std::optional<Id> NavFocusState::ClearOn(const Id& target)
{
    std::optional<Id> lost;
    if (mFocus.has_value() && target.IsAncestorOf(mFocus.value()))
    {
        lost = std::move(mFocus);
        mFocus.reset();
        DEBUG("Nav focus cleared. [id=%1]", lost);
    }

    if (const auto* set = std::get_if<SetTo>(&mPending))
    {
        if (IsAncestorOf(target, set->target.value_or(Id())))
            mPending = Idle {};
    }
    else if (const auto* advance = std::get_if<Advance>(&mPending))
    {
        if (IsAncestorOf(target, advance->target.value_or(Id())))
            mPending = Idle {};
    }
    return lost;
}

void NavFocusState::ResetFallback()
{
    mFallback.reset();
}

void NavFocusState::Reset()
{
    mFocus.reset();
    mFallback.reset();
    mPending = Idle {};
}

std::optional<Id> InputFocusState::GetKeyFocus() const
{
    if (mKeyFocus)
        return mFocus;
    return std::nullopt;
}

std::optional<Id> InputFocusState::GetImeFocus() const
{
    if (mImeFocus)
        return mFocus;
    return std::nullopt;
}

bool InputFocusState::HasPendingChanges() const noexcept
{
    return mLost.has_value() ||
           !std::holds_alternative<Idle>(mPendingSel) ||
           mNewKeyFocus ||
           mNewIme.has_value();
}

bool InputFocusState::ClearOn(const Id& target)
{
    if (!HasSelFocus(target))
        return false;

    const auto* staged = std::get_if<StagedTo>(&mPendingSel);
    if (staged && staged->target == target)
    {
        // never committed, nothing was delivered to the target yet.
        mPendingSel = Idle {};
    }
    else
    {
        RecordLost(target, true, mKeyFocus, mImeFocus);
    }
    DEBUG("Sel focus cleared. [id=%1]", target);

    mFocus.reset();
    mKeyFocus = false;
    mImeFocus = false;
    mImePurpose.reset();
    mNewKeyFocus = false;
    mNewIme.reset();
    return true;
}

bool InputFocusState::ClearUnder(const Id& target)
{
    if (!mFocus.has_value() || !target.IsAncestorOf(mFocus.value()))
        return false;
    const Id focus = mFocus.value();
    return ClearOn(focus);
}

bool InputFocusState::RequestSel(const Id& target, FocusSource source)
{
    if (HasSelFocus(target))
        return false;
    if (mFocus.has_value())
    {
        const Id old = mFocus.value();
        ClearOn(old);
    }
    mFocus = target;
    mPendingSel = StagedTo { target, source };
    DEBUG("Sel focus requested. [id=%1, source=%2]", target, source);
    return true;
}

void InputFocusState::RequestKey(std::optional<ImePurpose> ime)
{
    if (!mFocus.has_value())
        return;
    if (!mKeyFocus)
    {
        mKeyFocus = true;
        mNewKeyFocus = true;
    }
    if (ime.has_value() && !mImeFocus)
        mNewIme = ime;
}

bool InputFocusState::CancelIme(const Id& target)
{
    if (GetImeFocus() != target)
        return false;
    mImeFocus = false;
    mImePurpose.reset();
    RecordLost(target, false, false, true);
    return true;
}

void InputFocusState::SetImeEnabled(bool enabled, std::optional<ImePurpose> purpose)
{
    mImeFocus = enabled;
    mImePurpose = enabled ? purpose : std::nullopt;
}

void InputFocusState::ImeDisabled()
{
    mImeFocus = false;
    mImePurpose.reset();
}

InputFocusState::Pending InputFocusState::TakePending()
{
    Pending ret;
    ret.lost    = std::move(mLost);
    ret.sel     = std::move(mPendingSel);
    ret.new_key = mNewKeyFocus;
    ret.new_ime = mNewIme;
    mLost.reset();
    mPendingSel = Idle {};
    mNewKeyFocus = false;
    mNewIme.reset();
    return ret;
}

void InputFocusState::Reset()
{
    mFocus.reset();
    mKeyFocus = false;
    mImeFocus = false;
    mImePurpose.reset();
    mLost.reset();
    mPendingSel = Idle {};
    mNewKeyFocus = false;
    mNewIme.reset();
}

void InputFocusState::RecordLost(const Id& id, bool sel, bool key, bool ime)
{
    if (mLost.has_value())
    {
        // upgrade a partial loss into a full loss. a loss on another
        // target means the focus moved without the new target receiving
        // any focus event yet.
        if (mLost->id == id)
        {
            mLost->sel |= sel;
            mLost->key |= key;
            mLost->ime |= ime;
        }
        return;
    }
    mLost = Lost { id, sel, key, ime };
}

void AccelLayers::NewLayer(const Id& id, bool alt_bypass)
{
    auto& layer = mLayers[id];
    layer.alt_bypass = alt_bypass;
    layer.keys.clear();
}

void AccelLayers::EnableAltBypass(const Id& id, bool alt_bypass)
{
    if (auto* layer = FindLayer(id))
        layer->alt_bypass = alt_bypass;
}

bool AccelLayers::AddKeys(const Id& id, const std::vector<Key>& keys)
{
    auto* layer = FindLayer(id);
    if (layer == nullptr)
    {
        ERROR("No accelerator layer for widget. Missing root layer? [id=%1]", id);
        return false;
    }
    for (const auto& key : keys)
    {
        // first binding wins
        layer->keys.emplace(key, id);
    }
    return true;
}

std::optional<Id> AccelLayers::Lookup(const Id& scope, const Key& key, bool alt) const
{
    const auto* layer = FindLayer(scope);
    if (layer == nullptr)
        return std::nullopt;
    if (!alt && !layer->alt_bypass)
        return std::nullopt;

    auto it = layer->keys.find(key);
    if (it == layer->keys.end())
        return std::nullopt;
    return it->second;
}

bool AccelLayers::HasLayer(const Id& id) const
{
    return mLayers.find(id) != mLayers.end();
}

void AccelLayers::Clear()
{
    mLayers.clear();
}

AccelLayers::Layer* AccelLayers::FindLayer(const Id& id)
{
    // the map is in pre-order, scanning backwards from the id the
    // first ancestor is the nearest enclosing layer.
    auto it = mLayers.upper_bound(id);
    while (it != mLayers.begin())
    {
        --it;
        if (it->first.IsAncestorOf(id))
            return &it->second;
    }
    return nullptr;
}

const AccelLayers::Layer* AccelLayers::FindLayer(const Id& id) const
{
    auto it = mLayers.upper_bound(id);
    while (it != mLayers.begin())
    {
        --it;
        if (it->first.IsAncestorOf(id))
            return &it->second;
    }
    return nullptr;
}

} // namespace

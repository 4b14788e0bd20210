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

#include "base/assert.h"
#include "base/logging.h"
#include "evtcore/popup.h"

namespace evt
{

void PopupStack::Push(PopupState popup)
{
    DEBUG("Push popup. [window=%1, id=%2, parent=%3]", popup.window, popup.desc.id, popup.desc.parent);
    mPopups.push_back(std::move(popup));
}

bool PopupStack::Reposition(WindowId window, const PopupDescriptor& desc)
{
    const auto index = FindIndex(window);
    if (!index.has_value())
    {
        VERBOSE("No such popup to reposition. [window=%1]", window);
        return false;
    }
    auto& popup = mPopups[index.value()];
    if (popup.desc.id != desc.id)
    {
        ERROR("Popup id cannot change on reposition. [window=%1, old=%2, new=%3]",
              window, popup.desc.id, desc.id);
        return false;
    }
    popup.desc = desc;
    return true;
}

PopupState PopupStack::Remove(std::size_t index)
{
    ASSERT(index < mPopups.size());
    PopupState ret = std::move(mPopups[index]);
    mPopups.erase(mPopups.begin() + index);
    DEBUG("Remove popup. [window=%1, id=%2]", ret.window, ret.desc.id);
    return ret;
}

bool PopupStack::ConfirmSized(WindowId window)
{
    const auto index = FindIndex(window);
    if (!index.has_value())
        return false;
    mPopups[index.value()].is_sized = true;
    return true;
}

std::optional<std::size_t> PopupStack::FindIndex(WindowId window) const
{
    for (std::size_t i=0; i<mPopups.size(); ++i)
    {
        if (mPopups[i].window == window)
            return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> PopupStack::FindCovering(const Id& id) const
{
    for (std::size_t i=mPopups.size(); i>0; --i)
    {
        if (mPopups[i-1].desc.id.IsAncestorOf(id))
            return i-1;
    }
    return std::nullopt;
}

const PopupState* PopupStack::GetTop() const noexcept
{
    if (mPopups.empty())
        return nullptr;
    return &mPopups.back();
}

const PopupState* PopupStack::GetTopSized() const noexcept
{
    const auto* top = GetTop();
    if (top && top->is_sized)
        return top;
    return nullptr;
}

bool PopupStack::IsParentOfAny(const Id& id) const noexcept
{
    for (const auto& popup : mPopups)
    {
        if (popup.desc.parent == id)
            return true;
    }
    return false;
}

} // namespace

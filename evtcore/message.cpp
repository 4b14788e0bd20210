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
#include "evtcore/message.h"

namespace evt
{

std::string Erased::GetTypeName() const
{
    if (!mValue)
        return "<empty>";
    return mValue->GetType().name();
}

bool IsSafeToIgnore(const Erased& message) noexcept
{
    return message.Is<msg::KineticStart>();
}

MessageStack::~MessageStack()
{
    mBase = 0;
    DropUnhandled();
}

std::size_t MessageStack::SetBase() noexcept
{
    const auto old = mBase;
    mBase = mStack.size();
    return old;
}

void MessageStack::RestoreBase(std::size_t base) noexcept
{
    mBase = base;
}

bool MessageStack::ResetAndHasAny() noexcept
{
    mBase = 0;
    return !mStack.empty();
}

void MessageStack::PushErased(Erased msg)
{
    mStack.push_back(std::move(msg));
    ++mOpCount;
}

std::optional<Erased> MessageStack::PopErased()
{
    if (!HasAny())
        return std::nullopt;
    std::optional<Erased> ret(std::move(mStack.back()));
    mStack.pop_back();
    ++mOpCount;
    return ret;
}

std::size_t MessageStack::DropUnhandled()
{
    std::size_t count = 0;
    while (HasAny())
    {
        const auto& top = mStack.back();
        if (!IsSafeToIgnore(top))
            WARN("Unhandled message. [type='%1']", top.GetTypeName());
        mStack.pop_back();
        ++count;
    }
    return count;
}

} // namespace

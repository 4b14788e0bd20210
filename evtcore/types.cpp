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

#include "base/hash.h"
#include "base/format.h"
#include "evtcore/types.h"

namespace evt
{

std::size_t Key::GetHash() const noexcept
{
    std::size_t hash = 0;
    hash = base::hash_combine(hash, mNamed.has_value());
    if (mNamed.has_value())
        hash = base::hash_combine(hash, static_cast<int>(mNamed.value()));
    hash = base::hash_combine(hash, mCharacter);
    return hash;
}

std::string Key::ToString() const
{
    if (mNamed.has_value())
        return base::ToString(mNamed.value());
    if (mCharacter.empty())
        return "<none>";
    return "'" + mCharacter + "'";
}

bool operator==(const Scroll& lhs, const Scroll& rhs) noexcept
{
    if (lhs.type != rhs.type)
        return false;
    if (lhs.type == Scroll::Type::Offset)
        return lhs.offset == rhs.offset;
    else if (lhs.type == Scroll::Type::Rect)
        return lhs.rect == rhs.rect;
    return true;
}

} // namespace

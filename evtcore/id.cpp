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

#include <algorithm>
#include <sstream>

#include "base/hash.h"
#include "evtcore/id.h"

namespace evt
{

// static
Id Id::Root()
{
    Id ret;
    ret.mValid = true;
    return ret;
}

// static
Id Id::FromPath(std::vector<std::size_t> path)
{
    Id ret;
    ret.mPath  = std::move(path);
    ret.mValid = true;
    return ret;
}

Id Id::MakeChild(std::size_t index) const
{
    if (!mValid)
        return Id();
    Id ret = *this;
    ret.mPath.push_back(index);
    return ret;
}

bool Id::IsAncestorOf(const Id& other) const noexcept
{
    if (!mValid || !other.mValid)
        return false;
    if (mPath.size() > other.mPath.size())
        return false;
    return std::equal(mPath.begin(), mPath.end(), other.mPath.begin());
}

Id Id::CommonAncestor(const Id& other) const
{
    if (!mValid || !other.mValid)
        return Id();

    const auto len = std::min(mPath.size(), other.mPath.size());
    std::size_t common = 0;
    while (common < len && mPath[common] == other.mPath[common])
        ++common;

    Id ret;
    ret.mValid = true;
    ret.mPath.assign(mPath.begin(), mPath.begin() + common);
    return ret;
}

std::optional<Id> Id::GetParent() const
{
    if (!mValid || mPath.empty())
        return std::nullopt;
    Id ret = *this;
    ret.mPath.pop_back();
    return ret;
}

std::vector<std::size_t> Id::IterKeysAfter(const Id& ancestor) const
{
    if (!ancestor.IsAncestorOf(*this))
        return {};
    return std::vector<std::size_t>(mPath.begin() + ancestor.mPath.size(), mPath.end());
}

std::optional<std::size_t> Id::NextKeyAfter(const Id& ancestor) const
{
    if (!ancestor.IsAncestorOf(*this))
        return std::nullopt;
    if (ancestor.mPath.size() == mPath.size())
        return std::nullopt;
    return mPath[ancestor.mPath.size()];
}

std::size_t Id::GetHash() const noexcept
{
    std::size_t hash = 0;
    hash = base::hash_combine(hash, mValid);
    hash = base::hash_combine(hash, mPath);
    return hash;
}

std::string Id::ToString() const
{
    if (!mValid)
        return "#INVALID";

    std::stringstream ss;
    ss << "#";
    for (std::size_t i=0; i<mPath.size(); ++i)
    {
        if (i) ss << ".";
        ss << mPath[i];
    }
    return ss.str();
}

bool Id::operator<(const Id& other) const noexcept
{
    if (mValid != other.mValid)
        return !mValid;
    return std::lexicographical_compare(mPath.begin(), mPath.end(),
                                        other.mPath.begin(), other.mPath.end());
}

} // namespace

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
#  include <glm/vec2.hpp>
#include "warnpop.h"

#include <functional>
#include <vector>

#include "base/bitflag.h"

namespace base
{

template<typename S, typename T> inline
S hash_combine(S seed, T value)
{
    const auto hash = std::hash<T>()(value);
    seed ^= hash + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

template<typename S> inline
S hash_combine(S seed, const glm::ivec2& value)
{
    seed = hash_combine(seed, value.x);
    seed = hash_combine(seed, value.y);
    return seed;
}

template<typename S, typename T> inline
S hash_combine(S seed, const std::vector<T>& values)
{
    seed = hash_combine(seed, values.size());
    for (const auto& value : values)
        seed = hash_combine(seed, value);
    return seed;
}

template<typename S, typename Enum> inline
S hash_combine(S seed, const bitflag<Enum>& bits)
{
    seed = hash_combine(seed, bits.value());
    return seed;
}

} // namespace

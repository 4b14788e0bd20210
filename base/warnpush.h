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

// wrap any third party header inclusions that cause warnings
// inside warnpush.h and warnpop.h inclusions.

// note that GCC and clang don't give the same warnings, hence
// the suppressions are different
#if defined(__GCC__)
#  pragma GCC diagnostic push
#  pragma GCC diagnostic ignored "-Wunused-local-typedefs"
#  pragma GCC diagnostic ignored "-Wunused-function"
#  pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#  pragma GCC diagnostic ignored "-Wshadow"
#elif defined(__CLANG__)
#  pragma clang diagnostic push
#  pragma clang diagnostic ignored "-Wunused-local-typedefs"
#  pragma clang diagnostic ignored "-Wdeprecated-declarations"
#  pragma clang diagnostic ignored "-Wshadow"
#elif defined(__MSVC__)
#  pragma warning(push)
#  pragma warning(disable: 4244) // glm, conversion from double to float
#  pragma warning(disable: 4267) // nlohmann, conversion from size_t to int
#  pragma warning(disable: 4996) // deprecated
#endif

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

// this is the base platform file with universally useful definitions.
// the project config.h includes this file and adds the library
// specific build flags. all the other source files just #include "config.h"

#pragma once

// assuming some msvc version for windows, gcc or clang for linux.

#if defined(_MSC_VER)
  #define __MSVC__
  #define WINDOWS_OS
  #ifdef _M_AMD64
    #define X86_64
  #endif
  #define COMPILER_NAME    "msvc"
  #define COMPILER_VERSION _MSC_FULL_VER

  #define __PRETTY_FUNCTION__ __FUNCSIG__

  #define WIN32_LEAN_AND_MEAN
  #define NOMINMAX
  #define _CRT_SECURE_NO_WARNINGS
  #define _SCL_SECURE_NO_WARNINGS
  #define _USE_MATH_DEFINES

  #define NORETURN __declspec(noreturn)
#endif

#if defined(__GNUG__) && !defined(__clang__)
  #define __GCC__
  #define POSIX_OS
  #ifdef __LP64__
    #define X86_64
  #endif
  #define COMPILER_NAME "GCC"
  #define COMPILER_VERSION __GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__
  #define NORETURN [[noreturn]]
#endif

#if defined(__clang__)
  #ifdef __LP64__
    #define X86_64
  #endif
  #define __CLANG__
  #define POSIX_OS
  #define COMPILER_NAME    "clang"
  #define COMPILER_VERSION __clang_version__
  #define NORETURN [[noreturn]]
#endif

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

// config.h for the base and evtcore libraries. Every translation
// unit includes this file first. The build flags here apply to all
// the libraries, if a target needs different flags it must build
// the translation units itself.

#include "base/platform.h"

// some of the code uses LINUX_OS
// we expect that POSIX_OS is Linux
#if defined(POSIX_OS)
#  define LINUX_OS
#endif

#define BASE_LOGGING_ENABLE_LOG
#define BASE_FORMAT_SUPPORT_GLM
#define BASE_FORMAT_SUPPORT_MAGIC_ENUM
#define BASE_TEST_HELP_SUPPORT_GLM

// This flag controls whether the event state dumps the widget
// path of every shortcut command to the debug log.
#define EVT_LOG_COMMAND_ROUTING

// Maximum number of simultaneously tracked touch points.
// Touches beyond this are ignored.
#define EVT_MAX_TOUCHES 10

// Maximum number of simultaneous pan grabs.
#define EVT_MAX_PAN_GRABS 2

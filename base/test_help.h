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

// this file should only be included in unit test files.

#include "config.h"

#include "warnpush.h"
#if defined(BASE_TEST_HELP_SUPPORT_GLM)
#  include <glm/vec2.hpp>
#  include <glm/geometric.hpp>
#endif
#include "warnpop.h"

#include <cmath>
#include <fstream>
#include <string>
#include <variant>

#include "base/platform.h"
#include "base/test_minimal.h"
#include "base/logging.h"

#if defined(BASE_TEST_HELP_SUPPORT_GLM)
namespace glm {
static bool operator==(const glm::dvec2& lhs, const glm::dvec2& rhs)
{ return std::abs(lhs.x - rhs.x) < 0.0001 && std::abs(lhs.y - rhs.y) < 0.0001; }
static bool operator!=(const glm::dvec2& lhs, const glm::dvec2& rhs)
{ return !(lhs == rhs); }
} // glm
#endif

template<typename T, typename... Args>
static bool operator==(const std::variant<Args...>& variant, const T& val)
{
    TEST_REQUIRE(std::holds_alternative<T>(variant));
    return std::get<T>(variant) == val;
}
template<typename T, typename... Args>
static bool operator!=(const std::variant<Args...>& variant, const T& val)
{
    TEST_REQUIRE(std::holds_alternative<T>(variant));
    return std::get<T>(variant) != val;
}

namespace test {

// Route all the log output produced during a test run into a log
// file. Verbose and debug logs are turned on for the lifetime of
// the logger object and the previous global logger is restored on exit.
class TestLogger
{
public:
    explicit TestLogger(const std::string& file)
      : mStream(file, std::ios::out | std::ios::trunc)
      , mLogger(mStream)
    {
        mLogger.SetStyle(base::OStreamLogger::Style::Basic);
        mPrevious = base::SetGlobalLog(&mLogger);
        base::EnableLogEvent(base::LogEvent::Verbose, true);
        base::EnableLogEvent(base::LogEvent::Debug, true);
    }
   ~TestLogger()
    {
        base::EnableLogEvent(base::LogEvent::Verbose, false);
        base::EnableLogEvent(base::LogEvent::Debug, false);
        base::SetGlobalLog(mPrevious);
        mStream.flush();
    }
    TestLogger(const TestLogger&) = delete;
    TestLogger& operator=(const TestLogger&) = delete;
private:
    std::ofstream mStream;
    base::OStreamLogger mLogger;
    base::Logger* mPrevious = nullptr;
};

} // namespace

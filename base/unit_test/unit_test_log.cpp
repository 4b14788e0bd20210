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

#include <thread>
#include <iostream>
#include <optional>
#include <string>

#include "base/test_minimal.h"
#include "base/logging.h"
#include "base/format.h"
#include "base/bitflag.h"

enum class Shade {
    Dark, Light
};

enum class Style {
    Bold, Italic, Underline
};

void thread_entry(base::Logger* logger)
{
    base::SetThreadLog(logger);
    for (int i=0; i<100; ++i)
    {
        INFO("thread");
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    base::SetThreadLog(nullptr);
}

void global_entry()
{
    for (int i=0; i<100; ++i)
    {
        INFO("global [i=%1]", i);
    }
}

void unit_test_format()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::FormatString("hello") == "hello");
    TEST_REQUIRE(base::FormatString("%1 %2", 1, "two") == "1 two");
    TEST_REQUIRE(base::FormatString("%2 %1", 1, "two") == "two 1");
    TEST_REQUIRE(base::FormatString("[%1]", true) == "[true]");
    TEST_REQUIRE(base::FormatString("[%1]", std::string("str")) == "[str]");

    TEST_REQUIRE(base::FormatString("%1", Shade::Light) == "Light");
    TEST_REQUIRE(base::FormatString("%1", std::optional<Shade>()) == "None");
    TEST_REQUIRE(base::FormatString("%1", std::optional<Shade>(Shade::Dark)) == "Dark");

    base::bitflag<Style> style;
    style.set(Style::Bold);
    style.set(Style::Underline);
    TEST_REQUIRE(base::FormatString("%1", style) == "Bold|Underline");
    TEST_REQUIRE(base::FormatString("%1", base::bitflag<Style>()) == "");

    TEST_REQUIRE(base::FormatString("%1", glm::ivec2(3, -4)) == "[3 -4]");
    TEST_REQUIRE(base::FormatString("%1", glm::dvec2(1.5, 0.25)) == "[1.500 0.250]");

    TEST_REQUIRE(base::TrimString("  key  \n") == "key");
    TEST_REQUIRE(base::TrimString(" \t ") == "");
}

void unit_test_log_levels()
{
    TEST_CASE(test::Type::Feature)

    {
        base::NullLogger null;
        base::SetGlobalLog(&null);
        TEST_REQUIRE(base::GetGlobalLog());
        base::SetGlobalLog(nullptr);
        TEST_REQUIRE(!base::GetGlobalLog());
        base::EnableDebugLog(true);
        TEST_REQUIRE(base::IsDebugLogEnabled());
        base::EnableDebugLog(false);
        TEST_REQUIRE(base::IsDebugLogEnabled() == false);
    }

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);
    base::EnableDebugLog(true);

    VERBOSE("verbose");
    DEBUG("debug");
    INFO("information");
    WARN("warning");
    ERROR("error [code=%1]", 42);

    // verbose is off by default
    TEST_REQUIRE(logger.GetBufferMsgCount() == 4);
    TEST_REQUIRE(logger.GetMessage(0).msg == "debug");
    TEST_REQUIRE(logger.GetMessage(0).line != 0);
    TEST_REQUIRE(logger.GetMessage(0).file == "unit_test_log.cpp");
    TEST_REQUIRE(logger.GetMessage(0).type == base::LogEvent::Debug);
    TEST_REQUIRE(logger.GetMessage(1).msg == "information");
    TEST_REQUIRE(logger.GetMessage(1).type == base::LogEvent::Info);
    TEST_REQUIRE(logger.GetMessage(2).msg == "warning");
    TEST_REQUIRE(logger.GetMessage(2).type == base::LogEvent::Warning);
    TEST_REQUIRE(logger.GetMessage(3).msg == "error [code=42]");
    TEST_REQUIRE(logger.GetMessage(3).type == base::LogEvent::Error);
    logger.Dispatch();
    TEST_REQUIRE(logger.GetBufferMsgCount() == 0);

    base::EnableLogEvent(base::LogEvent::Verbose, true);
    base::EnableDebugLog(false);
    VERBOSE("verbose");
    DEBUG("debug");
    TEST_REQUIRE(logger.GetBufferMsgCount() == 1);
    TEST_REQUIRE(logger.GetMessage(0).type == base::LogEvent::Verbose);
    logger.Dispatch();

    base::EnableLogEvent(base::LogEvent::Verbose, false);
    base::EnableLogEvent(base::LogEvent::Info, false);
    INFO("info");
    TEST_REQUIRE(base::IsLogEventEnabled(base::LogEvent::Info) == false);
    TEST_REQUIRE(logger.GetBufferMsgCount() == 0);
    base::EnableLogEvent(base::LogEvent::Info, true);

    // formatted write carries the event in the message
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, true);
    logger.EnableWrite(base::Logger::WriteType::WriteRaw, false);
    WARN("formatted");
    TEST_REQUIRE(logger.GetBufferMsgCount() == 1);
    TEST_REQUIRE(logger.GetMessage(0).file.empty());
    TEST_REQUIRE(logger.GetMessage(0).msg.find("Warning") != std::string::npos);
    TEST_REQUIRE(logger.GetMessage(0).msg.find("\"formatted\"") != std::string::npos);
    logger.Dispatch();

    base::SetGlobalLog(nullptr);
}

void unit_test_log_threads()
{
    TEST_CASE(test::Type::Feature)

    // thread specific logs
    {
        base::BufferLogger<base::NullLogger> one;
        base::BufferLogger<base::NullLogger> two;
        one.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
        two.EnableWrite(base::Logger::WriteType::WriteFormatted, false);

        std::thread t0(thread_entry, &one);
        std::thread t1(thread_entry, &two);

        t0.join();
        t1.join();
        TEST_REQUIRE(one.GetBufferMsgCount() == 100);
        TEST_REQUIRE(two.GetBufferMsgCount() == 100);
    }

    // shared thread specific log needs the lock
    {
        base::LockedLogger<base::BufferLogger<base::NullLogger>> log;
        log.EnableWrite(base::Logger::WriteType::WriteFormatted, false);

        std::thread t0(thread_entry, &log);
        std::thread t1(thread_entry, &log);
        thread_entry(&log);

        t0.join();
        t1.join();
        TEST_REQUIRE(log.GetLoggerUnsafe().GetBufferMsgCount() == 300);
    }

    // global log access is serialized
    {
        base::BufferLogger<base::NullLogger> log;
        log.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
        base::SetGlobalLog(&log);

        std::thread t0(global_entry);
        std::thread t1(global_entry);
        global_entry();

        t0.join();
        t1.join();
        base::SetGlobalLog(nullptr);
        TEST_REQUIRE(log.GetBufferMsgCount() == 300);
    }
}

void unit_test_log_terminal()
{
    TEST_CASE(test::Type::Feature)

    base::OStreamLogger logger(std::cout);
    logger.SetStyle(base::OStreamLogger::Style::FancyColor);
    base::SetGlobalLog(&logger);
    base::EnableDebugLog(true);
    DEBUG("Hello");
    INFO("Hello");
    WARN("Hello");
    ERROR("Hello");
    base::EnableDebugLog(false);
    base::SetGlobalLog(nullptr);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_format();
    unit_test_log_levels();
    unit_test_log_threads();
    unit_test_log_terminal();
    return 0;
}
) // TEST_MAIN

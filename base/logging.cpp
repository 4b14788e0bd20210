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

#if defined(WINDOWS_OS)
#  include <Windows.h>
#endif

#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <cstdio>
#include <mutex>

#include "base/assert.h"
#include "base/logging.h"

namespace {
// a thread specific logger object.
thread_local base::Logger* threadLogger;

// global logger
base::Logger* globalLogger;
std::mutex globalLoggerMutex;

// flags to globally specify which log events
// are enabled or not.
bool isGlobalVerboseLogEnabled = false;
bool isGlobalDebugLogEnabled   = false;
bool isGlobalWarnLogEnabled    = true;
bool isGlobalInfoLogEnabled    = true;
bool isGlobalErrorLogEnabled   = true;

} // namespace

namespace base
{

const char* ToString(base::LogEvent e)
{
    switch (e)
    {
        case LogEvent::Verbose:
            return "Verbose";
        case LogEvent::Debug:
           return "Debug";
        case LogEvent::Info:
           return "Info";
        case LogEvent::Warning:
           return "Warning";
        case LogEvent::Error:
            return "Error";
    }
    BUG("Unknown log event.");
    return "";
}

OStreamLogger::OStreamLogger(std::ostream& out) : m_out(&out)
{}

void OStreamLogger::Write(LogEvent type, const char* file, int line, const char* msg, double time)
{
#if defined(LINUX_OS)
    if (mStyle == Style::FancyColor)
    {
        // More information about the terminal escape colors (and codes)
        // is available at Wikipedia.
        // https://en.wikipedia.org/wiki/ANSI_escape_code#Colors
        auto& out = *m_out;
        std::ios old_state(nullptr);
        old_state.copyfmt(out);

        out << "\033[" << 2 << "m"
            << "["
            << std::fixed
            << std::setprecision(3) // after the radix point
            << time
            << "]  "
            << "\033[m";

        out << std::setfill(' ');

        out << "\033[" << 1 << "m"
            << std::left
            << std::setw(7)
            << ToString(type) << " "
            << "\033[m";

        std::stringstream ss;
        ss << file << ":" << line;
        std::string file_and_line = ss.str();
        if (file_and_line.size() > 25)
        {
            const auto count = file_and_line.size() - 25;
            file_and_line = file_and_line.substr(count);
        }

        out << "\033[" << 3 << "m"
            << std::right
            << std::setw(25)
            << file_and_line
            << "  "
            << "\033[m";

        if (type == LogEvent::Error)
        {
            out << "\033[" << 1 << "m";
            out << "\033[" << 91 << "m";
        }
        else if (type == LogEvent::Warning)
        {
            out << "\033[" << 1 << "m";
            out << "\033[" << 93 << "m";
        }
        else if (type == LogEvent::Info)
        {
            out << "\033[" << 97 << "m";
        }
        out << msg << "\033[m";
        out << "\n";

        out.copyfmt(old_state);
        return;
    }
#endif

    std::stringstream ss;
    ss << "[" << std::fixed << std::setprecision(3) << time << "] "
       << ToString(type) << ": "
       << file << ":" << line << " \"" << msg << "\"\n";
    Write(type, ss.str().c_str());
}

void OStreamLogger::Write(LogEvent type, const char* msg)
{
    (*m_out) << msg;
}

void OStreamLogger::Flush()
{
    (*m_out).flush();
}

Logger* SetGlobalLog(Logger* log)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    auto ret = globalLogger;
    globalLogger = log;
    return ret;
}

GlobalLogger GetGlobalLog()
{
    globalLoggerMutex.lock();

    return { globalLogger, &globalLoggerMutex };
}

Logger* GetThreadLog()
{
    return threadLogger;
}

Logger* SetThreadLog(Logger* log)
{
    auto* ret = threadLogger;
    threadLogger = log;
    return ret;
}

void FlushThreadLog()
{
    auto* ret = threadLogger;
    if (!ret)
        return;
    ret->Flush();
}

void FlushGlobalLog()
{
    auto logger = GetGlobalLog();
    if (logger)
        logger->Flush();
}

bool IsDebugLogEnabled()
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    return isGlobalDebugLogEnabled;
}

bool IsLogEventEnabled(LogEvent type)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    if (type == LogEvent::Verbose)
        return isGlobalVerboseLogEnabled;
    else if (type == LogEvent::Debug)
        return isGlobalDebugLogEnabled;
    else if (type == LogEvent::Warning)
        return isGlobalWarnLogEnabled;
    else if (type == LogEvent::Error)
        return isGlobalErrorLogEnabled;
    else if (type == LogEvent::Info)
        return isGlobalInfoLogEnabled;
    else BUG("No such log event.");
    return false;
}

void EnableLogEvent(LogEvent type, bool on_off)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    if (type == LogEvent::Verbose)
        isGlobalVerboseLogEnabled = on_off;
    else if (type == LogEvent::Debug)
        isGlobalDebugLogEnabled = on_off;
    else if (type == LogEvent::Warning)
        isGlobalWarnLogEnabled = on_off;
    else if (type == LogEvent::Error)
        isGlobalErrorLogEnabled = on_off;
    else if (type == LogEvent::Info)
        isGlobalInfoLogEnabled = on_off;
    else BUG("No such log event.");
}

void EnableDebugLog(bool on_off)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    isGlobalDebugLogEnabled = on_off;
}

void WriteLogMessage(LogEvent type, const char* file, int line, const std::string& message)
{
    // strip the path from the file name.
    const char* p = file;
    while (*file) {
#if defined(WINDOWS_OS)
        if (*file == '\\')
            p = file + 1;
#else
        if (*file == '/')
            p = file + 1;
#endif
        ++file;
    }
    file = p;

    using steady_clock = std::chrono::steady_clock;
    // magic static is thread safe.
    static const auto first_event_time = steady_clock::now();
    const auto current_event_time = steady_clock::now();
    const auto elapsed = current_event_time - first_event_time;
    const double seconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() / 1000.0;

    std::string formatted;

    if (auto* thread_log = GetThreadLog())
    {
        if (thread_log->TestWriteMask(Logger::WriteType::WriteRaw))
            thread_log->Write(type, file, line, message.c_str(), seconds);
        if (thread_log->TestWriteMask(Logger::WriteType::WriteFormatted))
        {
            formatted = FormatString("[%1] %2: %3:%4 \"%5\"\n", seconds, ToString(type), file, line, message);
            thread_log->Write(type, formatted.c_str());
        }
        return;
    }

    // acquire access to the global logger
    auto global_log = GetGlobalLog();
    if (!global_log)
        return;

    if (global_log->TestWriteMask(Logger::WriteType::WriteRaw))
        global_log->Write(type, file, line, message.c_str(), seconds);
    if (global_log->TestWriteMask(Logger::WriteType::WriteFormatted))
    {
        formatted = FormatString("[%1] %2: %3:%4 \"%5\"\n", seconds, ToString(type), file, line, message);
        global_log->Write(type, formatted.c_str());
    }
}

} // base

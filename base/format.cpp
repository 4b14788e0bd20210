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

#include <cstdio>
#include <cstring>
#include <locale>
#include <codecvt>
#include <iomanip>

#include "base/format.h"

#if defined(__MSVC__)
#  pragma warning(push)
#  pragma warning(disable: 4996) // deprecated use of wstring_convert
#endif

namespace base {
namespace detail {
#if defined(BASE_FORMAT_SUPPORT_GLM)
std::string ToString(const glm::vec2& v)
{
    char buff[128];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%.2f %.2f]", v[0], v[1]);
    return buff;
}
std::string ToString(const glm::dvec2& v)
{
    char buff[128];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%.3f %.3f]", v[0], v[1]);
    return buff;
}
std::string ToString(const glm::ivec2& v)
{
    char buff[128];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%d %d]", v[0], v[1]);
    return buff;
}
#endif // BASE_FORMAT_SUPPORT_GLM

std::string ToString(const std::wstring& s)
{
    return ToUtf8(s);
}

} // detail
} // namespace

namespace base
{
std::string TrimString(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos)
        return "";
    const auto last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::string ToUtf8(const std::wstring& str)
{
    using convert_type = std::codecvt_utf8<wchar_t>;
    std::wstring_convert<convert_type, wchar_t> converter;
    return converter.to_bytes(str);
}

std::wstring FromUtf8(const std::string& str)
{
    using convert_type = std::codecvt_utf8<wchar_t>;
    std::wstring_convert<convert_type, wchar_t> converter;
    return converter.from_bytes(str);
}

std::string ToChars(float value)
{
    // c++17 has to_chars in <charconv> but GCC (stdlib) doesn't
    // yet support float conversion.
    std::stringstream ss;
    std::string ret;
    ss.imbue(std::locale("C"));
    ss << std::fixed << std::setprecision(2) << value;
    ss >> ret;
    return ret;
}

std::string ToChars(double value)
{
    std::stringstream ss;
    std::string ret;
    ss.imbue(std::locale("C"));
    ss << std::fixed << std::setprecision(3) << value;
    ss >> ret;
    return ret;
}

} // namespace

#if defined(__MSVC__)
#  pragma warning(pop) // deprecated use of wstring_convert
#endif

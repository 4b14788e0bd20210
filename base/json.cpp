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

#include "warnpush.h"
#  include <nlohmann/json.hpp>
#include "warnpop.h"

#include <fstream>
#include <iterator>

#include "base/json.h"

namespace base {
namespace detail {

void JsonWriteJson(nlohmann::json& json, const char* name, nlohmann::json&& object)
{ json[name] = std::move(object); }

bool IsObject(const nlohmann::json& json)
{ return json.is_object(); }

bool IsArray(const nlohmann::json& json)
{ return json.is_array(); }

bool HasObject(const nlohmann::json& json, const char* name)
{ return json.contains(name) && json[name].is_object(); }

bool HasValue(const nlohmann::json& json, const char* name)
{ return json.contains(name); }

std::unique_ptr<nlohmann::json> NewJson()
{ return std::make_unique<nlohmann::json>(nlohmann::json::object()); }

} // namespace

JsonPtr::~JsonPtr() = default;
JsonPtr::JsonPtr(std::unique_ptr<nlohmann::json> j) : json(std::move(j))
{}

JsonPtr NewJsonPtr()
{ return JsonPtr(detail::NewJson()); }

JsonRef GetJsonObj(const nlohmann::json& json, const char* name)
{
    JsonRef ret;
    ret.json = &json[name];
    return ret;
}

bool JsonReadSafe(const nlohmann::json& object, const char* name, double* out)
{
    if (!object.contains(name))
        return false;
    return JsonReadSafe(object[name], out);
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, float* out)
{
    if (!object.contains(name))
        return false;
    return JsonReadSafe(object[name], out);
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, int* out)
{
    if (!object.contains(name))
        return false;
    return JsonReadSafe(object[name], out);
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, unsigned* out)
{
    if (!object.contains(name))
        return false;
    return JsonReadSafe(object[name], out);
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, bool* out)
{
    if (!object.contains(name))
        return false;
    return JsonReadSafe(object[name], out);
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, std::string* out)
{
    if  (!object.contains(name))
        return false;
    return JsonReadSafe(object[name], out);
}

// integers are accepted for floating point values since
// hand written configuration files often omit the radix point.
bool JsonReadSafe(const nlohmann::json& value, double* out)
{
    if (!value.is_number())
        return false;
    *out = value.get<double>();
    return true;
}
bool JsonReadSafe(const nlohmann::json& value, float* out)
{
    if (!value.is_number())
        return false;
    *out = value.get<float>();
    return true;
}
bool JsonReadSafe(const nlohmann::json& value, int* out)
{
    if (!value.is_number_integer())
        return false;
    *out = value.get<int>();
    return true;
}
bool JsonReadSafe(const nlohmann::json& value, unsigned* out)
{
    if (!value.is_number_unsigned())
        return false;
    *out = value.get<unsigned>();
    return true;
}
bool JsonReadSafe(const nlohmann::json& value, std::string* out)
{
    if (!value.is_string())
        return false;
    *out = value.get<std::string>();
    return true;
}
bool JsonReadSafe(const nlohmann::json& value, bool *out)
{
    if (!value.is_boolean())
        return false;
    *out = value.get<bool>();
    return true;
}

void JsonWrite(nlohmann::json& object, const char* name, int value)
{ object[name] = value; }

void JsonWrite(nlohmann::json& object, const char* name, unsigned value)
{ object[name] = value; }

void JsonWrite(nlohmann::json& object, const char* name, double value)
{ object[name] = value; }

void JsonWrite(nlohmann::json& object, const char* name, float value)
{ object[name] = value; }

void JsonWrite(nlohmann::json& object, const char* name, const std::string& value)
{ object[name] = value; }

void JsonWrite(nlohmann::json& object, const char* name, bool value)
{ object[name] = value; }

void JsonWrite(nlohmann::json& object, const char* name, const char* str)
{ object[name] = str; }

void JsonAppend(nlohmann::json& array, nlohmann::json&& value)
{ array.push_back(std::move(value)); }

bool JsonForEach(const nlohmann::json& array, const std::function<bool (const nlohmann::json&)>& visit)
{
    if (!array.is_array())
        return false;
    for (const auto& item : array)
    {
        if (!visit(item))
            return false;
    }
    return true;
}

template<typename It>
std::tuple<bool, nlohmann::json, std::string> JsonParse(It beg, It end)
{
    // if exceptions are suppressed there are no diagnostics
    // so use this wrapper.
    std::string msg;
    nlohmann::json json;
    bool ok = true;

    try
    { json = nlohmann::json::parse(beg, end); }
    catch (const nlohmann::detail::parse_error& err)
    {
        msg = err.what();
        ok = false;
    }
    return std::make_tuple(ok, std::move(json), std::move(msg));
}

std::tuple<bool, nlohmann::json, std::string> JsonParse(const char* beg, const char* end)
{ return JsonParse<const char*>(beg, end); }
std::tuple<bool, nlohmann::json, std::string> JsonParse(const std::string& json)
{ return JsonParse(json.begin(), json.end()); }
std::tuple<bool, nlohmann::json, std::string> JsonParseFile(const std::string& filename)
{
    std::ifstream stream(filename, std::ios::in);
    if (!stream.is_open())
        return std::make_tuple(false, nlohmann::json{}, "failed to open: " + filename);
    const std::string contents(std::istreambuf_iterator<char>(stream), {});
    return JsonParse(contents);
}

std::tuple<bool, std::string> JsonWriteFile(const nlohmann::json& json, const std::string& filename)
{
    std::ofstream out(filename, std::ios::out | std::ios::trunc);
    if (!out.is_open())
        return std::make_tuple(false, "failed to open: " + filename);
    const auto& str = json.dump(2);
    if (str.size())
    {
        out.write(str.c_str(), str.size());
        if (out.fail())
            return std::make_tuple(false, std::string("JSON write failed."));
    }
    return std::make_tuple(true, std::string(""));
}

} // namespace

// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "settings/SettingsLoader.h"

#include <fstream>
#include <iterator>
#include <numeric>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <rapidjson/error/en.h> //Loading JSON documents to get settings from them.
#include <rapidjson/memorystream.h>
#include <spdlog/spdlog.h>

#include "utils/OptimizerError.h"

namespace travel
{

namespace
{

bool jsonValue2Str(const rapidjson::Value& value, std::string& value_string)
{
    if (value.IsString())
    {
        value_string = value.GetString();
    }
    else if (value.IsTrue())
    {
        value_string = "true";
    }
    else if (value.IsFalse())
    {
        value_string = "false";
    }
    else if (value.IsInt64())
    {
        value_string = std::to_string(value.GetInt64());
    }
    else if (value.IsNumber())
    {
        value_string = fmt::format("{}", value.GetDouble());
    }
    else if (value.IsArray())
    {
        if (value.Empty())
        {
            value_string = "[]";
            return true;
        }
        std::string temp;
        if (! jsonValue2Str(value[0], temp))
        {
            return false;
        }
        bool convertible = true;
        value_string = std::string("[")
                     + std::accumulate(
                           std::next(value.Begin()),
                           value.End(),
                           temp,
                           [&temp, &convertible](std::string converted, const rapidjson::Value& next)
                           {
                               convertible = jsonValue2Str(next, temp) && convertible;
                               return std::move(converted) + "," + temp;
                           })
                     + std::string("]");
        return convertible;
    }
    else
    {
        return false;
    }
    return true;
}

Settings loadDocument(const rapidjson::Document& json_document)
{
    if (json_document.HasParseError())
    {
        throw ConfigError(fmt::format("Error parsing JSON (offset {}): {}", json_document.GetErrorOffset(), GetParseError_En(json_document.GetParseError())));
    }
    if (! json_document.IsObject())
    {
        throw ConfigError("The configuration must be a JSON object");
    }
    Settings settings;
    SettingsLoader::loadJSONSettings(json_document, settings);
    return settings;
}

} // namespace

Settings SettingsLoader::loadJSON(const std::filesystem::path& json_filename)
{
    std::ifstream file(json_filename, std::ios::binary);
    if (! file)
    {
        throw ConfigError(fmt::format("Couldn't open JSON file: {}", json_filename.generic_string()));
    }

    std::vector<char> read_buffer(std::istreambuf_iterator<char>(file), {});
    rapidjson::MemoryStream memory_stream(read_buffer.data(), read_buffer.size());

    rapidjson::Document json_document;
    json_document.ParseStream(memory_stream);
    Settings settings = loadDocument(json_document);
    spdlog::debug("Loaded {} settings from {}", settings.size(), json_filename.generic_string());
    return settings;
}

Settings SettingsLoader::loadJSONString(std::string_view json)
{
    rapidjson::MemoryStream memory_stream(json.data(), json.size());
    rapidjson::Document json_document;
    json_document.ParseStream(memory_stream);
    return loadDocument(json_document);
}

void SettingsLoader::loadJSONSettings(const rapidjson::Value& element, Settings& settings)
{
    for (rapidjson::Value::ConstMemberIterator setting = element.MemberBegin(); setting != element.MemberEnd(); setting++)
    {
        const std::string name = setting->name.GetString();
        std::string value_string;
        if (! jsonValue2Str(setting->value, value_string))
        {
            throw ConfigError(name, "unsupported value type");
        }
        settings.add(name, value_string);
    }
}

} // namespace travel

// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "settings/Settings.h"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <sstream> // ostringstream
#include <string> //Parsing strings (stod, stoul).
#include <vector>

#include <fmt/format.h>
#include <range/v3/action/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>

#include "settings/types/Duration.h" //For duration and time settings.
#include "utils/OptimizerError.h"
#include "utils/string.h"

namespace travel
{

void Settings::add(const std::string& key, const std::string& value)
{
    settings_.insert_or_assign(key, value);
}

template<>
std::string Settings::get<std::string>(const std::string& key) const
{
    const auto setting = settings_.find(key);
    if (setting == settings_.end())
    {
        throw ConfigError(key, "no value given");
    }
    return setting->second;
}

template<>
double Settings::get<double>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    char* end = nullptr;
    const double result = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size())
    {
        throw ConfigError(key, fmt::format("'{}' is not a number", value));
    }
    return result;
}

template<>
size_t Settings::get<size_t>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    size_t result = 0;
    const auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (error != std::errc() || end != value.data() + value.size())
    {
        throw ConfigError(key, fmt::format("'{}' is not a non-negative whole number", value));
    }
    return result;
}

template<>
int Settings::get<int>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    int result = 0;
    const auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (error != std::errc() || end != value.data() + value.size())
    {
        throw ConfigError(key, fmt::format("'{}' is not a whole number", value));
    }
    return result;
}

template<>
bool Settings::get<bool>(const std::string& key) const
{
    const std::string& value = get<std::string>(key);
    if (value == "on" || value == "yes" || value == "true" || value == "True")
    {
        return true;
    }
    const int num = atoi(value.c_str());
    return num != 0;
}

template<>
Duration Settings::get<Duration>(const std::string& key) const
{
    return Duration(get<double>(key));
}

template<>
std::filesystem::path Settings::get<std::filesystem::path>(const std::string& key) const
{
    return std::filesystem::path(get<std::string>(key));
}

template<>
std::vector<std::string> Settings::get<std::vector<std::string>>(const std::string& key) const
{
    const std::string value_string = get<std::string>(key);

    // A list is stored as "[a,b,c]". The brackets are optional.
    std::string_view elements = trim(value_string);
    if (elements.starts_with('['))
    {
        elements.remove_prefix(1);
    }
    if (elements.ends_with(']'))
    {
        elements.remove_suffix(1);
    }

    std::vector<std::string> result;
    while (! trim(elements).empty())
    {
        const size_t comma = elements.find(',');
        std::string_view element = trim(elements.substr(0, comma));
        if (element.size() >= 2 && element.front() == '"' && element.back() == '"')
        {
            element = element.substr(1, element.size() - 2);
        }
        if (! element.empty())
        {
            result.emplace_back(element);
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        elements.remove_prefix(comma + 1);
    }
    return result;
}

std::string Settings::getAllSettingsString() const
{
    std::vector<std::string> keys = settings_ | ranges::views::keys | ranges::to_vector;
    keys |= ranges::actions::sort;

    std::ostringstream sstream;
    for (const std::string& key : keys)
    {
        sstream << " -s " << key << "=\"" << settings_.at(key) << "\"";
    }
    return sstream.str();
}

bool Settings::has(const std::string& key) const
{
    return settings_.contains(key);
}

} // namespace travel

// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_SETTINGS_LOADER_H
#define SETTINGS_SETTINGS_LOADER_H

#include <filesystem>
#include <string_view>

#include <rapidjson/document.h>

#include "settings/Settings.h"

namespace travel
{

/*!
 * \brief Reads settings from a JSON document with a flat object of key/value pairs.
 *
 * Values are serialised to strings: numbers as they'd be written in JSON, booleans as "true"/"false" and arrays as
 * "[a,b,c]".
 */
class SettingsLoader
{
public:
    /*!
     * Load a JSON file.
     * \throws ConfigError if the file can't be read, isn't valid JSON or isn't a JSON object.
     */
    static Settings loadJSON(const std::filesystem::path& json_filename);

    /*!
     * Load settings from JSON text.
     * \throws ConfigError if the text isn't valid JSON or isn't a JSON object.
     */
    static Settings loadJSONString(std::string_view json);

    /*!
     * Add all members of a JSON object to a settings container.
     */
    static void loadJSONSettings(const rapidjson::Value& element, Settings& settings);
};

} // namespace travel

#endif // SETTINGS_SETTINGS_LOADER_H

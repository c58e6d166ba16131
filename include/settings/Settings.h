// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_SETTINGS_H
#define SETTINGS_SETTINGS_H

#include <string>
#include <unordered_map>

namespace travel
{

/*!
 * \brief Container for a set of settings.
 *
 * Settings are stored in serialised form, as strings, and converted to the type the caller asks for.
 *
 * Before the settings can be returned, the settings have to be added first
 * using the add() function.
 */
class Settings
{
public:
    /*!
     * \brief Adds a new setting, or replaces its value.
     * \param key The name by which the setting is identified.
     * \param value The value of the setting. The value is always added and
     * stored in serialised form as a string.
     */
    void add(const std::string& key, const std::string& value);

    /*!
     * \brief Get the value of a setting.
     * \param key The key of the setting to get.
     * \return The setting's value, cast to the desired type.
     * \throws ConfigError if the setting has no value, or its value can't be converted to the desired type.
     */
    template<typename A>
    A get(const std::string& key) const;

    /*!
     * \brief Get the value of a setting, or a default if it has no value.
     * \throws ConfigError if the setting has a value that can't be converted to the desired type.
     */
    template<typename A>
    A get(const std::string& key, const A& default_value) const
    {
        return has(key) ? get<A>(key) : default_value;
    }

    /*!
     * \brief Get a string containing all settings in this container, for logging.
     */
    std::string getAllSettingsString() const;

    /*!
     * \brief Indicate whether this settings instance has an entry for the
     * specified setting.
     */
    bool has(const std::string& key) const;

    size_t size() const
    {
        return settings_.size();
    }

private:
    /*!
     * \brief A dictionary to map the setting keys to the actual setting values.
     */
    std::unordered_map<std::string, std::string> settings_;
};

} // namespace travel

#endif // SETTINGS_SETTINGS_H

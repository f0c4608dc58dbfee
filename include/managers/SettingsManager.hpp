/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ColonySim {

class JsonValue;

/**
 * @brief Thread-safe simulation settings keyed by category and key
 *
 * Nested JSON objects flatten into dotted categories, so
 *   { "location": { "forest": { "regrowth_interval": 15 } } }
 * is read back with get<int>("location.forest", "regrowth_interval", 15).
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/colony_settings.json");
 *   int interval = settings.get<int>("scheduler", "tick_interval_ms", 5000);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Callback function type for change notifications
     * @param category The category that changed
     * @param key The setting key that changed
     * @param newValue The new value of the setting
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merges settings from a JSON file over the current ones
     * @return false if the file can't be read or its root is not an object;
     * existing settings are left untouched in that case
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile but reads from an in-memory document
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Gets a typed setting value with optional default
     *
     * An int setting may be read as float and a whole float as int; any
     * other type mismatch yields defaultValue. Thread-safe for concurrent
     * reads.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Registers a callback for setting changes
     * @param category Category to watch (empty string watches all categories)
     * @return Callback ID that can be used to unregister
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    // Multiple concurrent reads or a single write
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    // Flattens one JSON object into settings; nested objects extend the
    // category with ".<name>"
    static void collectSettings(const std::string& category, const JsonValue& object,
                                std::unordered_map<std::string, CategorySettings>& out,
                                size_t& skipped);

    bool applyDocument(const JsonValue& root, const std::string& source);

    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, int>) {
        if (const int* value = std::get_if<int>(&stored)) {
            return *value;
        }
        if (const float* value = std::get_if<float>(&stored)) {
            const int whole = static_cast<int>(*value);
            return static_cast<float>(whole) == *value ? whole : defaultValue;
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, float>) {
        if (const float* value = std::get_if<float>(&stored)) {
            return *value;
        }
        if (const int* value = std::get_if<int>(&stored)) {
            return static_cast<float>(*value);
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, bool>) {
        const bool* value = std::get_if<bool>(&stored);
        return value ? *value : defaultValue;
    } else if constexpr (std::is_same_v<T, std::string>) {
        const std::string* value = std::get_if<std::string>(&stored);
        return value ? *value : defaultValue;
    } else {
        // Unsupported type, return default
        return defaultValue;
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Notify listeners outside the lock to prevent deadlock
    notifyListeners(category, key, settingValue);

    return true;
}

} // namespace ColonySim

#endif // SETTINGS_MANAGER_HPP

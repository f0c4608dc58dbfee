/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace ColonySim {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return applyDocument(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings document - " + reader.getLastError());
        return false;
    }
    return applyDocument(reader.getRoot(), "<memory>");
}

void SettingsManager::collectSettings(const std::string& category, const JsonValue& object,
                                      std::unordered_map<std::string, CategorySettings>& out,
                                      size_t& skipped) {
    for (const auto& [key, value] : object.asObject()) {
        if (value.isObject()) {
            const std::string nested = category.empty() ? key : category + "." + key;
            collectSettings(nested, value, out, skipped);
            continue;
        }

        if (category.empty()) {
            SETTINGS_WARNING("Top-level value '" + key + "' has no category, skipping");
            ++skipped;
            continue;
        }

        if (value.isBool()) {
            out[category][key] = value.asBool();
        } else if (value.isNumber()) {
            const double numValue = value.asNumber();
            // Whole numbers that fit become int, everything else float
            if (std::trunc(numValue) == numValue &&
                numValue >= static_cast<double>(std::numeric_limits<int>::min()) &&
                numValue <= static_cast<double>(std::numeric_limits<int>::max())) {
                out[category][key] = static_cast<int>(numValue);
            } else {
                out[category][key] = static_cast<float>(numValue);
            }
        } else if (value.isString()) {
            out[category][key] = value.asString();
        } else {
            SETTINGS_WARNING("Unsupported value type for setting '" + category + "." + key + "', skipping");
            ++skipped;
        }
    }
}

bool SettingsManager::applyDocument(const JsonValue& root, const std::string& source) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    // Parse into a scratch map so a bad document never half-applies
    std::unordered_map<std::string, CategorySettings> loaded;
    size_t skipped = 0;
    collectSettings("", root, loaded, skipped);

    size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        for (auto& [category, settings] : loaded) {
            for (auto& [key, value] : settings) {
                m_settings[category][key] = std::move(value);
                ++count;
            }
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {} ({} skipped)", count, source, skipped));
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    return categoryIt->second.contains(key);
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }

    // Drop the category once it is empty
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    std::erase_if(m_listeners, [callbackId](const ListenerInfo& info) {
        return info.id == callbackId;
    });
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    // Snapshot the matching callbacks so a listener may (un)register others
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                callbacks.push_back(listener.callback);
            }
        }
    }

    for (const auto& callback : callbacks) {
        callback(category, key, newValue);
    }
}

} // namespace ColonySim

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace SneakEngine {

namespace {
struct DefaultSetting {
    const char* category;
    const char* key;
    SettingsManager::SettingValue value;
};

const std::vector<DefaultSetting>& engineDefaults() {
    static const std::vector<DefaultSetting> s_defaults = {
        {"vision", "default_fov", 90},
        {"vision", "step_degrees", 5},
        {"game", "tile_size", 32},
        {"game", "start_level", std::string("res/levels/level1.json")},
    };
    return s_defaults;
}
} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonObject* root = reader.getRoot().tryAsObject();
    if (root == nullptr) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    for (const auto& [categoryName, categoryValue] : *root) {
        const JsonObject* category = categoryValue.tryAsObject();
        if (category == nullptr) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *category) {
            if (value.isBool()) {
                store(categoryName, key, value.asBool());
            } else if (value.isInteger() && std::fabs(value.asNumber()) <= 2147483647.0) {
                store(categoryName, key, value.asInt());
            } else if (value.isNumber()) {
                store(categoryName, key, static_cast<float>(value.asNumber()));
            } else if (value.isString()) {
                store(categoryName, key, value.asString());
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
            }
        }
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject root;
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, values] : m_settings) {
            JsonObject category;
            for (const auto& [key, value] : values) {
                category[key] = std::visit([](const auto& v) { return JsonValue(v); }, value);
            }
            root[categoryName] = JsonValue(std::move(category));
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << JsonValue(std::move(root)).toPrettyString();
    if (!file) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

void SettingsManager::applyDefaults() {
    for (const auto& def : engineDefaults()) {
        if (!has(def.category, def.key)) {
            store(def.category, def.key, def.value);
        }
    }
}

void SettingsManager::store(const std::string& category, const std::string& key, SettingValue value) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(value);
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.count(key) != 0;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
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
    m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                     [callbackId](const ListenerInfo& info) {
                                         return info.id == callbackId;
                                     }),
                      m_listeners.end());
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, values] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key,
                                      const SettingValue& newValue) {
    std::vector<ChangeCallback> toCall;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                toCall.push_back(listener.callback);
            }
        }
    }
    // Called outside the lock so a listener may unregister itself
    for (const auto& callback : toCall) {
        callback(category, key, newValue);
    }
}

} // namespace SneakEngine

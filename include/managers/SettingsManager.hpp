/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace SneakEngine {

/**
 * @brief Engine-wide tunables grouped by category.
 *
 * Keys read by the engine:
 *   vision.default_fov   (int, 90)  field of view for guards without an explicit "fov"
 *   vision.step_degrees  (int, 5)   vision ray sweep increment
 *   game.tile_size       (int, 32)  informational; the grid size is fixed at compile time
 *   game.start_level     (string)   level file the runner loads when none is given
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int fov = settings.get<int>("vision", "default_fov", 90);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merges a JSON file of {"category": {"key": value}} into the current settings.
     * @return false if the file is unreadable or not an object of objects
     */
    bool loadFromFile(const std::string& filepath);

    bool saveToFile(const std::string& filepath) const;

    // Seeds every key listed above that is not already set
    void applyDefaults();

    // Returns defaultValue when the key is absent or holds another type
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    // Notifies listeners after the value is stored
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    // An empty category watches every category
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

private:
    SettingsManager() = default;

    void store(const std::string& category, const std::string& key, SettingValue value);
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    // Ordered so saved files are stable
    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId{1};
};

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

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&keyIt->second)) {
            return *value;
        }
        // Whole numbers are stored as int but may be read as float
        if constexpr (std::is_same_v<T, float>) {
            if (const int* asInt = std::get_if<int>(&keyIt->second)) {
                return static_cast<float>(*asInt);
            }
        }
    }
    return defaultValue;
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

    store(category, key, settingValue);
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace SneakEngine

#endif // SETTINGS_MANAGER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace VanguardEngine {

/**
 * @brief Immutable snapshot of the tunables the simulation reads
 *
 * Built once from SettingsManager at startup and shared by const reference.
 * Defaults apply to any key missing from the settings file.
 */
struct ServerSettings {
    // server
    float tickRate{30.0f};
    uint32_t demoTicks{0};
    std::string playerName{"Host"};
    std::string gameDataPath{"res/data/game_data.json"};
    bool debugBuild{false};

    // connection
    int maxConnectedPlayers{8};
    size_t maxPayloadBytes{1024};
    int maxReconnectAttempts{2};
    float firstReconnectDelaySeconds{1.0f};
    float reconnectIntervalSeconds{5.0f};
    float connectTimeoutSeconds{10.0f};
    bool reconnectionEnabled{true};

    // bus
    size_t maxDeferredQueue{8192};

    // ai
    uint32_t aiSeed{1337};
};

/**
 * @brief Thread-safe settings store with category organization
 *
 * Provides type-safe access to settings with JSON persistence, change
 * notifications and default values. Owned by ServerEngine.
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/settings.json");
 *   int players = settings.get<int>("connection", "max_connected_players", 8);
 *   settings.set("server", "tick_rate", 60);
 *   ServerSettings snapshot = settings.buildServerSettings();
 */
class SettingsManager {
public:
    SettingsManager() = default;
    ~SettingsManager() = default;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Loads settings from a JSON file of category objects
     * @return true if loading successful, false otherwise
     *
     * Existing values not present in the file are kept.
     */
    bool loadFromFile(const std::string& filepath);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value with a default
     *
     * int and float are interchangeable on read, since a JSON file cannot
     * tell "5" apart from "5.0". Other type mismatches return the default.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return true if set successful, false for unsupported types
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

    /**
     * @brief Snapshot of the simulation tunables, defaults filled in
     */
    ServerSettings buildServerSettings() const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);
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

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, int>) {
        if (const auto* v = std::get_if<int>(&stored)) return *v;
        if (const auto* v = std::get_if<float>(&stored)) return static_cast<int>(*v);
    } else if constexpr (std::is_same_v<T, float>) {
        if (const auto* v = std::get_if<float>(&stored)) return *v;
        if (const auto* v = std::get_if<int>(&stored)) return static_cast<float>(*v);
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto* v = std::get_if<bool>(&stored)) return *v;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto* v = std::get_if<std::string>(&stored)) return *v;
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

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Listeners run outside the settings lock so they may read back
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace VanguardEngine

#endif // SETTINGS_MANAGER_HPP

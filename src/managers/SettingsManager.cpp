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

namespace VanguardEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    size_t loaded = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

        for (const auto& [categoryName, categoryValue] : root.asObject()) {
            const JsonObject* categoryObj = categoryValue.tryAsObject();
            if (!categoryObj) {
                SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
                continue;
            }

            for (const auto& [key, value] : *categoryObj) {
                SettingValue settingValue;
                if (value.isBool()) {
                    settingValue = value.asBool();
                } else if (value.isNumber()) {
                    double numValue = value.asNumber();
                    if (std::floor(numValue) == numValue && std::abs(numValue) < 2147483647.0) {
                        settingValue = static_cast<int>(numValue);
                    } else {
                        settingValue = static_cast<float>(numValue);
                    }
                } else if (value.isString()) {
                    settingValue = value.asString();
                } else {
                    SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                    continue;
                }
                m_settings[categoryName][key] = std::move(settingValue);
                ++loaded;
            }
        }
    }

    SETTINGS_INFO("Loaded " + std::to_string(loaded) + " settings from file: " + filepath);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject rootObj;
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonObject categoryObj;
            for (const auto& [key, value] : categorySettings) {
                categoryObj[key] = std::visit([](auto&& arg) -> JsonValue {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, float>) {
                        return JsonValue(static_cast<double>(arg));
                    } else {
                        return JsonValue(arg);
                    }
                }, value);
            }
            rootObj[categoryName] = JsonValue(std::move(categoryObj));
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << JsonValue(std::move(rootObj)).toString() << '\n';
    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() &&
           categoryIt->second.find(key) != categoryIt->second.end();
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
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [callbackId](const ListenerInfo& info) { return info.id == callbackId; }),
        m_listeners.end());
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

ServerSettings SettingsManager::buildServerSettings() const {
    ServerSettings s;

    s.tickRate = get<float>("server", "tick_rate", s.tickRate);
    if (s.tickRate <= 0.0f) {
        SETTINGS_WARNING("server.tick_rate must be positive, using 30");
        s.tickRate = 30.0f;
    }
    s.demoTicks = static_cast<uint32_t>(std::max(0, get<int>("server", "demo_ticks", 0)));
    s.playerName = get<std::string>("server", "player_name", s.playerName);
    s.gameDataPath = get<std::string>("server", "game_data_path", s.gameDataPath);
#ifdef DEBUG
    s.debugBuild = true;
#endif

    s.maxConnectedPlayers = get<int>("connection", "max_connected_players", s.maxConnectedPlayers);
    s.maxPayloadBytes = static_cast<size_t>(
        std::max(0, get<int>("connection", "max_payload_bytes", static_cast<int>(s.maxPayloadBytes))));
    s.maxReconnectAttempts = std::max(0, get<int>("connection", "max_reconnect_attempts", s.maxReconnectAttempts));
    s.firstReconnectDelaySeconds = get<float>("connection", "first_reconnect_delay", s.firstReconnectDelaySeconds);
    s.reconnectIntervalSeconds = get<float>("connection", "reconnect_interval", s.reconnectIntervalSeconds);
    s.connectTimeoutSeconds = get<float>("connection", "connect_timeout", s.connectTimeoutSeconds);
    s.reconnectionEnabled = get<bool>("connection", "reconnection_enabled", s.reconnectionEnabled);

    s.maxDeferredQueue = static_cast<size_t>(
        std::max(1, get<int>("events", "max_deferred_queue", static_cast<int>(s.maxDeferredQueue))));

    s.aiSeed = static_cast<uint32_t>(get<int>("ai", "seed", static_cast<int>(s.aiSeed)));

    return s;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    std::vector<ChangeCallback> toNotify;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                toNotify.push_back(listener.callback);
            }
        }
    }
    for (const auto& callback : toNotify) {
        callback(category, key, newValue);
    }
}

} // namespace VanguardEngine

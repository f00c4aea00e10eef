/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "data/GameDataCatalog.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <stdexcept>

using VanguardEngine::JsonReader;
using VanguardEngine::JsonValue;

namespace {

std::string validateAction(const ActionDefinition& def) {
    if (def.id.empty()) {
        return "action id is empty";
    }
    if (def.durationSeconds < 0.0f || def.executeTimeSeconds < 0.0f || def.reuseTimeSeconds < 0.0f) {
        return "action '" + def.id + "' has a negative time";
    }
    if (def.executeTimeSeconds > def.durationSeconds) {
        return "action '" + def.id + "' executes after it ends";
    }
    if (def.range < 0.0f || def.radius < 0.0f || def.amount < 0) {
        return "action '" + def.id + "' has a negative range, radius or amount";
    }
    if (def.logic == ActionLogic::Buff && def.damageMultiplier < 0.0f) {
        return "buff '" + def.id + "' has a negative damage multiplier";
    }
    return {};
}

std::string validateClass(const CharacterClass& cls) {
    if (cls.id.empty()) {
        return "class id is empty";
    }
    if (cls.maxHitPoints <= 0) {
        return "class '" + cls.id + "' must have positive maxHitPoints";
    }
    if (cls.moveSpeed < 0.0f || cls.detectionRange < 0.0f) {
        return "class '" + cls.id + "' has a negative speed or detection range";
    }
    return {};
}

bool parseAction(const JsonValue& json, ActionDefinition& out, std::string& error) {
    if (!json.isObject()) {
        error = "action entry is not an object";
        return false;
    }
    out.id = json.getString("id", "");
    auto logic = actionLogicFromString(json.getString("logic", ""));
    if (!logic) {
        error = "action '" + out.id + "' has unknown logic '" + json.getString("logic", "") + "'";
        return false;
    }
    out.logic = *logic;
    out.durationSeconds = static_cast<float>(json.getNumber("duration", 0.0));
    out.executeTimeSeconds = static_cast<float>(json.getNumber("executeTime", 0.0));
    out.reuseTimeSeconds = static_cast<float>(json.getNumber("reuseTime", 0.0));
    out.range = static_cast<float>(json.getNumber("range", out.range));
    out.amount = json.getInt("amount", 0);
    out.radius = static_cast<float>(json.getNumber("radius", 0.0));
    out.damageMultiplier = static_cast<float>(json.getNumber("damageMultiplier", 1.0));
    out.friendly = json.getBool("friendly", out.logic == ActionLogic::Heal || out.logic == ActionLogic::Revive);
    out.friendlyFire = json.getBool("friendlyFire", false);
    out.interruptible = json.getBool("interruptible", true);
    out.animTrigger = json.getString("animTrigger", "");

    error = validateAction(out);
    return error.empty();
}

bool parseClass(const JsonValue& json, CharacterClass& out, std::string& error) {
    if (!json.isObject()) {
        error = "class entry is not an object";
        return false;
    }
    out.id = json.getString("id", "");
    out.maxHitPoints = json.getInt("maxHitPoints", out.maxHitPoints);
    out.moveSpeed = static_cast<float>(json.getNumber("moveSpeed", out.moveSpeed));
    out.detectionRange = static_cast<float>(json.getNumber("detectionRange", out.detectionRange));
    out.isNpc = json.getBool("isNpc", false);

    const JsonValue& skills = json["skills"];
    for (size_t i = 0; i < skills.size(); ++i) {
        auto skill = skills[i].tryAsString();
        if (!skill) {
            error = "class '" + out.id + "' has a non-string skill";
            return false;
        }
        out.skills.push_back(*skill);
    }

    error = validateClass(out);
    return error.empty();
}

} // namespace

bool GameDataCatalog::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CATALOG_ERROR("Failed to load game data: " + path + " - " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), path);
}

bool GameDataCatalog::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CATALOG_ERROR("Failed to parse game data: " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), "<string>");
}

bool GameDataCatalog::loadFromRoot(const JsonValue& root, const std::string& source) {
    if (!root.isObject()) {
        CATALOG_ERROR("Game data root is not an object: " + source);
        return false;
    }

    // Parse everything first so a bad file leaves the catalog untouched
    boost::container::flat_map<std::string, ActionDefinitionPtr> actions = m_actions;
    boost::container::flat_map<std::string, CharacterClassPtr> classes = m_classes;
    std::string error;

    const JsonValue& actionArray = root["actions"];
    for (size_t i = 0; i < actionArray.size(); ++i) {
        ActionDefinition def;
        if (!parseAction(actionArray[i], def, error)) {
            CATALOG_ERROR(source + ": " + error);
            return false;
        }
        if (actions.count(def.id) > 0) {
            CATALOG_ERROR(source + ": duplicate action '" + def.id + "'");
            return false;
        }
        std::string id = def.id;
        actions[id] = std::make_shared<const ActionDefinition>(std::move(def));
    }

    const JsonValue& classArray = root["classes"];
    for (size_t i = 0; i < classArray.size(); ++i) {
        CharacterClass cls;
        if (!parseClass(classArray[i], cls, error)) {
            CATALOG_ERROR(source + ": " + error);
            return false;
        }
        if (classes.count(cls.id) > 0) {
            CATALOG_ERROR(source + ": duplicate class '" + cls.id + "'");
            return false;
        }
        for (const auto& skill : cls.skills) {
            if (actions.count(skill) == 0) {
                CATALOG_ERROR(source + ": class '" + cls.id + "' references unknown action '" + skill + "'");
                return false;
            }
        }
        std::string id = cls.id;
        classes[id] = std::make_shared<const CharacterClass>(std::move(cls));
    }

    m_actions.swap(actions);
    m_classes.swap(classes);
    CATALOG_INFO("Loaded " + std::to_string(m_actions.size()) + " actions and " +
                 std::to_string(m_classes.size()) + " classes from " + source);
    return true;
}

void GameDataCatalog::addAction(ActionDefinition definition) {
    std::string error = validateAction(definition);
    if (!error.empty()) {
        CATALOG_ERROR(error);
        throw std::invalid_argument("Vanguard Engine - " + error);
    }
    if (m_actions.count(definition.id) > 0) {
        CATALOG_ERROR("Action already exists: " + definition.id);
        throw std::invalid_argument("Vanguard Engine - Action already exists: " + definition.id);
    }
    std::string id = definition.id;
    m_actions[id] = std::make_shared<const ActionDefinition>(std::move(definition));
}

void GameDataCatalog::addClass(CharacterClass characterClass) {
    std::string error = validateClass(characterClass);
    if (!error.empty()) {
        CATALOG_ERROR(error);
        throw std::invalid_argument("Vanguard Engine - " + error);
    }
    if (m_classes.count(characterClass.id) > 0) {
        CATALOG_ERROR("Class already exists: " + characterClass.id);
        throw std::invalid_argument("Vanguard Engine - Class already exists: " + characterClass.id);
    }
    for (const auto& skill : characterClass.skills) {
        if (!hasAction(skill)) {
            CATALOG_ERROR("Class '" + characterClass.id + "' references unknown action '" + skill + "'");
            throw std::invalid_argument("Vanguard Engine - Unknown skill: " + skill);
        }
    }
    std::string id = characterClass.id;
    m_classes[id] = std::make_shared<const CharacterClass>(std::move(characterClass));
}

ActionDefinitionPtr GameDataCatalog::getAction(const std::string& id) const {
    auto it = m_actions.find(id);
    return it != m_actions.end() ? it->second : nullptr;
}

CharacterClassPtr GameDataCatalog::getClass(const std::string& id) const {
    auto it = m_classes.find(id);
    return it != m_classes.end() ? it->second : nullptr;
}

std::vector<std::string> GameDataCatalog::getActionIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_actions.size());
    for (const auto& [id, _] : m_actions) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> GameDataCatalog::getClassIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_classes.size());
    for (const auto& [id, _] : m_classes) {
        ids.push_back(id);
    }
    return ids;
}

void GameDataCatalog::clear() {
    m_actions.clear();
    m_classes.clear();
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_DATA_CATALOG_HPP
#define GAME_DATA_CATALOG_HPP

/**
 * @file GameDataCatalog.hpp
 * @brief Immutable registry of action definitions and character classes
 *
 * Populated at startup from res/data/game_data.json:
 * @code
 * {
 *   "actions": [ { "id": "slash", "logic": "Melee", "duration": 0.5, ... } ],
 *   "classes": [ { "id": "warrior", "maxHitPoints": 150, "skills": ["slash"] } ]
 * }
 * @endcode
 * Lookups hand out shared_ptr<const T>, so entries outlive a clear().
 */

#include "data/ActionDefinition.hpp"
#include "data/CharacterClass.hpp"
#include <boost/container/flat_map.hpp>
#include <string>
#include <vector>

namespace VanguardEngine {
class JsonValue;
}

class GameDataCatalog {
public:
    GameDataCatalog() = default;

    GameDataCatalog(const GameDataCatalog&) = delete;
    GameDataCatalog& operator=(const GameDataCatalog&) = delete;

    /**
     * @brief Loads and validates a game data file
     * @return false if the file is missing, malformed or inconsistent; the
     * catalog is left unchanged in that case
     */
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& json);

    /**
     * @throws std::invalid_argument on duplicate or invalid definitions
     */
    void addAction(ActionDefinition definition);
    void addClass(CharacterClass characterClass);

    ActionDefinitionPtr getAction(const std::string& id) const;
    CharacterClassPtr getClass(const std::string& id) const;

    bool hasAction(const std::string& id) const { return m_actions.count(id) > 0; }
    bool hasClass(const std::string& id) const { return m_classes.count(id) > 0; }

    std::vector<std::string> getActionIds() const;
    std::vector<std::string> getClassIds() const;

    size_t getActionCount() const { return m_actions.size(); }
    size_t getClassCount() const { return m_classes.size(); }

    void clear();

private:
    boost::container::flat_map<std::string, ActionDefinitionPtr> m_actions;
    boost::container::flat_map<std::string, CharacterClassPtr> m_classes;

    bool loadFromRoot(const VanguardEngine::JsonValue& root, const std::string& source);
};

#endif // GAME_DATA_CATALOG_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_DATA_MANAGER_HPP
#define ENTITY_DATA_MANAGER_HPP

/**
 * @file EntityDataManager.hpp
 * @brief Central data authority for all entity data
 *
 * EntityDataManager is a pure DATA STORE, not a processor. It owns every
 * entity record; processing systems read and write through it:
 * - HealthManager mutates hit points and life state
 * - ActionManager resolves targets and applies effects
 * - AIManager reads positions and moves NPCs toward targets
 *
 * Synced fields (hit points, life state) report every committed change to
 * the replication sink so ReplicationManager can broadcast them.
 *
 * THREADING CONTRACT: tick thread only.
 */

#include "entities/EntityTypes.hpp"
#include "replication/ReplicationTypes.hpp"
#include "replication/SyncedValue.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct CharacterClass;

struct EntityRecord {
    EntityId id{INVALID_ENTITY_ID};
    EntityKind kind{EntityKind::NPC};
    std::string classId;
    std::string displayName;

    SyncedValue<int> hitPoints{0};
    SyncedValue<int> maxHitPoints{0};
    SyncedValue<LifeState> lifeState{LifeState::Alive};

    Vector2D position;
    Vector2D facing{1.0f, 0.0f};
    float moveSpeed{0.0f};
    float detectionRange{0.0f};
    bool stealthy{false};

    ClientId ownerClientId{INVALID_CLIENT_ID};

    bool isAlive() const { return lifeState.get() == LifeState::Alive; }
};

struct EntitySpawnParams {
    EntityKind kind{EntityKind::NPC};
    std::string classId;
    std::string displayName;
    int maxHitPoints{100};
    float moveSpeed{5.0f};
    float detectionRange{10.0f};
    Vector2D position;
    ClientId ownerClientId{INVALID_CLIENT_ID};

    // Fills stats from a character class; kind follows CharacterClass::isNpc
    static EntitySpawnParams fromClass(const CharacterClass& characterClass,
                                       const Vector2D& position);
};

class EntityDataManager {
public:
    using ReplicationSink = std::function<void(const ReplicationRecord& record)>;

    EntityDataManager() = default;
    ~EntityDataManager() = default;

    EntityDataManager(const EntityDataManager&) = delete;
    EntityDataManager& operator=(const EntityDataManager&) = delete;

    /**
     * @brief Creates an Alive entity at full health
     * @return New id, or INVALID_ENTITY_ID if params are invalid
     */
    EntityId createEntity(const EntitySpawnParams& params);

    bool destroyEntity(EntityId id);
    void clear();

    EntityRecord* getEntity(EntityId id);
    const EntityRecord* getEntity(EntityId id) const;

    bool exists(EntityId id) const { return m_entities.count(id) > 0; }
    bool isAlive(EntityId id) const;

    // Ascending id order
    std::vector<EntityId> getEntityIds() const;
    std::vector<EntityId> getEntityIds(EntityKind kind) const;

    EntityId findPlayerByClient(ClientId clientId) const;

    size_t size() const { return m_entities.size(); }

    void setPosition(EntityId id, const Vector2D& position);
    void setStealthy(EntityId id, bool stealthy);

    /**
     * @brief Receives every committed synced-field change
     */
    void setReplicationSink(ReplicationSink sink) { m_replicationSink = std::move(sink); }

    /**
     * @brief Emits the current value of every synced field (late joiners)
     */
    void emitFullSnapshot() const;

private:
    // Records are heap allocated so synced-field handlers can capture them
    boost::container::flat_map<EntityId, std::unique_ptr<EntityRecord>> m_entities;
    EntityId m_nextEntityId{1};
    ReplicationSink m_replicationSink;

    void bindReplication(EntityRecord& record);
    // Wire version is the local change sequence plus one
    void emit(EntityId id, ReplicatedField field, int32_t value, uint64_t sequence) const;
};

#endif // ENTITY_DATA_MANAGER_HPP

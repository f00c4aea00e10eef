/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityDataManager.hpp"
#include "core/Logger.hpp"
#include "data/CharacterClass.hpp"

EntitySpawnParams EntitySpawnParams::fromClass(const CharacterClass& characterClass,
                                               const Vector2D& position) {
    EntitySpawnParams params;
    params.kind = characterClass.isNpc ? EntityKind::NPC : EntityKind::Player;
    params.classId = characterClass.id;
    params.displayName = characterClass.id;
    params.maxHitPoints = characterClass.maxHitPoints;
    params.moveSpeed = characterClass.moveSpeed;
    params.detectionRange = characterClass.detectionRange;
    params.position = position;
    return params;
}

EntityId EntityDataManager::createEntity(const EntitySpawnParams& params) {
    if (params.maxHitPoints <= 0) {
        ENTITY_ERROR("Cannot create entity with non-positive max hit points: " + params.classId);
        return INVALID_ENTITY_ID;
    }

    auto record = std::make_unique<EntityRecord>();
    record->id = m_nextEntityId++;
    record->kind = params.kind;
    record->classId = params.classId;
    record->displayName = params.displayName.empty() ? params.classId : params.displayName;
    record->hitPoints = SyncedValue<int>(params.maxHitPoints);
    record->maxHitPoints = SyncedValue<int>(params.maxHitPoints);
    record->lifeState = SyncedValue<LifeState>(LifeState::Alive);
    record->position = params.position;
    record->moveSpeed = params.moveSpeed;
    record->detectionRange = params.detectionRange;
    record->ownerClientId = params.ownerClientId;

    EntityRecord& ref = *record;
    bindReplication(ref);
    EntityId id = ref.id;
    m_entities.emplace(id, std::move(record));

    // Initial values are not changes, but observers still need them
    emit(id, ReplicatedField::MaxHitPoints, ref.maxHitPoints.get(), 0);
    emit(id, ReplicatedField::HitPoints, ref.hitPoints.get(), 0);
    emit(id, ReplicatedField::LifeState, static_cast<int32_t>(ref.lifeState.get()), 0);

    ENTITY_DEBUG("Created " + std::string(toString(ref.kind)) + " " + std::to_string(id) +
                 " (" + ref.classId + ")");
    return id;
}

bool EntityDataManager::destroyEntity(EntityId id) {
    if (m_entities.erase(id) == 0) {
        ENTITY_WARN("destroyEntity: unknown entity " + std::to_string(id));
        return false;
    }
    ENTITY_DEBUG("Destroyed entity " + std::to_string(id));
    return true;
}

void EntityDataManager::clear() {
    m_entities.clear();
}

EntityRecord* EntityDataManager::getEntity(EntityId id) {
    auto it = m_entities.find(id);
    return it != m_entities.end() ? it->second.get() : nullptr;
}

const EntityRecord* EntityDataManager::getEntity(EntityId id) const {
    auto it = m_entities.find(id);
    return it != m_entities.end() ? it->second.get() : nullptr;
}

bool EntityDataManager::isAlive(EntityId id) const {
    const EntityRecord* record = getEntity(id);
    return record && record->isAlive();
}

std::vector<EntityId> EntityDataManager::getEntityIds() const {
    std::vector<EntityId> ids;
    ids.reserve(m_entities.size());
    for (const auto& [id, _] : m_entities) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<EntityId> EntityDataManager::getEntityIds(EntityKind kind) const {
    std::vector<EntityId> ids;
    for (const auto& [id, record] : m_entities) {
        if (record->kind == kind) {
            ids.push_back(id);
        }
    }
    return ids;
}

EntityId EntityDataManager::findPlayerByClient(ClientId clientId) const {
    for (const auto& [id, record] : m_entities) {
        if (record->kind == EntityKind::Player && record->ownerClientId == clientId) {
            return id;
        }
    }
    return INVALID_ENTITY_ID;
}

void EntityDataManager::setPosition(EntityId id, const Vector2D& position) {
    if (EntityRecord* record = getEntity(id)) {
        Vector2D delta = position - record->position;
        if (delta.lengthSquared() > 0.0f) {
            record->facing = delta.normalized();
        }
        record->position = position;
    }
}

void EntityDataManager::setStealthy(EntityId id, bool stealthy) {
    if (EntityRecord* record = getEntity(id)) {
        record->stealthy = stealthy;
    }
}

void EntityDataManager::emitFullSnapshot() const {
    for (const auto& [id, record] : m_entities) {
        emit(id, ReplicatedField::MaxHitPoints, record->maxHitPoints.get(),
             record->maxHitPoints.getSequence());
        emit(id, ReplicatedField::HitPoints, record->hitPoints.get(),
             record->hitPoints.getSequence());
        emit(id, ReplicatedField::LifeState, static_cast<int32_t>(record->lifeState.get()),
             record->lifeState.getSequence());
    }
}

void EntityDataManager::bindReplication(EntityRecord& record) {
    EntityRecord* rec = &record;
    record.hitPoints.addChangeHandler([this, rec](const int&, const int& newValue) {
        emit(rec->id, ReplicatedField::HitPoints, newValue, rec->hitPoints.getSequence());
    });
    record.maxHitPoints.addChangeHandler([this, rec](const int&, const int& newValue) {
        emit(rec->id, ReplicatedField::MaxHitPoints, newValue, rec->maxHitPoints.getSequence());
    });
    record.lifeState.addChangeHandler([this, rec](const LifeState&, const LifeState& newValue) {
        emit(rec->id, ReplicatedField::LifeState, static_cast<int32_t>(newValue),
             rec->lifeState.getSequence());
    });
}

void EntityDataManager::emit(EntityId id, ReplicatedField field, int32_t value,
                             uint64_t sequence) const {
    if (m_replicationSink) {
        m_replicationSink(ReplicationRecord{id, field, value, sequence + 1});
    }
}

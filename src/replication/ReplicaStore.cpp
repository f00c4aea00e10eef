/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "replication/ReplicaStore.hpp"
#include "core/Logger.hpp"
#include "replication/ReplicationManager.hpp"
#include <vector>

bool ReplicaStore::applyPacket(const BinarySerial::Buffer& packet) {
    std::vector<ReplicationRecord> records;
    if (!ReplicationManager::decode(packet, records)) {
        return false;
    }
    for (const auto& record : records) {
        applyRecord(record);
    }
    return true;
}

bool ReplicaStore::applyRecord(const ReplicationRecord& record) {
    EntityMirror& mirror = m_mirrors[record.entityId];

    int32_t oldValue = 0;
    bool applied = false;
    switch (record.field) {
    case ReplicatedField::HitPoints:
        oldValue = mirror.hitPoints.get();
        applied = mirror.hitPoints.applyReplicated(record.value, record.version);
        break;
    case ReplicatedField::MaxHitPoints:
        oldValue = mirror.maxHitPoints.get();
        applied = mirror.maxHitPoints.applyReplicated(record.value, record.version);
        break;
    case ReplicatedField::LifeState:
        if (record.value < 0 || record.value > static_cast<int32_t>(LifeState::Dead)) {
            REPLICATION_WARN("Ignoring out-of-range life state " + std::to_string(record.value));
            ++m_ignoredCount;
            return false;
        }
        oldValue = static_cast<int32_t>(mirror.lifeState.get());
        applied = mirror.lifeState.applyReplicated(static_cast<LifeState>(record.value), record.version);
        break;
    case ReplicatedField::COUNT:
        break;
    }

    if (!applied) {
        ++m_ignoredCount;
        return false;
    }

    ++m_appliedCount;
    if (m_changeHandler && oldValue != record.value) {
        m_changeHandler(record.entityId, record.field, oldValue, record.value);
    }
    return true;
}

const ReplicaStore::EntityMirror* ReplicaStore::find(EntityId entityId) const {
    auto it = m_mirrors.find(entityId);
    return it != m_mirrors.end() ? &it->second : nullptr;
}

std::optional<int> ReplicaStore::getHitPoints(EntityId entityId) const {
    if (const EntityMirror* mirror = find(entityId)) {
        return mirror->hitPoints.get();
    }
    return std::nullopt;
}

std::optional<int> ReplicaStore::getMaxHitPoints(EntityId entityId) const {
    if (const EntityMirror* mirror = find(entityId)) {
        return mirror->maxHitPoints.get();
    }
    return std::nullopt;
}

std::optional<LifeState> ReplicaStore::getLifeState(EntityId entityId) const {
    if (const EntityMirror* mirror = find(entityId)) {
        return mirror->lifeState.get();
    }
    return std::nullopt;
}

uint64_t ReplicaStore::getVersion(EntityId entityId, ReplicatedField field) const {
    const EntityMirror* mirror = find(entityId);
    if (!mirror) {
        return 0;
    }
    switch (field) {
    case ReplicatedField::HitPoints:
        return mirror->hitPoints.getSequence();
    case ReplicatedField::MaxHitPoints:
        return mirror->maxHitPoints.getSequence();
    case ReplicatedField::LifeState:
        return mirror->lifeState.getSequence();
    case ReplicatedField::COUNT:
        break;
    }
    return 0;
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REPLICA_STORE_HPP
#define REPLICA_STORE_HPP

/**
 * @file ReplicaStore.hpp
 * @brief Observer-side read-only mirror of authoritative entity fields
 *
 * Every mirrored field is a SyncedValue in the Observer role, so local code
 * can read and watch it but never write it. Packets may arrive more than
 * once or out of order; a record is applied only if its version is newer
 * than the mirror's (last write wins per field).
 */

#include "entities/EntityTypes.hpp"
#include "replication/ReplicationTypes.hpp"
#include "replication/SyncedValue.hpp"
#include "utils/BinarySerializer.hpp"
#include <boost/container/flat_map.hpp>
#include <functional>
#include <optional>

class ReplicaStore {
public:
    // (entity, field, old, new) after an applied change
    using FieldChangeHandler =
        std::function<void(EntityId entityId, ReplicatedField field, int32_t oldValue, int32_t newValue)>;

    ReplicaStore() = default;

    ReplicaStore(const ReplicaStore&) = delete;
    ReplicaStore& operator=(const ReplicaStore&) = delete;

    /**
     * @return false if the packet is malformed; nothing is applied then
     */
    bool applyPacket(const BinarySerial::Buffer& packet);

    // true if the record was newer than the mirror and was applied
    bool applyRecord(const ReplicationRecord& record);

    void setFieldChangeHandler(FieldChangeHandler handler) { m_changeHandler = std::move(handler); }

    bool hasEntity(EntityId entityId) const { return m_mirrors.count(entityId) > 0; }
    size_t getEntityCount() const { return m_mirrors.size(); }

    std::optional<int> getHitPoints(EntityId entityId) const;
    std::optional<int> getMaxHitPoints(EntityId entityId) const;
    std::optional<LifeState> getLifeState(EntityId entityId) const;
    uint64_t getVersion(EntityId entityId, ReplicatedField field) const;

    uint64_t getAppliedCount() const { return m_appliedCount; }
    uint64_t getIgnoredCount() const { return m_ignoredCount; }

    void clear() { m_mirrors.clear(); }

private:
    struct EntityMirror {
        SyncedValue<int> hitPoints{0, SyncRole::Observer};
        SyncedValue<int> maxHitPoints{0, SyncRole::Observer};
        SyncedValue<LifeState> lifeState{LifeState::Alive, SyncRole::Observer};
    };

    boost::container::flat_map<EntityId, EntityMirror> m_mirrors;
    FieldChangeHandler m_changeHandler;
    uint64_t m_appliedCount{0};
    uint64_t m_ignoredCount{0};

    const EntityMirror* find(EntityId entityId) const;
};

#endif // REPLICA_STORE_HPP

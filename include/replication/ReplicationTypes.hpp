/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REPLICATION_TYPES_HPP
#define REPLICATION_TYPES_HPP

#include "entities/EntityTypes.hpp"
#include <cstdint>
#include <ostream>

// Field ids carried on the replication channel
enum class ReplicatedField : uint8_t {
    HitPoints = 0,
    LifeState = 1,
    MaxHitPoints = 2,
    COUNT
};

inline const char* toString(ReplicatedField field) {
    switch (field) {
    case ReplicatedField::HitPoints:
        return "HitPoints";
    case ReplicatedField::LifeState:
        return "LifeState";
    case ReplicatedField::MaxHitPoints:
        return "MaxHitPoints";
    case ReplicatedField::COUNT:
        break;
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, ReplicatedField field) {
    return os << toString(field);
}

/**
 * One authoritative field write. Versions are per (entity, field) and start
 * at 1 for the spawn value, so a mirror that has never heard of the entity
 * (version 0) always accepts it.
 */
struct ReplicationRecord {
    EntityId entityId{INVALID_ENTITY_ID};
    ReplicatedField field{ReplicatedField::HitPoints};
    int32_t value{0};
    uint64_t version{0};

    bool operator==(const ReplicationRecord& other) const {
        return entityId == other.entityId && field == other.field &&
               value == other.value && version == other.version;
    }
};

#endif // REPLICATION_TYPES_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_TYPES_HPP
#define ENTITY_TYPES_HPP

#include <cstdint>
#include <ostream>

using EntityId = uint64_t;
constexpr EntityId INVALID_ENTITY_ID = 0;

// Transport-assigned id of a connected peer; changes across reconnects
using ClientId = uint64_t;
constexpr ClientId INVALID_CLIENT_ID = 0;
constexpr ClientId HOST_CLIENT_ID = 1;

enum class EntityKind : uint8_t { Player = 0, NPC = 1 };

enum class LifeState : uint8_t { Alive = 0, Fainted = 1, Dead = 2 };

inline const char* toString(EntityKind kind) {
    return kind == EntityKind::Player ? "Player" : "NPC";
}

inline const char* toString(LifeState state) {
    switch (state) {
    case LifeState::Alive:
        return "Alive";
    case LifeState::Fainted:
        return "Fainted";
    case LifeState::Dead:
        return "Dead";
    }
    return "Unknown";
}

// Stream operators for Boost.Test output
inline std::ostream& operator<<(std::ostream& os, EntityKind kind) {
    return os << toString(kind);
}

inline std::ostream& operator<<(std::ostream& os, LifeState state) {
    return os << toString(state);
}

#endif // ENTITY_TYPES_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_TYPES_HPP
#define ACTION_TYPES_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

using ActionInstanceId = uint64_t;
constexpr ActionInstanceId INVALID_ACTION_INSTANCE_ID = 0;

// Closed set of effect kinds; ActionEffects::execute switches on it
enum class ActionLogic : uint8_t {
    Melee = 0,
    Ranged,
    AreaOfEffect,
    Heal,
    Buff,
    Revive
};

enum class QueueMode : uint8_t {
    Append = 0, // Wait behind whatever is queued
    Replace     // Cancel active (if interruptible) and queued, then append
};

enum class ActionRequestResult : uint8_t {
    Started = 0,
    Queued,
    OnCooldown,
    UnknownAction,
    UnknownEntity,
    EntityNotAlive
};

enum class ActionPhase : uint8_t {
    Started = 0,
    Executed,
    Ended,
    Cancelled
};

inline const char* toString(ActionLogic logic) {
    switch (logic) {
    case ActionLogic::Melee: return "Melee";
    case ActionLogic::Ranged: return "Ranged";
    case ActionLogic::AreaOfEffect: return "AreaOfEffect";
    case ActionLogic::Heal: return "Heal";
    case ActionLogic::Buff: return "Buff";
    case ActionLogic::Revive: return "Revive";
    }
    return "Unknown";
}

inline std::optional<ActionLogic> actionLogicFromString(const std::string& name) {
    if (name == "Melee") return ActionLogic::Melee;
    if (name == "Ranged") return ActionLogic::Ranged;
    if (name == "AreaOfEffect") return ActionLogic::AreaOfEffect;
    if (name == "Heal") return ActionLogic::Heal;
    if (name == "Buff") return ActionLogic::Buff;
    if (name == "Revive") return ActionLogic::Revive;
    return std::nullopt;
}

inline const char* toString(ActionRequestResult result) {
    switch (result) {
    case ActionRequestResult::Started: return "Started";
    case ActionRequestResult::Queued: return "Queued";
    case ActionRequestResult::OnCooldown: return "OnCooldown";
    case ActionRequestResult::UnknownAction: return "UnknownAction";
    case ActionRequestResult::UnknownEntity: return "UnknownEntity";
    case ActionRequestResult::EntityNotAlive: return "EntityNotAlive";
    }
    return "Unknown";
}

inline const char* toString(ActionPhase phase) {
    switch (phase) {
    case ActionPhase::Started: return "Started";
    case ActionPhase::Executed: return "Executed";
    case ActionPhase::Ended: return "Ended";
    case ActionPhase::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, ActionLogic logic) {
    return os << toString(logic);
}

inline std::ostream& operator<<(std::ostream& os, ActionRequestResult result) {
    return os << toString(result);
}

inline std::ostream& operator<<(std::ostream& os, ActionPhase phase) {
    return os << toString(phase);
}

#endif // ACTION_TYPES_HPP

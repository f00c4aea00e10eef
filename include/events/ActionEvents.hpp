/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_EVENTS_HPP
#define ACTION_EVENTS_HPP

/**
 * @file ActionEvents.hpp
 * @brief Ability requests from input and lifecycle notifications for animation
 */

#include "actions/ActionTypes.hpp"
#include "entities/EntityTypes.hpp"
#include "events/Event.hpp"
#include <string>
#include <utility>
#include <vector>

// Input source -> PlayerActionController
class ActionRequestEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::ActionRequest;

    ActionRequestEvent(EntityId entityId, std::string actionId,
                       std::vector<EntityId> targetIds = {},
                       QueueMode queueMode = QueueMode::Append)
        : m_entityId(entityId)
        , m_actionId(std::move(actionId))
        , m_targetIds(std::move(targetIds))
        , m_queueMode(queueMode) {}

    std::string getName() const override { return "ActionRequestEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] EntityId getEntityId() const { return m_entityId; }
    [[nodiscard]] const std::string& getActionId() const { return m_actionId; }
    [[nodiscard]] const std::vector<EntityId>& getTargetIds() const { return m_targetIds; }
    [[nodiscard]] QueueMode getQueueMode() const { return m_queueMode; }

private:
    EntityId m_entityId;
    std::string m_actionId;
    std::vector<EntityId> m_targetIds;
    QueueMode m_queueMode;
};

// ActionManager -> renderer/animator
class ActionLifecycleEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::ActionLifecycle;

    ActionLifecycleEvent(ActionPhase phase, EntityId ownerId,
                         ActionInstanceId instanceId, std::string actionId,
                         std::string animTrigger)
        : m_phase(phase)
        , m_ownerId(ownerId)
        , m_instanceId(instanceId)
        , m_actionId(std::move(actionId))
        , m_animTrigger(std::move(animTrigger)) {}

    std::string getName() const override { return "ActionLifecycleEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] ActionPhase getPhase() const { return m_phase; }
    [[nodiscard]] EntityId getOwnerId() const { return m_ownerId; }
    [[nodiscard]] ActionInstanceId getInstanceId() const { return m_instanceId; }
    [[nodiscard]] const std::string& getActionId() const { return m_actionId; }
    [[nodiscard]] const std::string& getAnimTrigger() const { return m_animTrigger; }

private:
    ActionPhase m_phase;
    EntityId m_ownerId;
    ActionInstanceId m_instanceId;
    std::string m_actionId;
    std::string m_animTrigger;
};

#endif // ACTION_EVENTS_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_EVENTS_HPP
#define ENTITY_EVENTS_HPP

/**
 * @file EntityEvents.hpp
 * @brief Health and life-state notifications
 *
 * Published by HealthManager after the synced values have been committed.
 * AI uses HealthChangedEvent to build its hated set; ActionManager uses
 * LifeStateChangedEvent to flush queues of entities that went down.
 */

#include "entities/EntityTypes.hpp"
#include "events/Event.hpp"

class HealthChangedEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::HealthChanged;

    HealthChangedEvent(EntityId entityId, EntityId sourceId, int oldHitPoints,
                       int newHitPoints)
        : m_entityId(entityId)
        , m_sourceId(sourceId)
        , m_oldHitPoints(oldHitPoints)
        , m_newHitPoints(newHitPoints) {}

    std::string getName() const override { return "HealthChangedEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] EntityId getEntityId() const { return m_entityId; }
    // INVALID_ENTITY_ID for environmental or scripted changes
    [[nodiscard]] EntityId getSourceId() const { return m_sourceId; }
    [[nodiscard]] int getOldHitPoints() const { return m_oldHitPoints; }
    [[nodiscard]] int getNewHitPoints() const { return m_newHitPoints; }
    [[nodiscard]] int getDelta() const { return m_newHitPoints - m_oldHitPoints; }
    [[nodiscard]] bool isDamage() const { return m_newHitPoints < m_oldHitPoints; }

private:
    EntityId m_entityId;
    EntityId m_sourceId;
    int m_oldHitPoints;
    int m_newHitPoints;
};

class LifeStateChangedEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::LifeStateChanged;

    LifeStateChangedEvent(EntityId entityId, LifeState oldState, LifeState newState)
        : m_entityId(entityId), m_oldState(oldState), m_newState(newState) {}

    std::string getName() const override { return "LifeStateChangedEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] EntityId getEntityId() const { return m_entityId; }
    [[nodiscard]] LifeState getOldState() const { return m_oldState; }
    [[nodiscard]] LifeState getNewState() const { return m_newState; }

private:
    EntityId m_entityId;
    LifeState m_oldState;
    LifeState m_newState;
};

#endif // ENTITY_EVENTS_HPP

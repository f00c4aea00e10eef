/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file ActionManagerTests.cpp
 * @brief Unit tests for action queues, cooldowns and effects
 *
 * Tests cover:
 * - Cooldown gating at request time
 * - Effect timing and same-tick chaining of queued actions
 * - Cancel (queued and active) and Replace queue mode
 * - Melee, area, heal, revive and buff effects
 * - Queue flush when the owner goes down
 */

#define BOOST_TEST_MODULE ActionManagerTests
#include <boost/test/unit_test.hpp>

#include "core/SimulationClock.hpp"
#include "data/GameDataCatalog.hpp"
#include "events/ActionEvents.hpp"
#include "managers/ActionManager.hpp"
#include "managers/EntityDataManager.hpp"
#include "managers/EventManager.hpp"
#include "managers/HealthManager.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

ActionDefinition makeAction(const std::string& id, ActionLogic logic, float duration,
                            float executeTime, float reuseTime, int amount, float range = 2.0f) {
    ActionDefinition def;
    def.id = id;
    def.logic = logic;
    def.durationSeconds = duration;
    def.executeTimeSeconds = executeTime;
    def.reuseTimeSeconds = reuseTime;
    def.amount = amount;
    def.range = range;
    def.animTrigger = id;
    return def;
}

} // namespace

struct ActionFixture {
    EventManager eventManager;
    EntityDataManager entityData;
    HealthManager health{entityData, eventManager};
    GameDataCatalog catalog;
    VanguardEngine::SimulationClock clock;
    ActionManager actions{catalog, entityData, health, eventManager, clock};

    std::vector<ActionPhase> phases;
    std::vector<std::string> phaseActions;

    ActionFixture() {
        catalog.addAction(makeAction("strike", ActionLogic::Melee, 0.5f, 0.2f, 2.0f, 10));
        catalog.addAction(makeAction("bolt", ActionLogic::Ranged, 1.0f, 0.5f, 0.0f, 5, 8.0f));

        ActionDefinition cleave = makeAction("cleave", ActionLogic::AreaOfEffect, 0.5f, 0.0f, 0.0f, 10);
        cleave.radius = 3.0f;
        catalog.addAction(cleave);

        ActionDefinition mend = makeAction("mend", ActionLogic::Heal, 0.5f, 0.0f, 0.0f, 25, 5.0f);
        mend.friendly = true;
        catalog.addAction(mend);

        ActionDefinition revive = makeAction("revive", ActionLogic::Revive, 1.0f, 0.0f, 0.0f, 30, 3.0f);
        revive.friendly = true;
        catalog.addAction(revive);

        ActionDefinition guard = makeAction("guard", ActionLogic::Buff, 3.0f, 0.0f, 0.0f, 0);
        guard.damageMultiplier = 0.5f;
        guard.interruptible = false;
        catalog.addAction(guard);

        eventManager.subscribe<ActionLifecycleEvent>([this](const ActionLifecycleEvent& event) {
            phases.push_back(event.getPhase());
            phaseActions.push_back(event.getActionId());
        });
    }

    EntityId spawn(EntityKind kind, float x, float y = 0.0f, int maxHitPoints = 100) {
        EntitySpawnParams params;
        params.kind = kind;
        params.classId = kind == EntityKind::Player ? "hero" : "goblin";
        params.maxHitPoints = maxHitPoints;
        params.position = Vector2D(x, y);
        return entityData.createEntity(params);
    }

    // One simulation step: the clock drives cooldowns, update() drives instances
    void tick(float deltaTime) {
        clock.advance(deltaTime);
        actions.update(deltaTime);
    }
};

BOOST_AUTO_TEST_SUITE(CooldownTests)

BOOST_FIXTURE_TEST_CASE(ReuseTimeGatesRequests, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    spawn(EntityKind::NPC, 1.0f, 0.0f, 1000);

    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::Started);

    tick(0.5f);
    tick(0.5f);
    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 0u);
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::OnCooldown);
    BOOST_CHECK(actions.isOnCooldown(hero, "strike"));
    BOOST_CHECK_CLOSE(actions.getCooldownRemaining(hero, "strike"), 1.0f, 0.1f);

    tick(1.1f);
    BOOST_CHECK(!actions.isOnCooldown(hero, "strike"));
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::Started);
}

BOOST_FIXTURE_TEST_CASE(RejectedRequestMutatesNothing, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    actions.requestAction(hero, "strike");
    tick(0.5f);
    phases.clear();

    const auto lastStart = actions.getLastStartTime(hero, "strike");
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::OnCooldown);

    BOOST_CHECK(phases.empty());
    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 0u);
    BOOST_REQUIRE(actions.getLastStartTime(hero, "strike").has_value());
    BOOST_CHECK_EQUAL(*actions.getLastStartTime(hero, "strike"), *lastStart);
}

BOOST_FIXTURE_TEST_CASE(ActionsWithoutReuseTimeNeverCoolDown, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "bolt"), ActionRequestResult::Started);
    BOOST_CHECK(!actions.isOnCooldown(hero, "bolt"));
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "bolt"), ActionRequestResult::Queued);
}

BOOST_FIXTURE_TEST_CASE(InvalidRequestsAreRejected, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);

    BOOST_CHECK_EQUAL(actions.requestAction(hero, "nope"), ActionRequestResult::UnknownAction);
    BOOST_CHECK_EQUAL(actions.requestAction(999, "strike"), ActionRequestResult::UnknownEntity);

    health.kill(hero);
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::EntityNotAlive);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(LifecycleTests)

BOOST_FIXTURE_TEST_CASE(EffectFiresOnceAtExecuteTime, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    const EntityId goblin = spawn(EntityKind::NPC, 3.0f);

    actions.requestAction(hero, "bolt", {goblin});
    tick(0.4f);
    BOOST_CHECK_EQUAL(health.getHitPoints(goblin), 100);

    tick(0.2f);
    BOOST_CHECK_EQUAL(health.getHitPoints(goblin), 95);

    tick(0.3f);
    BOOST_CHECK_EQUAL(health.getHitPoints(goblin), 95);
    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 1u);

    tick(0.2f);
    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 0u);
    BOOST_CHECK_EQUAL(actions.getExecutedCount(), 1u);

    const std::vector<ActionPhase> expected{ActionPhase::Started, ActionPhase::Executed,
                                            ActionPhase::Ended};
    BOOST_CHECK(phases == expected);
}

BOOST_FIXTURE_TEST_CASE(QueuedActionStartsInSameTick, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    spawn(EntityKind::NPC, 1.0f, 0.0f, 1000);

    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::Started);
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "bolt"), ActionRequestResult::Queued);
    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 2u);

    tick(0.5f);

    const ActionInstance* active = actions.getActiveAction(hero);
    BOOST_REQUIRE(active != nullptr);
    BOOST_CHECK_EQUAL(active->definition->id, "bolt");
    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 1u);
    BOOST_CHECK_EQUAL(phaseActions.back(), "bolt");
    BOOST_CHECK_EQUAL(phases.back(), ActionPhase::Started);
}

BOOST_FIXTURE_TEST_CASE(QueuedCopyInsideCooldownIsDropped, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);

    actions.requestAction(hero, "bolt");
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::Queued);
    BOOST_CHECK_EQUAL(actions.requestAction(hero, "strike"), ActionRequestResult::Queued);

    tick(1.0f);
    BOOST_CHECK_EQUAL(actions.getActiveAction(hero)->definition->id, "strike");

    tick(0.5f);
    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CancelTests)

BOOST_FIXTURE_TEST_CASE(CancelQueuedLeavesActiveRunning, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    actions.requestAction(hero, "bolt");
    actions.requestAction(hero, "strike");
    const ActionInstanceId activeId = actions.getActiveAction(hero)->instanceId;

    BOOST_CHECK(actions.cancelAction(hero, activeId + 1));

    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 1u);
    BOOST_CHECK_EQUAL(actions.getActiveAction(hero)->instanceId, activeId);
    BOOST_CHECK(!actions.getLastStartTime(hero, "strike").has_value());
    BOOST_CHECK(!actions.cancelAction(hero, activeId + 1));
}

BOOST_FIXTURE_TEST_CASE(CancelActiveKeepsAppliedEffectAndCooldown, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    const EntityId goblin = spawn(EntityKind::NPC, 1.0f);
    actions.requestAction(hero, "strike");
    tick(0.3f);
    BOOST_CHECK_EQUAL(health.getHitPoints(goblin), 90);

    BOOST_CHECK(actions.cancelAction(hero, actions.getActiveAction(hero)->instanceId));

    BOOST_CHECK_EQUAL(phases.back(), ActionPhase::Cancelled);
    BOOST_CHECK_EQUAL(health.getHitPoints(goblin), 90);
    BOOST_CHECK(actions.isOnCooldown(hero, "strike"));
    BOOST_CHECK(actions.getActiveAction(hero) == nullptr);
}

BOOST_FIXTURE_TEST_CASE(ReplaceCancelsInterruptibleActive, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    actions.requestAction(hero, "bolt");
    actions.requestAction(hero, "strike");

    BOOST_CHECK_EQUAL(actions.requestAction(hero, "cleave", {}, QueueMode::Replace),
                      ActionRequestResult::Started);

    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 1u);
    BOOST_CHECK_EQUAL(actions.getActiveAction(hero)->definition->id, "cleave");
    BOOST_CHECK(std::find(phases.begin(), phases.end(), ActionPhase::Cancelled) != phases.end());
}

BOOST_FIXTURE_TEST_CASE(ReplaceKeepsUninterruptibleActive, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    actions.requestAction(hero, "guard");
    actions.requestAction(hero, "bolt");

    BOOST_CHECK_EQUAL(actions.requestAction(hero, "cleave", {}, QueueMode::Replace),
                      ActionRequestResult::Queued);

    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 2u);
    BOOST_CHECK_EQUAL(actions.getActiveAction(hero)->definition->id, "guard");
}

BOOST_FIXTURE_TEST_CASE(DownedOwnerQueueIsFlushed, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    actions.requestAction(hero, "bolt");
    actions.requestAction(hero, "strike");

    health.kill(hero);

    BOOST_CHECK_EQUAL(actions.getQueueLength(hero), 0u);
    BOOST_CHECK_EQUAL(phases.back(), ActionPhase::Cancelled);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EffectTests)

BOOST_FIXTURE_TEST_CASE(MeleePicksClosestEnemyInRange, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    const EntityId ally = spawn(EntityKind::Player, 0.5f);
    const EntityId near = spawn(EntityKind::NPC, 1.5f);
    const EntityId nearer = spawn(EntityKind::NPC, -1.0f);
    const EntityId far = spawn(EntityKind::NPC, 6.0f);

    actions.requestAction(hero, "strike");
    tick(0.3f);

    BOOST_CHECK_EQUAL(health.getHitPoints(nearer), 90);
    BOOST_CHECK_EQUAL(health.getHitPoints(near), 100);
    BOOST_CHECK_EQUAL(health.getHitPoints(far), 100);
    BOOST_CHECK_EQUAL(health.getHitPoints(ally), 100);
}

BOOST_FIXTURE_TEST_CASE(TargetHintWinsWhenValid, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    const EntityId closest = spawn(EntityKind::NPC, 1.0f);
    const EntityId hinted = spawn(EntityKind::NPC, 1.8f);

    actions.requestAction(hero, "strike", {hinted});
    tick(0.3f);

    BOOST_CHECK_EQUAL(health.getHitPoints(hinted), 90);
    BOOST_CHECK_EQUAL(health.getHitPoints(closest), 100);
}

BOOST_FIXTURE_TEST_CASE(AreaHitsEnemiesInsideRadius, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    const EntityId ally = spawn(EntityKind::Player, 1.0f);
    const EntityId a = spawn(EntityKind::NPC, 1.0f);
    const EntityId b = spawn(EntityKind::NPC, 0.0f, 2.5f);
    const EntityId outside = spawn(EntityKind::NPC, 4.0f);

    actions.requestAction(hero, "cleave");

    BOOST_CHECK_EQUAL(health.getHitPoints(a), 90);
    BOOST_CHECK_EQUAL(health.getHitPoints(b), 90);
    BOOST_CHECK_EQUAL(health.getHitPoints(outside), 100);
    BOOST_CHECK_EQUAL(health.getHitPoints(ally), 100);
    BOOST_CHECK_EQUAL(health.getHitPoints(hero), 100);
}

BOOST_FIXTURE_TEST_CASE(HealTargetsHintedAllyOrSelf, ActionFixture) {
    const EntityId healer = spawn(EntityKind::Player, 0.0f);
    const EntityId ally = spawn(EntityKind::Player, 2.0f);
    health.applyDelta(ally, INVALID_ENTITY_ID, -50);
    health.applyDelta(healer, INVALID_ENTITY_ID, -50);

    actions.requestAction(healer, "mend", {ally});
    BOOST_CHECK_EQUAL(health.getHitPoints(ally), 75);
    BOOST_CHECK_EQUAL(health.getHitPoints(healer), 50);

    tick(0.5f);
    actions.requestAction(healer, "mend");
    BOOST_CHECK_EQUAL(health.getHitPoints(healer), 75);
}

BOOST_FIXTURE_TEST_CASE(ReviveRaisesFaintedAlly, ActionFixture) {
    const EntityId healer = spawn(EntityKind::Player, 0.0f);
    const EntityId ally = spawn(EntityKind::Player, 1.0f);
    health.kill(ally);

    actions.requestAction(healer, "revive");

    BOOST_CHECK_EQUAL(health.getLifeState(ally), LifeState::Alive);
    BOOST_CHECK_EQUAL(health.getHitPoints(ally), 30);
}

BOOST_FIXTURE_TEST_CASE(BuffScalesIncomingDamageWhileActive, ActionFixture) {
    const EntityId hero = spawn(EntityKind::Player, 0.0f);
    const EntityId goblin = spawn(EntityKind::NPC, 1.0f);

    actions.requestAction(hero, "guard");
    health.applyDelta(hero, goblin, -40);
    BOOST_CHECK_EQUAL(health.getHitPoints(hero), 80);

    tick(3.0f);
    BOOST_CHECK(actions.getActiveAction(hero) == nullptr);
    health.applyDelta(hero, goblin, -40);
    BOOST_CHECK_EQUAL(health.getHitPoints(hero), 40);
}

BOOST_AUTO_TEST_SUITE_END()

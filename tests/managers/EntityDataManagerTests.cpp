/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file EntityDataManagerTests.cpp
 * @brief Unit tests for the entity data store
 *
 * Tests cover:
 * - Entity creation from spawn params and character classes
 * - Lookup by kind and owning client
 * - Replication records for spawns, changes and full snapshots
 */

#define BOOST_TEST_MODULE EntityDataManagerTests
#include <boost/test/unit_test.hpp>

#include "data/CharacterClass.hpp"
#include "managers/EntityDataManager.hpp"

#include <vector>

struct EntityDataFixture {
    EntityDataManager entityData;
    std::vector<ReplicationRecord> records;

    EntityDataFixture() {
        entityData.setReplicationSink(
            [this](const ReplicationRecord& record) { records.push_back(record); });
    }

    EntityId spawn(EntityKind kind, ClientId owner = INVALID_CLIENT_ID) {
        EntitySpawnParams params;
        params.kind = kind;
        params.classId = "test";
        params.maxHitPoints = 50;
        params.ownerClientId = owner;
        return entityData.createEntity(params);
    }
};

BOOST_AUTO_TEST_SUITE(CreationTests)

BOOST_FIXTURE_TEST_CASE(CreateEntityStartsAliveAtFullHealth, EntityDataFixture) {
    const EntityId id = spawn(EntityKind::NPC);

    BOOST_REQUIRE_NE(id, INVALID_ENTITY_ID);
    const EntityRecord* record = entityData.getEntity(id);
    BOOST_REQUIRE(record != nullptr);
    BOOST_CHECK_EQUAL(record->hitPoints.get(), 50);
    BOOST_CHECK_EQUAL(record->maxHitPoints.get(), 50);
    BOOST_CHECK(record->isAlive());
    BOOST_CHECK_EQUAL(record->displayName, "test");
}

BOOST_FIXTURE_TEST_CASE(NonPositiveMaxHitPointsIsRejected, EntityDataFixture) {
    EntitySpawnParams params;
    params.maxHitPoints = 0;

    BOOST_CHECK_EQUAL(entityData.createEntity(params), INVALID_ENTITY_ID);
    BOOST_CHECK_EQUAL(entityData.size(), 0u);
    BOOST_CHECK(records.empty());
}

BOOST_FIXTURE_TEST_CASE(SpawnParamsFollowCharacterClass, EntityDataFixture) {
    CharacterClass skeleton;
    skeleton.id = "skeleton";
    skeleton.maxHitPoints = 70;
    skeleton.moveSpeed = 2.5f;
    skeleton.detectionRange = 8.0f;
    skeleton.isNpc = true;

    const EntitySpawnParams params = EntitySpawnParams::fromClass(skeleton, Vector2D(3.0f, 4.0f));
    const EntityId id = entityData.createEntity(params);

    const EntityRecord* record = entityData.getEntity(id);
    BOOST_REQUIRE(record != nullptr);
    BOOST_CHECK_EQUAL(record->kind, EntityKind::NPC);
    BOOST_CHECK_EQUAL(record->maxHitPoints.get(), 70);
    BOOST_CHECK_CLOSE(record->moveSpeed, 2.5f, 0.001f);
    BOOST_CHECK_CLOSE(record->detectionRange, 8.0f, 0.001f);
    BOOST_CHECK_CLOSE(record->position.getX(), 3.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(DestroyRemovesEntity, EntityDataFixture) {
    const EntityId id = spawn(EntityKind::NPC);

    BOOST_CHECK(entityData.destroyEntity(id));
    BOOST_CHECK(!entityData.exists(id));
    BOOST_CHECK(!entityData.isAlive(id));
    BOOST_CHECK(!entityData.destroyEntity(id));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(LookupTests)

BOOST_FIXTURE_TEST_CASE(IdsAreAscendingAndFilteredByKind, EntityDataFixture) {
    const EntityId npc = spawn(EntityKind::NPC);
    const EntityId player = spawn(EntityKind::Player, 4);
    const EntityId npc2 = spawn(EntityKind::NPC);

    const std::vector<EntityId> all{npc, player, npc2};
    BOOST_CHECK(entityData.getEntityIds() == all);

    const std::vector<EntityId> npcs{npc, npc2};
    BOOST_CHECK(entityData.getEntityIds(EntityKind::NPC) == npcs);

    BOOST_CHECK_EQUAL(entityData.findPlayerByClient(4), player);
    BOOST_CHECK_EQUAL(entityData.findPlayerByClient(5), INVALID_ENTITY_ID);
}

BOOST_FIXTURE_TEST_CASE(SetPositionUpdatesFacing, EntityDataFixture) {
    const EntityId id = spawn(EntityKind::NPC);

    entityData.setPosition(id, Vector2D(0.0f, 2.0f));

    const EntityRecord* record = entityData.getEntity(id);
    BOOST_CHECK_CLOSE(record->position.getY(), 2.0f, 0.001f);
    BOOST_CHECK_SMALL(record->facing.getX(), 0.001f);
    BOOST_CHECK_CLOSE(record->facing.getY(), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ReplicationTests)

BOOST_FIXTURE_TEST_CASE(SpawnEmitsInitialValuesAtVersionOne, EntityDataFixture) {
    const EntityId id = spawn(EntityKind::NPC);

    BOOST_REQUIRE_EQUAL(records.size(), 3u);
    for (const ReplicationRecord& record : records) {
        BOOST_CHECK_EQUAL(record.entityId, id);
        BOOST_CHECK_EQUAL(record.version, 1u);
    }
    BOOST_CHECK_EQUAL(records[1].field, ReplicatedField::HitPoints);
    BOOST_CHECK_EQUAL(records[1].value, 50);
}

BOOST_FIXTURE_TEST_CASE(ChangesEmitIncreasingVersions, EntityDataFixture) {
    const EntityId id = spawn(EntityKind::NPC);
    records.clear();

    EntityRecord* record = entityData.getEntity(id);
    record->hitPoints.setValue(40);
    record->hitPoints.setValue(30);
    record->hitPoints.setValue(30);

    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(records[0].value, 40);
    BOOST_CHECK_EQUAL(records[0].version, 2u);
    BOOST_CHECK_EQUAL(records[1].value, 30);
    BOOST_CHECK_EQUAL(records[1].version, 3u);
}

BOOST_FIXTURE_TEST_CASE(FullSnapshotRepeatsCurrentState, EntityDataFixture) {
    const EntityId id = spawn(EntityKind::Player);
    entityData.getEntity(id)->hitPoints.setValue(10);
    records.clear();

    entityData.emitFullSnapshot();

    BOOST_REQUIRE_EQUAL(records.size(), 3u);
    BOOST_CHECK_EQUAL(records[1].field, ReplicatedField::HitPoints);
    BOOST_CHECK_EQUAL(records[1].value, 10);
    BOOST_CHECK_EQUAL(records[1].version, 2u);
    BOOST_CHECK_EQUAL(records[0].version, 1u);
}

BOOST_AUTO_TEST_SUITE_END()

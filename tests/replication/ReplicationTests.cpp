/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file ReplicationTests.cpp
 * @brief Tests for the authority-to-observer replication channel
 *
 * Tests cover:
 * - Per-tick coalescing and flush
 * - Packet decoding of malformed input
 * - ReplicaStore ordering (stale and duplicate records)
 * - Authority health changes reaching an observer mirror
 */

#define BOOST_TEST_MODULE ReplicationTests
#include <boost/test/unit_test.hpp>

#include "managers/EntityDataManager.hpp"
#include "managers/EventManager.hpp"
#include "managers/HealthManager.hpp"
#include "replication/ReplicaStore.hpp"
#include "replication/ReplicationManager.hpp"

#include <vector>

struct ReplicationFixture {
    ReplicationManager replication;
    ReplicaStore mirror;
    std::vector<BinarySerial::Buffer> packets;

    ReplicationFixture() {
        replication.setPacketSink([this](const BinarySerial::Buffer& packet) {
            packets.push_back(packet);
            mirror.applyPacket(packet);
        });
    }
};

BOOST_AUTO_TEST_SUITE(ReplicationManagerTests)

BOOST_FIXTURE_TEST_CASE(WritesCollapseWithinATick, ReplicationFixture) {
    replication.record({1, ReplicatedField::HitPoints, 90, 2});
    replication.record({1, ReplicatedField::HitPoints, 80, 3});
    replication.record({1, ReplicatedField::LifeState, 0, 1});
    BOOST_CHECK_EQUAL(replication.getPendingCount(), 2u);

    BOOST_CHECK_EQUAL(replication.flush(), 2u);

    BOOST_CHECK_EQUAL(packets.size(), 1u);
    BOOST_CHECK_EQUAL(replication.getPacketsSent(), 1u);
    BOOST_CHECK_EQUAL(replication.getPendingCount(), 0u);
    BOOST_CHECK_EQUAL(mirror.getHitPoints(1).value_or(-1), 80);
    BOOST_CHECK_EQUAL(mirror.getVersion(1, ReplicatedField::HitPoints), 3u);
}

BOOST_FIXTURE_TEST_CASE(OlderWriteDoesNotReplaceNewer, ReplicationFixture) {
    replication.record({1, ReplicatedField::HitPoints, 80, 3});
    replication.record({1, ReplicatedField::HitPoints, 90, 2});
    replication.flush();

    BOOST_CHECK_EQUAL(mirror.getHitPoints(1).value_or(-1), 80);
}

BOOST_FIXTURE_TEST_CASE(EmptyFlushSendsNothing, ReplicationFixture) {
    BOOST_CHECK_EQUAL(replication.flush(), 0u);
    BOOST_CHECK(packets.empty());
}

BOOST_AUTO_TEST_CASE(DecodeRestoresRecords) {
    const std::vector<ReplicationRecord> sent{{4, ReplicatedField::MaxHitPoints, 120, 1},
                                              {4, ReplicatedField::LifeState, 1, 5}};
    std::vector<ReplicationRecord> received;

    BOOST_REQUIRE(ReplicationManager::decode(ReplicationManager::encode(sent), received));
    BOOST_CHECK(received == sent);
}

BOOST_AUTO_TEST_CASE(DecodeRejectsTruncatedPacket) {
    BinarySerial::Buffer packet =
        ReplicationManager::encode({{4, ReplicatedField::HitPoints, 10, 2}});
    packet.pop_back();

    std::vector<ReplicationRecord> received{{9, ReplicatedField::HitPoints, 1, 1}};
    BOOST_CHECK(!ReplicationManager::decode(packet, received));
    BOOST_CHECK(received.empty());
}

BOOST_AUTO_TEST_CASE(DecodeRejectsEmptyAndUnknownField) {
    std::vector<ReplicationRecord> received;
    BOOST_CHECK(!ReplicationManager::decode(BinarySerial::Buffer{}, received));

    ReplicationRecord bogus{4, ReplicatedField::COUNT, 10, 2};
    BOOST_CHECK(!ReplicationManager::decode(ReplicationManager::encode({bogus}), received));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ReplicaStoreTests)

BOOST_AUTO_TEST_CASE(StaleAndDuplicateRecordsAreIgnored) {
    ReplicaStore store;

    BOOST_CHECK(store.applyRecord({2, ReplicatedField::HitPoints, 60, 4}));
    BOOST_CHECK(!store.applyRecord({2, ReplicatedField::HitPoints, 70, 3}));
    BOOST_CHECK(!store.applyRecord({2, ReplicatedField::HitPoints, 60, 4}));

    BOOST_CHECK_EQUAL(store.getHitPoints(2).value_or(-1), 60);
    BOOST_CHECK_EQUAL(store.getAppliedCount(), 1u);
    BOOST_CHECK_EQUAL(store.getIgnoredCount(), 2u);
}

BOOST_AUTO_TEST_CASE(OutOfRangeLifeStateIsIgnored) {
    ReplicaStore store;
    BOOST_CHECK(!store.applyRecord({2, ReplicatedField::LifeState, 9, 1}));
    BOOST_CHECK(store.getLifeState(2) == LifeState::Alive);
}

BOOST_AUTO_TEST_CASE(ChangeHandlerSeesOldAndNew) {
    ReplicaStore store;
    std::vector<int32_t> deltas;
    store.setFieldChangeHandler([&](EntityId, ReplicatedField field, int32_t oldValue,
                                    int32_t newValue) {
        if (field == ReplicatedField::HitPoints) {
            deltas.push_back(newValue - oldValue);
        }
    });

    store.applyRecord({2, ReplicatedField::HitPoints, 100, 1});
    store.applyRecord({2, ReplicatedField::HitPoints, 75, 2});

    const std::vector<int32_t> expected{100, -25};
    BOOST_CHECK(deltas == expected);
}

BOOST_AUTO_TEST_CASE(UnknownEntityHasNoValues) {
    ReplicaStore store;
    BOOST_CHECK(!store.hasEntity(3));
    BOOST_CHECK(!store.getHitPoints(3).has_value());
    BOOST_CHECK_EQUAL(store.getVersion(3, ReplicatedField::HitPoints), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EndToEndTests)

BOOST_FIXTURE_TEST_CASE(ObserverMirrorsAuthorityHealth, ReplicationFixture) {
    EventManager eventManager;
    EntityDataManager entityData;
    HealthManager health(entityData, eventManager);
    entityData.setReplicationSink(
        [this](const ReplicationRecord& record) { replication.record(record); });

    EntitySpawnParams params;
    params.kind = EntityKind::Player;
    params.classId = "warrior";
    params.maxHitPoints = 100;
    const EntityId player = entityData.createEntity(params);
    replication.flush();

    BOOST_CHECK_EQUAL(mirror.getMaxHitPoints(player).value_or(-1), 100);
    BOOST_CHECK_EQUAL(mirror.getHitPoints(player).value_or(-1), 100);

    health.applyDelta(player, INVALID_ENTITY_ID, -30);
    health.applyDelta(player, INVALID_ENTITY_ID, -100);
    replication.flush();

    BOOST_CHECK_EQUAL(mirror.getHitPoints(player).value_or(-1), 0);
    BOOST_CHECK(mirror.getLifeState(player) == LifeState::Fainted);

    // A late joiner's snapshot repeats versions the mirror already holds
    const uint64_t applied = mirror.getAppliedCount();
    entityData.emitFullSnapshot();
    replication.flush();
    BOOST_CHECK_EQUAL(mirror.getAppliedCount(), applied);
    BOOST_CHECK_EQUAL(mirror.getHitPoints(player).value_or(-1), 0);
}

BOOST_AUTO_TEST_SUITE_END()

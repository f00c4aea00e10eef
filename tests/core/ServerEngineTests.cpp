/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file ServerEngineTests.cpp
 * @brief Integration tests for the server tick and system wiring
 *
 * Tests cover:
 * - init() catalog loading and controller registration
 * - spawnCharacter() for players and NPCs
 * - Input requests reaching ActionManager and damage replicating out
 * - Hosting loading the lobby scene and late joiners receiving a snapshot
 * - despawn() removing an entity from every manager
 * - clean() dropping simulation state
 */

#define BOOST_TEST_MODULE ServerEngineTests
#include <boost/test/unit_test.hpp>

#include "connection/ConnectionMethod.hpp"
#include "connection/ConnectionPayload.hpp"
#include "controllers/combat/PlayerActionController.hpp"
#include "controllers/session/SceneController.hpp"
#include "core/ServerEngine.hpp"
#include "events/ActionEvents.hpp"
#include "mocks/MockConnectionMethod.hpp"
#include "mocks/MockSceneLoader.hpp"
#include "mocks/MockTransport.hpp"
#include "replication/ReplicaStore.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

using VanguardEngine::ServerSettings;

namespace {

const char* const TEST_GAME_DATA = R"({
  "actions": [
    { "id": "slash", "logic": "Melee", "amount": 20, "range": 2.0, "duration": 0.4, "executeTime": 0.2, "reuseTime": 1.0 },
    { "id": "claw", "logic": "Melee", "amount": 5, "range": 1.2, "duration": 0.5, "executeTime": 0.25, "reuseTime": 1.5 }
  ],
  "classes": [
    { "id": "warrior", "maxHitPoints": 150, "moveSpeed": 4.0, "detectionRange": 8.0, "skills": ["slash"] },
    { "id": "goblin", "maxHitPoints": 60, "moveSpeed": 3.0, "detectionRange": 6.0, "isNpc": true, "skills": ["claw"] }
  ]
})";

} // namespace

struct EngineFixture {
    ServerSettings settings;
    MockTransport transport;
    MockSceneLoader sceneLoader;
    std::unique_ptr<ServerEngine> engine;
    ReplicaStore mirror;
    const std::string dataFile =
        (std::filesystem::temp_directory_path() / "vanguard_engine_test_data.json").string();

    EngineFixture() {
        std::ofstream out(dataFile);
        out << TEST_GAME_DATA;
        out.close();

        transport.setPacketReceiver(
            [this](const BinarySerial::Buffer& packet) { mirror.applyPacket(packet); });
        engine = std::make_unique<ServerEngine>(settings, transport, sceneLoader);
        BOOST_REQUIRE(engine->init(dataFile));
    }

    ~EngineFixture() {
        engine.reset();
        std::error_code ec;
        std::filesystem::remove(dataFile, ec);
    }

    void run(int ticks, float deltaTime = 0.1f) {
        for (int i = 0; i < ticks; ++i) {
            engine->update(deltaTime);
        }
    }

    void startHosting() {
        engine->getConnectionManager().startHost(std::make_shared<MockConnectionMethod>());
        run(2);
        transport.fireServerStarted();
        run(2);
    }
};

BOOST_AUTO_TEST_SUITE(InitTests)

BOOST_AUTO_TEST_CASE(MissingCatalogFailsInit) {
    ServerSettings settings;
    MockTransport transport;
    MockSceneLoader sceneLoader;
    ServerEngine engine(settings, transport, sceneLoader);

    BOOST_CHECK(!engine.init("does/not/exist.json"));
    BOOST_CHECK(!engine.isInitialized());
}

BOOST_FIXTURE_TEST_CASE(InitLoadsCatalogAndControllers, EngineFixture) {
    BOOST_CHECK(engine->isInitialized());
    BOOST_CHECK_EQUAL(engine->getCatalog().getActionCount(), 2u);
    BOOST_CHECK_EQUAL(engine->getCatalog().getClassCount(), 2u);
    BOOST_CHECK(engine->getControllers().has<SceneController>());
    BOOST_CHECK(engine->getControllers().has<PlayerActionController>());
    BOOST_CHECK(engine->init(dataFile));
}

BOOST_FIXTURE_TEST_CASE(CleanDropsSimulationState, EngineFixture) {
    engine->spawnCharacter("goblin", Vector2D(0.0f, 0.0f), "Gob");

    engine->clean();

    BOOST_CHECK(!engine->isInitialized());
    BOOST_CHECK_EQUAL(engine->getEntityDataManager().size(), 0u);
    BOOST_CHECK_EQUAL(engine->getAIManager().getManagedEntityCount(), 0u);
    BOOST_CHECK(engine->getControllers().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SimulationTests)

BOOST_FIXTURE_TEST_CASE(SpawnRegistersNpcsWithAI, EngineFixture) {
    const EntityId hero = engine->spawnCharacter("warrior", Vector2D(0.0f, 0.0f), "Ada", 7);
    const EntityId goblin = engine->spawnCharacter("goblin", Vector2D(5.0f, 0.0f), "Gob");

    BOOST_CHECK_EQUAL(engine->spawnCharacter("dragon", Vector2D(), "Nope"), INVALID_ENTITY_ID);
    BOOST_CHECK(!engine->getAIManager().hasBrain(hero));
    BOOST_CHECK(engine->getAIManager().hasBrain(goblin));
    BOOST_CHECK_EQUAL(engine->getEntityDataManager().findPlayerByClient(7), hero);
    BOOST_CHECK_EQUAL(engine->getEntityDataManager().getEntity(goblin)->displayName, "Gob");
}

BOOST_FIXTURE_TEST_CASE(SpawnReplicatesOnNextTick, EngineFixture) {
    const EntityId goblin = engine->spawnCharacter("goblin", Vector2D(20.0f, 0.0f), "Gob");
    BOOST_CHECK(transport.packets.empty());

    run(1);

    BOOST_CHECK_EQUAL(transport.packets.size(), 1u);
    BOOST_CHECK_EQUAL(engine->getLastPacketRecordCount(), 3u);
    BOOST_CHECK_EQUAL(mirror.getMaxHitPoints(goblin).value_or(-1), 60);
    BOOST_CHECK_EQUAL(mirror.getHitPoints(goblin).value_or(-1), 60);

    run(1);
    BOOST_CHECK_EQUAL(transport.packets.size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(InputRequestDamagesNpcAndReplicates, EngineFixture) {
    const EntityId hero = engine->spawnCharacter("warrior", Vector2D(0.0f, 0.0f), "Ada", 7);
    const EntityId goblin = engine->spawnCharacter("goblin", Vector2D(1.0f, 0.0f), "Gob");

    engine->getEventManager().publish(ActionRequestEvent(hero, "slash", {goblin}));
    run(3);

    auto* controller = engine->getControllers().get<PlayerActionController>();
    BOOST_REQUIRE(controller != nullptr);
    BOOST_CHECK_EQUAL(controller->getAcceptedCount(), 1u);
    BOOST_CHECK_EQUAL(engine->getHealthManager().getHitPoints(goblin), 40);
    BOOST_CHECK_EQUAL(mirror.getHitPoints(goblin).value_or(-1), 40);

    // The struck goblin fights back
    BOOST_CHECK(engine->getAIManager().getBrain(goblin)->isHated(hero));
}

BOOST_FIXTURE_TEST_CASE(RejectedInputIsCounted, EngineFixture) {
    engine->getEventManager().publish(ActionRequestEvent(999, "slash"));

    auto* controller = engine->getControllers().get<PlayerActionController>();
    BOOST_CHECK_EQUAL(controller->getRejectedCount(), 1u);
    BOOST_REQUIRE(controller->getLastResult().has_value());
    BOOST_CHECK_EQUAL(*controller->getLastResult(), ActionRequestResult::UnknownEntity);
}

BOOST_FIXTURE_TEST_CASE(TickCounterAdvances, EngineFixture) {
    run(5);
    BOOST_CHECK_EQUAL(engine->getTickCount(), 5u);
    BOOST_CHECK_CLOSE(engine->getClock().now(), 0.5, 0.01);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SessionTests)

BOOST_FIXTURE_TEST_CASE(HostingLoadsLobbyScene, EngineFixture) {
    startHosting();

    BOOST_CHECK_EQUAL(engine->getConnectionManager().getCurrentStateId(), ConnectionStateId::Hosting);
    BOOST_CHECK_EQUAL(sceneLoader.lastScene(), "CharSelect");
    BOOST_REQUIRE(!sceneLoader.loads.empty());
    BOOST_CHECK(sceneLoader.loads.back().second);
}

BOOST_FIXTURE_TEST_CASE(LateJoinerTriggersFullSnapshot, EngineFixture) {
    engine->spawnCharacter("goblin", Vector2D(20.0f, 0.0f), "Gob");
    engine->spawnCharacter("goblin", Vector2D(30.0f, 0.0f), "Gob2");
    startHosting();
    run(1);
    const size_t packetsBefore = transport.packets.size();

    transport.fireApprovalRequest(5, ConnectionPayload{"player-5", "Late", false}.toJson());
    run(2);

    BOOST_REQUIRE_GT(transport.packets.size(), packetsBefore);
    BOOST_CHECK_EQUAL(transport.approvals.back().clientId, 5u);
    BOOST_CHECK(transport.approvals.back().approved);
    BOOST_CHECK_EQUAL(engine->getSessionManager().getConnectedCount(), 2u);

    // Every synced field of both goblins is resent
    std::vector<ReplicationRecord> records;
    BOOST_REQUIRE(ReplicationManager::decode(transport.packets[packetsBefore], records));
    BOOST_CHECK_EQUAL(records.size(), 6u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DespawnTests)

BOOST_FIXTURE_TEST_CASE(DespawnRemovesEntityFromEveryManager, EngineFixture) {
    const EntityId hero = engine->spawnCharacter("warrior", Vector2D(0.0f, 0.0f), "Ada", 7);
    const EntityId goblin = engine->spawnCharacter("goblin", Vector2D(1.0f, 0.0f), "Gob");
    int cancelled = 0;
    engine->getEventManager().subscribe<ActionLifecycleEvent>([&](const ActionLifecycleEvent& event) {
        if (event.getPhase() == ActionPhase::Cancelled) {
            ++cancelled;
        }
    });

    BOOST_REQUIRE_EQUAL(engine->getActionManager().requestAction(goblin, "claw", {hero}),
                        ActionRequestResult::Started);
    BOOST_REQUIRE(engine->getAIManager().hasBrain(goblin));

    BOOST_CHECK(engine->despawn(goblin));

    BOOST_CHECK(engine->getEntityDataManager().getEntity(goblin) == nullptr);
    BOOST_CHECK(!engine->getAIManager().hasBrain(goblin));
    BOOST_CHECK_EQUAL(engine->getActionManager().getQueueLength(goblin), 0u);
    BOOST_CHECK_EQUAL(cancelled, 1);
    BOOST_CHECK(!engine->despawn(goblin));

    // The cancelled claw never lands
    run(5);
    BOOST_CHECK_EQUAL(engine->getHealthManager().getHitPoints(hero), 150);
}

BOOST_FIXTURE_TEST_CASE(DespawnedPlayerIsDroppedByNpcsAndSession, EngineFixture) {
    SessionManager& sessions = engine->getSessionManager();
    sessions.setupConnectingPlayerSessionData(7, "player-7", "Ada");
    const EntityId hero = engine->spawnCharacter("warrior", Vector2D(0.0f, 0.0f), "Ada", 7);
    sessions.setPlayerEntity("player-7", hero);
    const EntityId goblin = engine->spawnCharacter("goblin", Vector2D(4.0f, 0.0f), "Gob");
    run(2);
    const AIBrain* brain = engine->getAIManager().getBrain(goblin);
    BOOST_REQUIRE(brain != nullptr);
    BOOST_REQUIRE_EQUAL(brain->getTarget(), hero);

    BOOST_CHECK(engine->despawn(hero));
    BOOST_CHECK_EQUAL(sessions.getPlayerData("player-7")->playerEntityId, INVALID_ENTITY_ID);
    BOOST_CHECK(sessions.getPlayerData("player-7")->isConnected);

    run(1);
    BOOST_CHECK(!brain->isHated(hero));
    BOOST_CHECK_EQUAL(brain->getTarget(), INVALID_ENTITY_ID);
    BOOST_CHECK_EQUAL(brain->getActiveStateName(), "Idle");
}

BOOST_AUTO_TEST_SUITE_END()

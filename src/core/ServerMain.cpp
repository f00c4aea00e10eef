/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "connection/ConnectionMethod.hpp"
#include "connection/ConnectionPayload.hpp"
#include "connection/LoopbackTransport.hpp"
#include "controllers/session/ISceneLoader.hpp"
#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include "core/ServerEngine.hpp"
#include "events/ActionEvents.hpp"
#include "events/ConnectionEvents.hpp"
#include "events/SceneChangeEvent.hpp"
#include "managers/SettingsManager.hpp"
#include <exception>
#include <limits>
#include <memory>
#include <string>

#ifndef VANGUARD_APP_NAME
#define VANGUARD_APP_NAME "VanguardServer"
#endif

namespace {

// Headless servers have no world to swap; the switch is only recorded
class HeadlessSceneLoader : public ISceneLoader {
public:
  void loadScene(const std::string& sceneId, bool networkSynchronized) override {
    ENGINE_INFO("Scene -> " + sceneId + (networkSynchronized ? " [synced]" : ""));
  }
};

const std::string HOST_PLAYER_ID{"host-player"};

EntityId findClosestAliveNpc(const EntityDataManager& entities, const Vector2D& from) {
  EntityId best = INVALID_ENTITY_ID;
  float bestDistance = std::numeric_limits<float>::max();
  for (EntityId id : entities.getEntityIds(EntityKind::NPC)) {
    const EntityRecord* npc = entities.getEntity(id);
    if (!npc || !npc->isAlive()) {
      continue;
    }
    const float distance = Vector2D::distanceSquared(from, npc->position);
    if (distance < bestDistance) {
      bestDistance = distance;
      best = id;
    }
  }
  return best;
}

size_t countAlive(const EntityDataManager& entities, EntityKind kind) {
  size_t count = 0;
  for (EntityId id : entities.getEntityIds(kind)) {
    if (entities.isAlive(id)) {
      ++count;
    }
  }
  return count;
}

void spawnDemoEncounter(ServerEngine& engine) {
  const EntityId hero = engine.spawnCharacter("warrior", Vector2D(0.0f, 0.0f),
                                              engine.getSettings().playerName,
                                              HOST_CLIENT_ID);
  engine.getSessionManager().setPlayerEntity(HOST_PLAYER_ID, hero);
  engine.spawnCharacter("archer", Vector2D(-2.0f, 1.0f), "Archer Companion");

  engine.spawnCharacter("goblin", Vector2D(9.0f, 0.0f), "Goblin Scout");
  engine.spawnCharacter("goblin", Vector2D(10.0f, 3.0f), "Goblin Raider");
  engine.spawnCharacter("skeleton", Vector2D(-9.0f, -2.0f), "Restless Skeleton");
  ENGINE_INFO("Demo encounter spawned: " + std::to_string(engine.getEntityDataManager().size()) +
              " entities");
}

// Players have no input device here; each idle player swings its first
// ready skill at the nearest enemy
void drivePlayers(ServerEngine& engine) {
  EntityDataManager& entities = engine.getEntityDataManager();
  ActionManager& actions = engine.getActionManager();
  for (EntityId id : entities.getEntityIds(EntityKind::Player)) {
    const EntityRecord* player = entities.getEntity(id);
    if (!player || !player->isAlive() || actions.getQueueLength(id) > 0) {
      continue;
    }
    CharacterClassPtr characterClass = engine.getCatalog().getClass(player->classId);
    if (!characterClass) {
      continue;
    }
    const EntityId target = findClosestAliveNpc(entities, player->position);
    if (target == INVALID_ENTITY_ID) {
      return;
    }
    for (const std::string& skill : characterClass->skills) {
      if (!actions.isOnCooldown(id, skill)) {
        engine.getEventManager().publish(ActionRequestEvent(id, skill, {target}));
        break;
      }
    }
  }
}

} // namespace

int main(int argc, char* argv[]) {
  ENGINE_INFO("Initializing " + std::string(VANGUARD_APP_NAME));

  const std::string settingsPath = argc > 1 ? argv[1] : "res/settings.json";
  VanguardEngine::SettingsManager settingsManager;
  if (!settingsManager.loadFromFile(settingsPath)) {
    ENGINE_WARN("Failed to load " + settingsPath + " - using defaults");
  } else {
    ENGINE_INFO("Settings loaded from " + settingsPath);
  }
  const VanguardEngine::ServerSettings settings = settingsManager.buildServerSettings();

  LoopbackTransport transport;
  HeadlessSceneLoader sceneLoader;
  ServerEngine engine(settings, transport, sceneLoader);

  try {
    if (!engine.init()) {
      ENGINE_CRITICAL("Init " + std::string(VANGUARD_APP_NAME) + " failed");
      return -1;
    }
  } catch (const std::exception& e) {
    ENGINE_CRITICAL("Exception during init: " + std::string(e.what()));
    return -1;
  }

  EventManager& bus = engine.getEventManager();
  bool encounterSpawned = false;
  bool encounterStarted = false;
  ScopedSubscription stateSubscription(
      bus, bus.subscribe<ConnectionStateChangedEvent>(
               [&](const ConnectionStateChangedEvent& event) {
                 if (event.getTo() == ConnectionStateId::Hosting && !encounterSpawned) {
                   spawnDemoEncounter(engine);
                   encounterSpawned = true;
                 }
               }));
  ScopedSubscription sessionSubscription(
      bus, bus.subscribe<ClientSessionEvent>([&](const ClientSessionEvent& event) {
        if (event.getChange() == ClientSessionChange::Connected &&
            event.getClientId() != HOST_CLIENT_ID) {
          const EntityId ally = engine.spawnCharacter("healer", Vector2D(-1.0f, -1.0f),
                                                      event.getPlayerName(),
                                                      event.getClientId());
          engine.getSessionManager().setPlayerEntity(event.getPlayerId(), ally);
        }
      }));

  engine.getConnectionManager().startHost(std::make_shared<DirectConnectionMethod>(
      "127.0.0.1", 7777, HOST_PLAYER_ID, settings.playerName, settings.debugBuild));

  GameLoop loop(settings.tickRate, settings.demoTicks);
  const uint64_t remoteJoinTick = static_cast<uint64_t>(settings.tickRate);
  loop.setUpdateHandler([&](float deltaTime) {
    engine.update(deltaTime);
    if (!encounterSpawned) {
      return;
    }
    if (!encounterStarted) {
      bus.publish(SceneChangeEvent("Encounter", true));
      encounterStarted = true;
    }

    if (engine.getTickCount() == remoteJoinTick) {
      ConnectionPayload payload{"ally-player", "Ally", settings.debugBuild};
      transport.connectRemoteClient(payload.toJson());
    }

    drivePlayers(engine);

    EntityDataManager& entities = engine.getEntityDataManager();
    if (countAlive(entities, EntityKind::NPC) == 0 ||
        countAlive(entities, EntityKind::Player) == 0) {
      ENGINE_INFO("Encounter resolved at tick " + std::to_string(engine.getTickCount()));
      loop.stop();
    }
  });

  ENGINE_INFO("Starting Main Loop");
  const bool cleanExit = loop.run();

  const EntityDataManager& entities = engine.getEntityDataManager();
  ENGINE_INFO("Players alive: " + std::to_string(countAlive(entities, EntityKind::Player)) +
              ", enemies alive: " + std::to_string(countAlive(entities, EntityKind::NPC)) +
              ", actions executed: " +
              std::to_string(engine.getActionManager().getExecutedCount()) +
              ", replication packets: " + std::to_string(transport.getPacketsBroadcast()));

  engine.getConnectionManager().requestShutdown();
  engine.update(1.0f / settings.tickRate);

  ENGINE_INFO(std::string(VANGUARD_APP_NAME) + " shutting down");
  stateSubscription.reset();
  sessionSubscription.reset();
  engine.clean();

  return cleanExit ? 0 : -1;
}

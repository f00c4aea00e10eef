/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ServerEngine.hpp"
#include "connection/INetworkTransport.hpp"
#include "controllers/combat/PlayerActionController.hpp"
#include "controllers/session/ISceneLoader.hpp"
#include "controllers/session/SceneController.hpp"
#include "core/Logger.hpp"
#include "events/ConnectionEvents.hpp"

using VanguardEngine::ServerSettings;

ServerEngine::ServerEngine(const ServerSettings &settings,
                           INetworkTransport &transport,
                           ISceneLoader &sceneLoader)
    : m_settings(settings), m_eventManager(settings.maxDeferredQueue),
      m_health(m_entityData, m_eventManager),
      m_actions(m_catalog, m_entityData, m_health, m_eventManager, m_clock),
      m_ai(m_entityData, m_actions, m_catalog, m_eventManager, settings.aiSeed),
      m_transport(transport), m_sceneLoader(sceneLoader),
      m_sessions(m_eventManager),
      m_connection(m_eventManager, m_timers, m_sessions, m_transport,
                   m_inbound, m_settings) {
  m_entityData.setReplicationSink(
      [this](const ReplicationRecord &record) { m_replication.record(record); });
  m_replication.setPacketSink([this](const BinarySerial::Buffer &packet) {
    m_transport.broadcast(packet);
  });
}

ServerEngine::~ServerEngine() {
  if (m_initialized) {
    clean();
  }
  m_replication.setPacketSink(nullptr);
  m_entityData.setReplicationSink(nullptr);
}

bool ServerEngine::init(const std::string &gameDataPath) {
  if (m_initialized) {
    ENGINE_WARN("ServerEngine already initialized");
    return true;
  }

  const std::string path =
      gameDataPath.empty() ? m_settings.gameDataPath : gameDataPath;
  if (!m_catalog.loadFromFile(path)) {
    ENGINE_CRITICAL("Failed to load game data from " + path);
    return false;
  }

  m_controllers.add<SceneController>(m_eventManager, m_sceneLoader);
  m_controllers.add<PlayerActionController>(m_eventManager, m_actions);
  m_controllers.subscribeAll();

  // Late joiners need every synced field, not just this tick's changes
  m_sessionSubscription = ScopedSubscription(
      m_eventManager,
      m_eventManager.subscribe<ClientSessionEvent>(
          [this](const ClientSessionEvent &event) {
            if (event.getChange() != ClientSessionChange::Disconnected) {
              m_entityData.emitFullSnapshot();
            }
          }));

  m_initialized = true;
  ENGINE_INFO("ServerEngine initialized at " +
              std::to_string(m_settings.tickRate) + " Hz with " +
              std::to_string(m_catalog.getActionIds().size()) + " actions");
  return true;
}

void ServerEngine::update(float deltaTime) {
  m_inbound.drain();
  m_clock.advance(deltaTime);
  m_timers.fireDue();
  m_eventManager.update();
  m_ai.update(deltaTime);
  m_actions.update(deltaTime);
  m_lastFlushCount = m_replication.flush();
}

void ServerEngine::clean() {
  ENGINE_INFO("Cleaning up ServerEngine");
  m_sessionSubscription.reset();
  m_controllers.clear();
  m_ai.resetBehaviors();
  m_actions.clear();
  m_entityData.clear();
  m_replication.clearPending();
  m_timers.clear();
  m_inbound.clear();
  m_initialized = false;
}

EntityId ServerEngine::spawnCharacter(const std::string &classId,
                                      const Vector2D &position,
                                      const std::string &displayName,
                                      ClientId ownerClientId) {
  CharacterClassPtr characterClass = m_catalog.getClass(classId);
  if (!characterClass) {
    ENGINE_ERROR("Unknown character class: " + classId);
    return INVALID_ENTITY_ID;
  }

  EntitySpawnParams params =
      EntitySpawnParams::fromClass(*characterClass, position);
  params.displayName = displayName;
  params.ownerClientId = ownerClientId;

  const EntityId id = m_entityData.createEntity(params);
  if (id == INVALID_ENTITY_ID) {
    return id;
  }
  if (params.kind == EntityKind::NPC && !m_ai.registerEntity(id)) {
    ENGINE_WARN("Spawned NPC " + displayName + " without a brain");
  }
  ENGINE_DEBUG("Spawned " + displayName + " (" + classId + ") as entity " +
               std::to_string(id));
  return id;
}

bool ServerEngine::despawn(EntityId id) {
  const EntityRecord *record = m_entityData.getEntity(id);
  if (!record) {
    ENGINE_WARN("despawn: unknown entity " + std::to_string(id));
    return false;
  }

  if (record->ownerClientId != INVALID_CLIENT_ID) {
    const SessionPlayerData *player =
        m_sessions.getPlayerDataByClient(record->ownerClientId);
    if (player && player->playerEntityId == id) {
      m_sessions.setPlayerEntity(player->playerId, INVALID_ENTITY_ID);
    }
  }

  m_ai.unregisterEntity(id);
  m_actions.cancelAll(id);
  m_actions.removeEntity(id);
  m_entityData.destroyEntity(id);
  ENGINE_DEBUG("Despawned entity " + std::to_string(id));
  return true;
}

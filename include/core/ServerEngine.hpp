/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SERVER_ENGINE_HPP
#define SERVER_ENGINE_HPP

/**
 * @file ServerEngine.hpp
 * @brief Owns every simulation system and runs them in tick order
 *
 * Members are declared in dependency order so construction wires each
 * system to the ones it needs and destruction tears them down in reverse.
 *
 * update(dt) order:
 *   1. drain InboundQueue (transport / connection-method callbacks)
 *   2. advance SimulationClock
 *   3. fire due timers
 *   4. drain deferred bus messages
 *   5. AI update
 *   6. action update
 *   7. replication flush
 */

#include "connection/ConnectionManager.hpp"
#include "connection/SessionManager.hpp"
#include "controllers/ControllerRegistry.hpp"
#include "core/InboundQueue.hpp"
#include "core/SimulationClock.hpp"
#include "core/TimerScheduler.hpp"
#include "data/GameDataCatalog.hpp"
#include "managers/AIManager.hpp"
#include "managers/ActionManager.hpp"
#include "managers/EntityDataManager.hpp"
#include "managers/EventManager.hpp"
#include "managers/HealthManager.hpp"
#include "managers/SettingsManager.hpp"
#include "replication/ReplicationManager.hpp"
#include "utils/Vector2D.hpp"
#include <string>

class INetworkTransport;
class ISceneLoader;

class ServerEngine {
public:
  ServerEngine(const VanguardEngine::ServerSettings &settings,
               INetworkTransport &transport, ISceneLoader &sceneLoader);
  ~ServerEngine();

  ServerEngine(const ServerEngine &) = delete;
  ServerEngine &operator=(const ServerEngine &) = delete;

  /**
   * @brief Loads the game data catalog and subscribes the controllers
   * @param gameDataPath Catalog file; empty uses ServerSettings::gameDataPath
   * @return false if the catalog could not be loaded
   */
  bool init(const std::string &gameDataPath = "");

  /**
   * @brief Runs one fixed simulation tick
   */
  void update(float deltaTime);

  /**
   * @brief Unsubscribes controllers and drops all simulation state
   */
  void clean();

  /**
   * @brief Spawns an entity from a catalog class; NPCs get a default brain
   * @return New entity id, or INVALID_ENTITY_ID for an unknown class
   */
  EntityId spawnCharacter(const std::string &classId, const Vector2D &position,
                          const std::string &displayName,
                          ClientId ownerClientId = INVALID_CLIENT_ID);

  /**
   * @brief Removes an entity from every manager: its brain, its action
   * queue (active instance cancelled) and its record. A player's session
   * entry stops pointing at it.
   * @note Call from tick-loop code, not from a handler fired by this
   * entity's own action or AI update
   * @return false for an unknown entity
   */
  bool despawn(EntityId id);

  bool isInitialized() const { return m_initialized; }
  uint64_t getTickCount() const { return m_clock.getTick(); }
  size_t getLastPacketRecordCount() const { return m_lastFlushCount; }

  const VanguardEngine::ServerSettings &getSettings() const { return m_settings; }
  VanguardEngine::SimulationClock &getClock() { return m_clock; }
  VanguardEngine::TimerScheduler &getTimers() { return m_timers; }
  VanguardEngine::InboundQueue &getInboundQueue() { return m_inbound; }
  EventManager &getEventManager() { return m_eventManager; }
  GameDataCatalog &getCatalog() { return m_catalog; }
  EntityDataManager &getEntityDataManager() { return m_entityData; }
  HealthManager &getHealthManager() { return m_health; }
  ActionManager &getActionManager() { return m_actions; }
  AIManager &getAIManager() { return m_ai; }
  ReplicationManager &getReplicationManager() { return m_replication; }
  SessionManager &getSessionManager() { return m_sessions; }
  ConnectionManager &getConnectionManager() { return m_connection; }
  ControllerRegistry &getControllers() { return m_controllers; }

private:
  const VanguardEngine::ServerSettings m_settings;

  VanguardEngine::SimulationClock m_clock;
  VanguardEngine::TimerScheduler m_timers{m_clock};
  VanguardEngine::InboundQueue m_inbound;
  EventManager m_eventManager;

  GameDataCatalog m_catalog;
  EntityDataManager m_entityData;
  HealthManager m_health;
  ActionManager m_actions;
  AIManager m_ai;
  ReplicationManager m_replication;

  INetworkTransport &m_transport;
  ISceneLoader &m_sceneLoader;
  SessionManager m_sessions;
  ConnectionManager m_connection;

  ControllerRegistry m_controllers;
  ScopedSubscription m_sessionSubscription;

  bool m_initialized{false};
  size_t m_lastFlushCount{0};
};

#endif // SERVER_ENGINE_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SESSION_MANAGER_HPP
#define SESSION_MANAGER_HPP

/**
 * @file SessionManager.hpp
 * @brief Host-side player data that survives reconnects
 *
 * Players are keyed by their stable player id. The transport's client id
 * changes on every connection, so it is remapped when a disconnected player
 * comes back. Before the session starts (the host leaving character select)
 * a disconnect forgets the player. After it starts, disconnected players'
 * data is kept until the session ends (onSessionEnded), and everything is
 * dropped when the server stops.
 */

#include "entities/EntityTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <string>
#include <vector>

class EventManager;

struct SessionPlayerData {
    std::string playerId;
    std::string playerName;
    ClientId clientId{INVALID_CLIENT_ID};
    EntityId playerEntityId{INVALID_ENTITY_ID};
    bool isConnected{false};
    int reconnectCount{0};
};

enum class SessionJoinResult : uint8_t { NewPlayer = 0, Reconnected, AlreadyConnected };

class SessionManager {
public:
    explicit SessionManager(EventManager& eventManager);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    bool isDuplicateConnection(const std::string& playerId) const;

    /**
     * @brief Registers an approved client, or reattaches a returning player
     * @return AlreadyConnected leaves everything untouched
     */
    SessionJoinResult setupConnectingPlayerSessionData(ClientId clientId, const std::string& playerId,
                                                       const std::string& playerName);

    // Marks the player disconnected but keeps the data for a reconnect
    bool disconnectClient(ClientId clientId);

    void setPlayerEntity(const std::string& playerId, EntityId entityId);

    std::optional<std::string> getPlayerId(ClientId clientId) const;
    const SessionPlayerData* getPlayerData(const std::string& playerId) const;
    const SessionPlayerData* getPlayerDataByClient(ClientId clientId) const;

    std::vector<ClientId> getConnectedClientIds() const;
    size_t getConnectedCount() const;
    size_t getPlayerCount() const { return m_players.size(); }

    bool hasSessionStarted() const { return m_sessionStarted; }

    void onSessionStarted();
    // Drops data of players that are not connected
    void onSessionEnded();
    // Drops everything
    void onServerEnded();

private:
    EventManager& m_eventManager;
    boost::container::flat_map<std::string, SessionPlayerData> m_players;
    boost::container::flat_map<ClientId, std::string> m_clientToPlayer;
    bool m_sessionStarted{false};
};

#endif // SESSION_MANAGER_HPP

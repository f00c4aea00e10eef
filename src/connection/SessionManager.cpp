/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/SessionManager.hpp"
#include "core/Logger.hpp"
#include "events/ConnectionEvents.hpp"
#include "managers/EventManager.hpp"

SessionManager::SessionManager(EventManager& eventManager) : m_eventManager(eventManager) {}

bool SessionManager::isDuplicateConnection(const std::string& playerId) const {
    auto it = m_players.find(playerId);
    return it != m_players.end() && it->second.isConnected;
}

SessionJoinResult SessionManager::setupConnectingPlayerSessionData(ClientId clientId,
                                                                   const std::string& playerId,
                                                                   const std::string& playerName) {
    auto it = m_players.find(playerId);
    if (it != m_players.end() && it->second.isConnected) {
        SESSION_WARN("Player " + playerId + " is already connected");
        return SessionJoinResult::AlreadyConnected;
    }

    if (it != m_players.end()) {
        SessionPlayerData& data = it->second;
        m_clientToPlayer.erase(data.clientId);
        data.clientId = clientId;
        data.playerName = playerName;
        data.isConnected = true;
        ++data.reconnectCount;
        m_clientToPlayer[clientId] = playerId;

        SESSION_INFO("Player " + playerName + " reconnected as client " + std::to_string(clientId));
        m_eventManager.publish(ClientSessionEvent(ClientSessionChange::Reconnected, clientId,
                                                  playerId, playerName));
        return SessionJoinResult::Reconnected;
    }

    SessionPlayerData data;
    data.playerId = playerId;
    data.playerName = playerName;
    data.clientId = clientId;
    data.isConnected = true;
    m_players.emplace(playerId, data);
    m_clientToPlayer[clientId] = playerId;

    SESSION_INFO("Player " + playerName + " joined as client " + std::to_string(clientId));
    m_eventManager.publish(ClientSessionEvent(ClientSessionChange::Connected, clientId, playerId,
                                              playerName));
    return SessionJoinResult::NewPlayer;
}

bool SessionManager::disconnectClient(ClientId clientId) {
    auto mapping = m_clientToPlayer.find(clientId);
    if (mapping == m_clientToPlayer.end()) {
        return false;
    }
    auto it = m_players.find(mapping->second);
    if (it == m_players.end() || !it->second.isConnected) {
        return false;
    }

    SessionPlayerData& data = it->second;
    data.isConnected = false;
    SESSION_INFO("Player " + data.playerName + " disconnected");
    m_eventManager.publish(ClientSessionEvent(ClientSessionChange::Disconnected, clientId,
                                              data.playerId, data.playerName));

    if (!m_sessionStarted) {
        // Nothing to come back to before the session starts
        m_clientToPlayer.erase(mapping);
        m_players.erase(it);
    }
    return true;
}

void SessionManager::setPlayerEntity(const std::string& playerId, EntityId entityId) {
    auto it = m_players.find(playerId);
    if (it != m_players.end()) {
        it->second.playerEntityId = entityId;
    }
}

std::optional<std::string> SessionManager::getPlayerId(ClientId clientId) const {
    auto it = m_clientToPlayer.find(clientId);
    if (it == m_clientToPlayer.end()) {
        return std::nullopt;
    }
    return it->second;
}

const SessionPlayerData* SessionManager::getPlayerData(const std::string& playerId) const {
    auto it = m_players.find(playerId);
    return it != m_players.end() ? &it->second : nullptr;
}

const SessionPlayerData* SessionManager::getPlayerDataByClient(ClientId clientId) const {
    auto playerId = getPlayerId(clientId);
    return playerId ? getPlayerData(*playerId) : nullptr;
}

std::vector<ClientId> SessionManager::getConnectedClientIds() const {
    std::vector<ClientId> ids;
    for (const auto& [clientId, playerId] : m_clientToPlayer) {
        const SessionPlayerData* data = getPlayerData(playerId);
        if (data && data->isConnected && data->clientId == clientId) {
            ids.push_back(clientId);
        }
    }
    return ids;
}

size_t SessionManager::getConnectedCount() const {
    size_t count = 0;
    for (const auto& [_, data] : m_players) {
        if (data.isConnected) {
            ++count;
        }
    }
    return count;
}

void SessionManager::onSessionStarted() {
    m_sessionStarted = true;
}

void SessionManager::onSessionEnded() {
    m_sessionStarted = false;
    for (auto it = m_players.begin(); it != m_players.end();) {
        if (it->second.isConnected) {
            ++it;
            continue;
        }
        m_clientToPlayer.erase(it->second.clientId);
        it = m_players.erase(it);
    }
}

void SessionManager::onServerEnded() {
    if (!m_players.empty()) {
        SESSION_INFO("Clearing " + std::to_string(m_players.size()) + " player session(s)");
    }
    m_players.clear();
    m_clientToPlayer.clear();
    m_sessionStarted = false;
}

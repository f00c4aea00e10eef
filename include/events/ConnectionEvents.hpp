/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECTION_EVENTS_HPP
#define CONNECTION_EVENTS_HPP

/**
 * @file ConnectionEvents.hpp
 * @brief Notifications published by the connection state machine
 *
 * Presentation subscribes to these for status popups and loading screens;
 * ServerEngine subscribes to ClientSessionEvent to spawn and despawn
 * player avatars.
 */

#include "connection/ConnectStatus.hpp"
#include "entities/EntityTypes.hpp"
#include "events/Event.hpp"
#include <string>
#include <utility>

class ConnectionStateChangedEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::ConnectionStateChanged;

    ConnectionStateChangedEvent(ConnectionStateId from, ConnectionStateId to)
        : m_from(from), m_to(to) {}

    std::string getName() const override { return "ConnectionStateChangedEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] ConnectionStateId getFrom() const { return m_from; }
    [[nodiscard]] ConnectionStateId getTo() const { return m_to; }

private:
    ConnectionStateId m_from;
    ConnectionStateId m_to;
};

// Approval results, disconnect reasons and session failures
class ConnectStatusEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::ConnectStatus;

    explicit ConnectStatusEvent(ConnectStatus status, std::string message = "")
        : m_status(status)
        , m_message(message.empty() ? std::string(describe(status)) : std::move(message)) {}

    std::string getName() const override { return "ConnectStatusEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] ConnectStatus getStatus() const { return m_status; }
    [[nodiscard]] const std::string& getMessage() const { return m_message; }

private:
    ConnectStatus m_status;
    std::string m_message;
};

class ReconnectAttemptEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::ReconnectAttempt;

    ReconnectAttemptEvent(int attempt, int maxAttempts)
        : m_attempt(attempt), m_maxAttempts(maxAttempts) {}

    std::string getName() const override { return "ReconnectAttemptEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] int getAttempt() const { return m_attempt; }
    [[nodiscard]] int getMaxAttempts() const { return m_maxAttempts; }

private:
    int m_attempt;
    int m_maxAttempts;
};

enum class ClientSessionChange : uint8_t { Connected = 0, Reconnected, Disconnected };

// Host side: a player's session was created, resumed or dropped
class ClientSessionEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::ClientSession;

    ClientSessionEvent(ClientSessionChange change, ClientId clientId,
                       std::string playerId, std::string playerName)
        : m_change(change)
        , m_clientId(clientId)
        , m_playerId(std::move(playerId))
        , m_playerName(std::move(playerName)) {}

    std::string getName() const override { return "ClientSessionEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] ClientSessionChange getChange() const { return m_change; }
    [[nodiscard]] ClientId getClientId() const { return m_clientId; }
    [[nodiscard]] const std::string& getPlayerId() const { return m_playerId; }
    [[nodiscard]] const std::string& getPlayerName() const { return m_playerName; }

private:
    ClientSessionChange m_change;
    ClientId m_clientId;
    std::string m_playerId;
    std::string m_playerName;
};

#endif // CONNECTION_EVENTS_HPP

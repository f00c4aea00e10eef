/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECTION_METHOD_HPP
#define CONNECTION_METHOD_HPP

/**
 * @file ConnectionMethod.hpp
 * @brief How a host or client reaches the session (direct address, relay...)
 *
 * Setup operations are asynchronous: they may complete on any thread by
 * invoking the callback once. ConnectionManager marshals the result back
 * onto the tick loop.
 */

#include "connection/ConnectionPayload.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

enum class ConnectionMethodResult : uint8_t {
    Success = 0,
    Failed,
    SessionNotFound // Remote session is gone; reconnecting is pointless
};

inline std::ostream& operator<<(std::ostream& os, ConnectionMethodResult result) {
    switch (result) {
    case ConnectionMethodResult::Success: return os << "Success";
    case ConnectionMethodResult::Failed: return os << "Failed";
    case ConnectionMethodResult::SessionNotFound: return os << "SessionNotFound";
    }
    return os << "Unknown";
}

class ConnectionMethod {
public:
    using SetupCallback = std::function<void(ConnectionMethodResult result)>;

    ConnectionMethod(std::string playerId, std::string playerName, bool isDebug)
        : m_playerId(std::move(playerId)), m_playerName(std::move(playerName)), m_isDebug(isDebug) {}
    virtual ~ConnectionMethod() = default;

    virtual void setupHostConnection(SetupCallback callback) = 0;
    virtual void setupClientConnection(SetupCallback callback) = 0;
    virtual void setupClientReconnection(SetupCallback callback) = 0;

    virtual std::string getName() const = 0;

    ConnectionPayload buildPayload() const { return {m_playerId, m_playerName, m_isDebug}; }
    const std::string& getPlayerId() const { return m_playerId; }
    const std::string& getPlayerName() const { return m_playerName; }

protected:
    std::string m_playerId;
    std::string m_playerName;
    bool m_isDebug;
};

/**
 * @brief Connects straight to an address; nothing to allocate, so setup
 * always succeeds immediately
 */
class DirectConnectionMethod : public ConnectionMethod {
public:
    DirectConnectionMethod(std::string address, uint16_t port, std::string playerId,
                           std::string playerName, bool isDebug);

    void setupHostConnection(SetupCallback callback) override;
    void setupClientConnection(SetupCallback callback) override;
    void setupClientReconnection(SetupCallback callback) override;

    std::string getName() const override { return "Direct"; }

    const std::string& getAddress() const { return m_address; }
    uint16_t getPort() const { return m_port; }

private:
    std::string m_address;
    uint16_t m_port;
};

#endif // CONNECTION_METHOD_HPP

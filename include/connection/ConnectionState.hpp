/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECTION_STATE_HPP
#define CONNECTION_STATE_HPP

#include "connection/ConnectStatus.hpp"
#include "entities/EntityTypes.hpp"
#include <memory>
#include <string>

class ConnectionManager;
class ConnectionMethod;

/**
 * @brief One node of the connection state machine
 *
 * Every notification has a no-op default; a state overrides only the ones
 * it reacts to, so anything else is ignored.
 */
class ConnectionState {
public:
    explicit ConnectionState(ConnectionManager& manager) : m_manager(manager) {}
    virtual ~ConnectionState() = default;

    ConnectionState(const ConnectionState&) = delete;
    ConnectionState& operator=(const ConnectionState&) = delete;

    virtual void enter() = 0;
    virtual void exit() = 0;
    virtual ConnectionStateId getId() const = 0;

    std::string getName() const { return toString(getId()); }

    virtual void onClientConnected([[maybe_unused]] ClientId clientId) {}
    virtual void onClientDisconnect([[maybe_unused]] ClientId clientId,
                                    [[maybe_unused]] ConnectStatus reason) {}
    virtual void onServerStarted() {}
    virtual void onServerStopped() {}
    virtual void onTransportFailure() {}

    virtual void startHostRequest([[maybe_unused]] std::shared_ptr<ConnectionMethod> method) {}
    virtual void startClientRequest([[maybe_unused]] std::shared_ptr<ConnectionMethod> method) {}
    virtual void onUserRequestedShutdown() {}

    virtual void approvalCheck([[maybe_unused]] ClientId clientId,
                               [[maybe_unused]] const std::string& payload) {}

protected:
    ConnectionManager& m_manager;
};

#endif // CONNECTION_STATE_HPP

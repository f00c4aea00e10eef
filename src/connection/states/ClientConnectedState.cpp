/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionManager.hpp"
#include "connection/ConnectionStates.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

void ClientConnectedState::enter() {
    CONNECTION_INFO("Connected to host");
}

void ClientConnectedState::onClientDisconnect(ClientId clientId, ConnectStatus reason) {
    if (clientId != m_manager.getTransport().getLocalClientId()) {
        return;
    }

    const VanguardEngine::ServerSettings& settings = m_manager.getSettings();
    const bool canReconnect = settings.reconnectionEnabled && settings.maxReconnectAttempts > 0 &&
                              !forbidsReconnect(reason);
    if (!canReconnect) {
        m_manager.publishStatus(reason == ConnectStatus::Undefined ? ConnectStatus::GenericDisconnect
                                                                   : reason);
        m_manager.changeState(ConnectionStateId::Offline);
        return;
    }

    m_manager.publishStatus(ConnectStatus::Reconnecting);
    m_manager.changeState(ConnectionStateId::ClientReconnecting);
}

void ClientConnectedState::onTransportFailure() {
    onClientDisconnect(m_manager.getTransport().getLocalClientId(), ConnectStatus::GenericDisconnect);
}

void ClientConnectedState::onUserRequestedShutdown() {
    m_manager.publishStatus(ConnectStatus::UserRequestedDisconnect);
    m_manager.changeState(ConnectionStateId::Offline);
}

bool ClientConnectedState::forbidsReconnect(ConnectStatus reason) {
    switch (reason) {
        case ConnectStatus::HostEndedSession:
        case ConnectStatus::LoggedInAgain:
        case ConnectStatus::ServerFull:
        case ConnectStatus::IncompatibleBuildType:
        case ConnectStatus::UserRequestedDisconnect:
            return true;
        default:
            return false;
    }
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionManager.hpp"
#include "connection/ConnectionPayload.hpp"
#include "connection/ConnectionStates.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

void ClientConnectingState::enter() {
    const VanguardEngine::ServerSettings& settings = m_manager.getSettings();
    if (settings.connectTimeoutSeconds > 0.0f) {
        m_timeoutTimer = m_manager.getTimers().schedule(settings.connectTimeoutSeconds, [this]() {
            m_timeoutTimer = VanguardEngine::INVALID_TIMER_ID;
            connectFailed(ConnectStatus::ConnectTimeout);
        });
    }

    std::shared_ptr<ConnectionMethod> method = m_manager.getConnectionMethod();
    if (!method) {
        connectFailed(ConnectStatus::StartClientFailed);
        return;
    }

    CONNECTION_INFO("Connecting via " + method->getName());
    method->setupClientConnection(
        m_manager.makeMethodCallback([this, method](ConnectionMethodResult result) {
            if (result != ConnectionMethodResult::Success) {
                connectFailed(ConnectStatus::StartClientFailed);
                return;
            }
            if (!m_manager.getTransport().startClient(method->buildPayload().toJson())) {
                connectFailed(ConnectStatus::StartClientFailed);
            }
        }));
}

void ClientConnectingState::exit() {
    cancelTimeout();
}

void ClientConnectingState::onClientConnected(ClientId clientId) {
    if (clientId != m_manager.getTransport().getLocalClientId()) {
        return;
    }
    m_manager.publishStatus(ConnectStatus::Success);
    m_manager.changeState(ConnectionStateId::ClientConnected);
}

void ClientConnectingState::onClientDisconnect(ClientId clientId, ConnectStatus reason) {
    if (clientId != m_manager.getTransport().getLocalClientId()) {
        return;
    }
    connectFailed(reason == ConnectStatus::Undefined ? ConnectStatus::StartClientFailed : reason);
}

void ClientConnectingState::onUserRequestedShutdown() {
    m_manager.publishStatus(ConnectStatus::UserRequestedDisconnect);
    m_manager.changeState(ConnectionStateId::Offline);
}

void ClientConnectingState::connectFailed(ConnectStatus reason) {
    m_manager.publishStatus(reason);
    m_manager.changeState(ConnectionStateId::Offline);
}

void ClientConnectingState::cancelTimeout() {
    if (m_timeoutTimer != VanguardEngine::INVALID_TIMER_ID) {
        m_manager.getTimers().cancel(m_timeoutTimer);
        m_timeoutTimer = VanguardEngine::INVALID_TIMER_ID;
    }
}

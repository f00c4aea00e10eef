/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionManager.hpp"
#include "connection/ConnectionPayload.hpp"
#include "connection/ConnectionStates.hpp"
#include "core/Logger.hpp"
#include "events/ConnectionEvents.hpp"
#include "managers/EventManager.hpp"
#include "managers/SettingsManager.hpp"

void ClientReconnectingState::enter() {
    m_attempts = 0;
    m_setupAttempt = 0;
    m_awaitingTransport = false;
    m_timer = m_manager.getTimers().schedule(m_manager.getSettings().firstReconnectDelaySeconds,
                                             [this]() {
                                                 m_timer = VanguardEngine::INVALID_TIMER_ID;
                                                 attempt();
                                             });
}

void ClientReconnectingState::exit() {
    cancelTimer();
    m_awaitingTransport = false;
    m_setupAttempt = 0;
}

void ClientReconnectingState::onClientConnected(ClientId clientId) {
    if (!m_awaitingTransport || clientId != m_manager.getTransport().getLocalClientId()) {
        return;
    }
    cancelTimer();
    CONNECTION_INFO("Reconnected after " + std::to_string(m_attempts) + " attempt(s)");
    m_manager.publishStatus(ConnectStatus::Success);
    m_manager.changeState(ConnectionStateId::ClientConnected);
}

void ClientReconnectingState::onClientDisconnect(ClientId clientId, ConnectStatus reason) {
    if (!m_awaitingTransport || clientId != m_manager.getTransport().getLocalClientId()) {
        return;
    }
    switch (reason) {
        case ConnectStatus::HostEndedSession:
        case ConnectStatus::LoggedInAgain:
        case ConnectStatus::ServerFull:
        case ConnectStatus::IncompatibleBuildType:
            giveUp(reason);
            return;
        default:
            attemptFailed();
            return;
    }
}

void ClientReconnectingState::onUserRequestedShutdown() {
    m_manager.publishStatus(ConnectStatus::UserRequestedDisconnect);
    m_manager.changeState(ConnectionStateId::Offline);
}

void ClientReconnectingState::attempt() {
    const VanguardEngine::ServerSettings& settings = m_manager.getSettings();
    if (m_attempts >= settings.maxReconnectAttempts) {
        giveUp(ConnectStatus::ReconnectionExhausted);
        return;
    }

    ++m_attempts;
    CONNECTION_INFO("Reconnect attempt " + std::to_string(m_attempts) + "/" +
                    std::to_string(settings.maxReconnectAttempts));
    m_manager.getEventManager().publish(ReconnectAttemptEvent(m_attempts, settings.maxReconnectAttempts));

    INetworkTransport& transport = m_manager.getTransport();
    if (transport.isActive()) {
        transport.shutdown();
    }

    std::shared_ptr<ConnectionMethod> method = m_manager.getConnectionMethod();
    if (!method) {
        giveUp(ConnectStatus::ReconnectionExhausted);
        return;
    }

    // The timeout covers the whole attempt, including a setup that never answers
    if (settings.connectTimeoutSeconds > 0.0f) {
        m_timer = m_manager.getTimers().schedule(settings.connectTimeoutSeconds, [this]() {
            m_timer = VanguardEngine::INVALID_TIMER_ID;
            CONNECTION_WARN("Reconnect attempt " + std::to_string(m_attempts) + " timed out");
            attemptFailed();
        });
    }

    m_setupAttempt = m_attempts;
    const int attemptNumber = m_attempts;
    method->setupClientReconnection(
        m_manager.makeMethodCallback([this, method, attemptNumber](ConnectionMethodResult result) {
            if (attemptNumber != m_setupAttempt) {
                return; // Answer for an attempt that already failed
            }
            m_setupAttempt = 0;
            if (result == ConnectionMethodResult::SessionNotFound) {
                giveUp(ConnectStatus::HostEndedSession);
                return;
            }
            if (result != ConnectionMethodResult::Success ||
                !m_manager.getTransport().startClient(method->buildPayload().toJson())) {
                attemptFailed();
                return;
            }
            m_awaitingTransport = true;
        }));
}

void ClientReconnectingState::attemptFailed() {
    cancelTimer();
    m_awaitingTransport = false;
    m_setupAttempt = 0;

    const VanguardEngine::ServerSettings& settings = m_manager.getSettings();
    if (m_attempts >= settings.maxReconnectAttempts) {
        giveUp(ConnectStatus::ReconnectionExhausted);
        return;
    }

    CONNECTION_WARN("Reconnect attempt " + std::to_string(m_attempts) + " failed");
    m_timer = m_manager.getTimers().schedule(settings.reconnectIntervalSeconds, [this]() {
        m_timer = VanguardEngine::INVALID_TIMER_ID;
        attempt();
    });
}

void ClientReconnectingState::giveUp(ConnectStatus reason) {
    m_manager.publishStatus(reason);
    m_manager.changeState(ConnectionStateId::Offline);
}

void ClientReconnectingState::cancelTimer() {
    if (m_timer != VanguardEngine::INVALID_TIMER_ID) {
        m_manager.getTimers().cancel(m_timer);
        m_timer = VanguardEngine::INVALID_TIMER_ID;
    }
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionManager.hpp"
#include "connection/ConnectionPayload.hpp"
#include "connection/ConnectionStates.hpp"
#include "connection/SessionManager.hpp"
#include "core/Logger.hpp"
#include "events/SceneChangeEvent.hpp"
#include "managers/EventManager.hpp"

namespace {
const std::string CHAR_SELECT_SCENE{"CharSelect"};
}

void HostingState::enter() {
    SessionManager& sessions = m_manager.getSessions();

    // The host plays too; register it so its own id counts as connected
    if (auto method = m_manager.getConnectionMethod()) {
        ConnectionPayload payload = method->buildPayload();
        sessions.setupConnectingPlayerSessionData(m_manager.getTransport().getLocalClientId(),
                                                  payload.playerId, payload.playerName);
    }

    EventManager& bus = m_manager.getEventManager();
    bus.publish(SceneChangeEvent(CHAR_SELECT_SCENE, true));
    m_sceneSubscription = ScopedSubscription(
        bus, bus.subscribe<SceneChangeEvent>(
                 [this](const SceneChangeEvent& event) { onSceneChanged(event); }));
}

void HostingState::exit() {
    m_sceneSubscription.reset();
    m_manager.getSessions().onSessionEnded();
}

void HostingState::onSceneChanged(const SceneChangeEvent& event) {
    SessionManager& sessions = m_manager.getSessions();
    if (!event.isNetworkSynchronized() || event.getSceneId() == CHAR_SELECT_SCENE ||
        sessions.hasSessionStarted()) {
        return;
    }
    sessions.onSessionStarted();
    CONNECTION_INFO("Session started in scene " + event.getSceneId());
}

void HostingState::onClientConnected(ClientId clientId) {
    if (clientId == m_manager.getTransport().getLocalClientId()) {
        return;
    }
    CONNECTION_INFO("Client " + std::to_string(clientId) + " connected");
}

void HostingState::onClientDisconnect(ClientId clientId, [[maybe_unused]] ConnectStatus reason) {
    if (clientId == m_manager.getTransport().getLocalClientId()) {
        return;
    }
    if (m_manager.getSessions().disconnectClient(clientId)) {
        CONNECTION_INFO("Client " + std::to_string(clientId) + " left the session");
    }
}

void HostingState::onServerStopped() {
    m_manager.publishStatus(ConnectStatus::GenericDisconnect);
    m_manager.changeState(ConnectionStateId::Offline);
}

void HostingState::onUserRequestedShutdown() {
    INetworkTransport& transport = m_manager.getTransport();
    const ClientId local = transport.getLocalClientId();
    for (ClientId clientId : m_manager.getSessions().getConnectedClientIds()) {
        if (clientId != local) {
            transport.disconnectClient(clientId, ConnectStatus::HostEndedSession);
        }
    }
    m_manager.publishStatus(ConnectStatus::UserRequestedDisconnect);
    m_manager.changeState(ConnectionStateId::Offline);
}

void HostingState::approvalCheck(ClientId clientId, const std::string& payload) {
    INetworkTransport& transport = m_manager.getTransport();
    const ConnectStatus status = m_manager.evaluateApproval(payload);
    if (status != ConnectStatus::Success) {
        CONNECTION_INFO("Rejected client " + std::to_string(clientId) + ": " + toString(status));
        transport.respondToApproval(clientId, false, status);
        return;
    }

    auto parsed = ConnectionPayload::fromJson(payload);
    if (!parsed) {
        transport.respondToApproval(clientId, false, ConnectStatus::InvalidPayload);
        return;
    }
    m_manager.getSessions().setupConnectingPlayerSessionData(clientId, parsed->playerId,
                                                             parsed->playerName);
    transport.respondToApproval(clientId, true, ConnectStatus::Success);
}

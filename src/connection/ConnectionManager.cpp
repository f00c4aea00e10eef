/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionManager.hpp"
#include "connection/ConnectionPayload.hpp"
#include "connection/ConnectionStates.hpp"
#include "connection/SessionManager.hpp"
#include "core/InboundQueue.hpp"
#include "core/Logger.hpp"
#include "events/ConnectionEvents.hpp"
#include "managers/EventManager.hpp"
#include "managers/SettingsManager.hpp"

using VanguardEngine::InboundQueue;
using VanguardEngine::ServerSettings;
using VanguardEngine::TimerScheduler;

ConnectionManager::ConnectionManager(EventManager& eventManager, TimerScheduler& timers,
                                     SessionManager& sessions, INetworkTransport& transport,
                                     InboundQueue& inbound, const ServerSettings& settings)
    : m_eventManager(eventManager)
    , m_timers(timers)
    , m_sessions(sessions)
    , m_transport(transport)
    , m_inbound(inbound)
    , m_settings(settings)
    , mp_alive(std::make_shared<bool>(true)) {
    m_states[index(ConnectionStateId::Offline)] = std::make_unique<OfflineState>(*this);
    m_states[index(ConnectionStateId::StartingHost)] = std::make_unique<StartingHostState>(*this);
    m_states[index(ConnectionStateId::Hosting)] = std::make_unique<HostingState>(*this);
    m_states[index(ConnectionStateId::ClientConnecting)] = std::make_unique<ClientConnectingState>(*this);
    m_states[index(ConnectionStateId::ClientConnected)] = std::make_unique<ClientConnectedState>(*this);
    m_states[index(ConnectionStateId::ClientReconnecting)] =
        std::make_unique<ClientReconnectingState>(*this);

    m_transport.setListener(this);

    mp_current = m_states[index(ConnectionStateId::Offline)].get();
    m_transitioning = true;
    ++m_enterCounts[index(ConnectionStateId::Offline)];
    mp_current->enter();
    m_transitioning = false;
    CONNECTION_INFO("ConnectionManager initialized in Offline");
}

ConnectionManager::~ConnectionManager() {
    mp_alive.reset();
    m_transport.setListener(nullptr);
}

void ConnectionManager::startHost(std::shared_ptr<ConnectionMethod> method) {
    mp_current->startHostRequest(std::move(method));
}

void ConnectionManager::startClient(std::shared_ptr<ConnectionMethod> method) {
    mp_current->startClientRequest(std::move(method));
}

void ConnectionManager::requestShutdown() {
    mp_current->onUserRequestedShutdown();
}

void ConnectionManager::onServerStarted() {
    postToState([](ConnectionState& state) { state.onServerStarted(); });
}

void ConnectionManager::onServerStopped() {
    postToState([](ConnectionState& state) { state.onServerStopped(); });
}

void ConnectionManager::onClientConnected(ClientId clientId) {
    postToState([clientId](ConnectionState& state) { state.onClientConnected(clientId); });
}

void ConnectionManager::onClientDisconnected(ClientId clientId, ConnectStatus reason) {
    postToState([clientId, reason](ConnectionState& state) { state.onClientDisconnect(clientId, reason); });
}

void ConnectionManager::onApprovalRequest(ClientId clientId, const std::string& payload) {
    postToState([clientId, payload](ConnectionState& state) { state.approvalCheck(clientId, payload); });
}

void ConnectionManager::onTransportFailure() {
    postToState([](ConnectionState& state) { state.onTransportFailure(); });
}

void ConnectionManager::changeState(ConnectionStateId next) {
    if (m_transitioning) {
        m_pendingTransitions.push_back(next);
        return;
    }

    m_transitioning = true;
    applyTransition(next);
    while (!m_pendingTransitions.empty()) {
        ConnectionStateId queued = m_pendingTransitions.front();
        m_pendingTransitions.pop_front();
        applyTransition(queued);
    }
    m_transitioning = false;
}

void ConnectionManager::applyTransition(ConnectionStateId next) {
    const ConnectionStateId from = mp_current->getId();
    if (next == from) {
        CONNECTION_DEBUG("Already in " + mp_current->getName() + "; transition ignored");
        return;
    }

    mp_current->exit();
    ++m_exitCounts[index(from)];

    mp_current = m_states[index(next)].get();
    ++m_transitionCount;
    CONNECTION_INFO(std::string(toString(from)) + " -> " + toString(next));
    m_eventManager.publish(ConnectionStateChangedEvent(from, next));

    ++m_enterCounts[index(next)];
    mp_current->enter();
}

const ConnectionState& ConnectionManager::getState(ConnectionStateId id) const {
    return *m_states[index(id)];
}

ConnectStatus ConnectionManager::evaluateApproval(const std::string& payload) const {
    if (payload.size() > m_settings.maxPayloadBytes) {
        return ConnectStatus::PayloadTooLarge;
    }
    auto parsed = ConnectionPayload::fromJson(payload);
    if (!parsed) {
        return ConnectStatus::InvalidPayload;
    }
    if (m_sessions.isDuplicateConnection(parsed->playerId)) {
        return ConnectStatus::LoggedInAgain;
    }
    if (m_transport.getConnectedClientCount() >= static_cast<size_t>(m_settings.maxConnectedPlayers)) {
        return ConnectStatus::ServerFull;
    }
    if (parsed->isDebug != m_settings.debugBuild) {
        return ConnectStatus::IncompatibleBuildType;
    }
    return ConnectStatus::Success;
}

void ConnectionManager::publishStatus(ConnectStatus status) {
    m_lastStatus = status;
    if (status == ConnectStatus::Success || status == ConnectStatus::Reconnecting) {
        CONNECTION_INFO(std::string("Status: ") + toString(status));
    } else {
        CONNECTION_WARN(std::string("Status: ") + toString(status) + " - " + describe(status));
    }
    m_eventManager.publish(ConnectStatusEvent(status));
}

std::function<void(ConnectionMethodResult)>
ConnectionManager::makeMethodCallback(std::function<void(ConnectionMethodResult)> onTick) {
    std::weak_ptr<bool> alive = mp_alive;
    const uint64_t epoch = m_transitionCount;
    return [this, alive, epoch, onTick = std::move(onTick)](ConnectionMethodResult result) {
        m_inbound.post([this, alive, epoch, onTick, result]() {
            if (alive.expired()) {
                return;
            }
            if (epoch != m_transitionCount) {
                CONNECTION_DEBUG("Dropping connection method result for a state that was left");
                return;
            }
            onTick(result);
        });
    };
}

void ConnectionManager::postToState(std::function<void(ConnectionState&)> task) {
    std::weak_ptr<bool> alive = mp_alive;
    m_inbound.post([this, alive, task = std::move(task)]() {
        if (!alive.expired()) {
            task(*mp_current);
        }
    });
}

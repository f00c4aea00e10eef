/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/LoopbackTransport.hpp"
#include "core/Logger.hpp"
#include <vector>

bool LoopbackTransport::startHost() {
    if (m_active) {
        TRANSPORT_WARN("startHost called while already active");
        return false;
    }

    m_active = true;
    m_isHost = true;
    m_localClientId = HOST_CLIENT_ID;
    m_connected.clear();
    m_pendingApproval.clear();
    m_disconnectReasons.clear();
    m_connected.insert(m_localClientId);
    TRANSPORT_INFO("Loopback host started");

    if (mp_listener) {
        mp_listener->onServerStarted();
        mp_listener->onClientConnected(m_localClientId);
    }
    return true;
}

bool LoopbackTransport::startClient(const std::string& payload) {
    if (m_active) {
        TRANSPORT_WARN("startClient called while already active");
        return false;
    }
    if (payload.empty()) {
        TRANSPORT_ERROR("startClient called with an empty payload");
        return false;
    }

    m_active = true;
    m_isHost = false;
    m_localClientId = m_nextClientId++;
    m_connected.clear();
    m_connected.insert(m_localClientId);
    TRANSPORT_INFO("Loopback client " + std::to_string(m_localClientId) + " connected");

    if (mp_listener) {
        mp_listener->onClientConnected(m_localClientId);
    }
    return true;
}

void LoopbackTransport::shutdown() {
    if (!m_active) {
        return;
    }

    const bool wasHost = m_isHost;
    const ClientId local = m_localClientId;
    std::vector<ClientId> remotes;
    for (ClientId id : m_connected) {
        if (id != local) {
            remotes.push_back(id);
        }
    }

    m_active = false;
    m_isHost = false;
    m_connected.clear();
    m_pendingApproval.clear();
    TRANSPORT_INFO(wasHost ? "Loopback host stopped" : "Loopback client stopped");

    if (!mp_listener) {
        return;
    }
    for (ClientId id : remotes) {
        m_disconnectReasons[id] = ConnectStatus::HostEndedSession;
        mp_listener->onClientDisconnected(id, ConnectStatus::HostEndedSession);
    }
    mp_listener->onClientDisconnected(local, ConnectStatus::UserRequestedDisconnect);
    if (wasHost) {
        mp_listener->onServerStopped();
    }
}

void LoopbackTransport::respondToApproval(ClientId clientId, bool approved, ConnectStatus reason) {
    if (m_pendingApproval.erase(clientId) == 0) {
        TRANSPORT_WARN("Approval response for unknown client " + std::to_string(clientId));
        return;
    }

    if (approved) {
        m_connected.insert(clientId);
        if (mp_listener) {
            mp_listener->onClientConnected(clientId);
        }
        return;
    }

    m_disconnectReasons[clientId] = reason;
    if (mp_listener) {
        mp_listener->onClientDisconnected(clientId, reason);
    }
}

void LoopbackTransport::disconnectClient(ClientId clientId, ConnectStatus reason) {
    if (m_connected.erase(clientId) == 0) {
        return;
    }
    m_disconnectReasons[clientId] = reason;
    TRANSPORT_DEBUG("Disconnected client " + std::to_string(clientId) + ": " + toString(reason));
    if (mp_listener) {
        mp_listener->onClientDisconnected(clientId, reason);
    }
}

void LoopbackTransport::broadcast(const BinarySerial::Buffer& packet) {
    if (!m_active) {
        return;
    }
    ++m_packetsBroadcast;
    m_lastPacketSize = packet.size();
    if (m_receiver) {
        m_receiver(packet);
    }
}

ClientId LoopbackTransport::connectRemoteClient(const std::string& payload) {
    if (!isHost()) {
        TRANSPORT_WARN("connectRemoteClient requires an active host");
        return 0;
    }

    const ClientId id = m_nextClientId++;
    m_pendingApproval.insert(id);
    if (mp_listener) {
        mp_listener->onApprovalRequest(id, payload);
    }
    return id;
}

void LoopbackTransport::dropRemoteClient(ClientId clientId) {
    disconnectClient(clientId, ConnectStatus::GenericDisconnect);
}

std::optional<ConnectStatus> LoopbackTransport::getDisconnectReason(ClientId clientId) const {
    auto it = m_disconnectReasons.find(clientId);
    if (it == m_disconnectReasons.end()) {
        return std::nullopt;
    }
    return it->second;
}

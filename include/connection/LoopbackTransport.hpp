/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOOPBACK_TRANSPORT_HPP
#define LOOPBACK_TRANSPORT_HPP

/**
 * @file LoopbackTransport.hpp
 * @brief In-process transport used by the headless server and the demo
 *
 * As host the local client is HOST_CLIENT_ID and remote peers are simulated
 * with connectRemoteClient(). As client it connects to an implicit host that
 * accepts immediately. Listener notifications are delivered synchronously;
 * ConnectionManager defers them to the next tick.
 */

#include "connection/INetworkTransport.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <cstdint>
#include <optional>

class LoopbackTransport : public INetworkTransport {
public:
    LoopbackTransport() = default;

    void setListener(ITransportListener* listener) override { mp_listener = listener; }

    bool startHost() override;
    bool startClient(const std::string& payload) override;
    void shutdown() override;

    void respondToApproval(ClientId clientId, bool approved, ConnectStatus reason) override;
    void disconnectClient(ClientId clientId, ConnectStatus reason) override;

    bool isActive() const override { return m_active; }
    bool isHost() const { return m_active && m_isHost; }
    ClientId getLocalClientId() const override { return m_localClientId; }
    size_t getConnectedClientCount() const override { return m_connected.size(); }

    void broadcast(const BinarySerial::Buffer& packet) override;
    void setPacketReceiver(PacketReceiver receiver) override { m_receiver = std::move(receiver); }

    // --- Simulated peers (host mode) ---

    /**
     * @brief Simulates a remote peer asking to join
     * @return Client id assigned to the peer, 0 if not hosting
     */
    ClientId connectRemoteClient(const std::string& payload);

    /**
     * @brief Simulates a peer vanishing without a goodbye
     */
    void dropRemoteClient(ClientId clientId);

    bool isClientConnected(ClientId clientId) const { return m_connected.count(clientId) > 0; }
    bool isAwaitingApproval(ClientId clientId) const { return m_pendingApproval.count(clientId) > 0; }
    std::optional<ConnectStatus> getDisconnectReason(ClientId clientId) const;

    uint64_t getPacketsBroadcast() const { return m_packetsBroadcast; }
    size_t getLastPacketSize() const { return m_lastPacketSize; }

private:
    ITransportListener* mp_listener{nullptr};
    PacketReceiver m_receiver;

    bool m_active{false};
    bool m_isHost{false};
    ClientId m_localClientId{0};
    ClientId m_nextClientId{HOST_CLIENT_ID + 1};

    boost::container::flat_set<ClientId> m_connected;
    boost::container::flat_set<ClientId> m_pendingApproval;
    boost::container::flat_map<ClientId, ConnectStatus> m_disconnectReasons;

    uint64_t m_packetsBroadcast{0};
    size_t m_lastPacketSize{0};
};

#endif // LOOPBACK_TRANSPORT_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_NETWORK_TRANSPORT_HPP
#define I_NETWORK_TRANSPORT_HPP

/**
 * @file INetworkTransport.hpp
 * @brief Boundary between the simulation and the real network stack
 *
 * Commands go in through INetworkTransport; notifications come back through
 * ITransportListener, possibly from an I/O thread. ConnectionManager is the
 * listener and re-posts every notification onto the tick thread.
 */

#include "connection/ConnectStatus.hpp"
#include "entities/EntityTypes.hpp"
#include "utils/BinarySerializer.hpp"
#include <functional>
#include <string>

class ITransportListener {
public:
    virtual ~ITransportListener() = default;

    virtual void onServerStarted() = 0;
    virtual void onServerStopped() = 0;
    virtual void onClientConnected(ClientId clientId) = 0;
    // reason is Undefined when the transport does not know it
    virtual void onClientDisconnected(ClientId clientId, ConnectStatus reason) = 0;
    // Host side; answer with INetworkTransport::respondToApproval()
    virtual void onApprovalRequest(ClientId clientId, const std::string& payload) = 0;
    virtual void onTransportFailure() = 0;
};

class INetworkTransport {
public:
    using PacketReceiver = std::function<void(const BinarySerial::Buffer& packet)>;

    virtual ~INetworkTransport() = default;

    virtual void setListener(ITransportListener* listener) = 0;

    // false if the transport could not even begin; success arrives as onServerStarted()
    virtual bool startHost() = 0;
    // false if the transport could not begin; the outcome arrives as
    // onClientConnected() or onClientDisconnected() for the local client id
    virtual bool startClient(const std::string& payload) = 0;
    virtual void shutdown() = 0;

    virtual void respondToApproval(ClientId clientId, bool approved, ConnectStatus reason) = 0;
    virtual void disconnectClient(ClientId clientId, ConnectStatus reason) = 0;

    virtual bool isActive() const = 0;
    virtual ClientId getLocalClientId() const = 0;
    // Includes the host itself while hosting
    virtual size_t getConnectedClientCount() const = 0;

    // Authority -> observers replication packets
    virtual void broadcast(const BinarySerial::Buffer& packet) = 0;
    virtual void setPacketReceiver(PacketReceiver receiver) = 0;
};

#endif // I_NETWORK_TRANSPORT_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionMethod.hpp"
#include "core/Logger.hpp"

DirectConnectionMethod::DirectConnectionMethod(std::string address, uint16_t port,
                                               std::string playerId, std::string playerName,
                                               bool isDebug)
    : ConnectionMethod(std::move(playerId), std::move(playerName), isDebug)
    , m_address(std::move(address))
    , m_port(port) {}

void DirectConnectionMethod::setupHostConnection(SetupCallback callback) {
    CONNECTION_INFO("Hosting directly on " + m_address + ":" + std::to_string(m_port));
    callback(ConnectionMethodResult::Success);
}

void DirectConnectionMethod::setupClientConnection(SetupCallback callback) {
    CONNECTION_INFO("Connecting directly to " + m_address + ":" + std::to_string(m_port));
    callback(ConnectionMethodResult::Success);
}

void DirectConnectionMethod::setupClientReconnection(SetupCallback callback) {
    // A direct address has no session lookup; the transport decides
    callback(ConnectionMethodResult::Success);
}

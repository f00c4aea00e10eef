/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionManager.hpp"
#include "connection/ConnectionStates.hpp"
#include "connection/SessionManager.hpp"
#include "core/Logger.hpp"
#include "events/SceneChangeEvent.hpp"
#include "managers/EventManager.hpp"

void OfflineState::enter() {
    m_manager.getSessions().onServerEnded();
    INetworkTransport& transport = m_manager.getTransport();
    if (transport.isActive()) {
        transport.shutdown();
    }
    m_manager.getEventManager().publish(SceneChangeEvent("MainMenu", false));
}

void OfflineState::startHostRequest(std::shared_ptr<ConnectionMethod> method) {
    if (!method) {
        CONNECTION_ERROR("Host request without a connection method");
        return;
    }
    m_manager.setConnectionMethod(std::move(method));
    m_manager.changeState(ConnectionStateId::StartingHost);
}

void OfflineState::startClientRequest(std::shared_ptr<ConnectionMethod> method) {
    if (!method) {
        CONNECTION_ERROR("Client request without a connection method");
        return;
    }
    m_manager.setConnectionMethod(std::move(method));
    m_manager.changeState(ConnectionStateId::ClientConnecting);
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionManager.hpp"
#include "connection/ConnectionStates.hpp"
#include "core/Logger.hpp"

void StartingHostState::enter() {
    std::shared_ptr<ConnectionMethod> method = m_manager.getConnectionMethod();
    if (!method) {
        startHostFailed();
        return;
    }

    CONNECTION_INFO("Starting host via " + method->getName());
    method->setupHostConnection(m_manager.makeMethodCallback([this](ConnectionMethodResult result) {
        if (result != ConnectionMethodResult::Success) {
            startHostFailed();
            return;
        }
        if (!m_manager.getTransport().startHost()) {
            startHostFailed();
        }
    }));
}

void StartingHostState::onServerStarted() {
    m_manager.publishStatus(ConnectStatus::Success);
    m_manager.changeState(ConnectionStateId::Hosting);
}

void StartingHostState::startHostFailed() {
    m_manager.publishStatus(ConnectStatus::StartHostFailed);
    m_manager.changeState(ConnectionStateId::Offline);
}

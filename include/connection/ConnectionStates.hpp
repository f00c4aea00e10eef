/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECTION_STATES_HPP
#define CONNECTION_STATES_HPP

/**
 * @file ConnectionStates.hpp
 * @brief The six concrete connection states
 *
 * Offline -> StartingHost -> Hosting -> Offline
 * Offline -> ClientConnecting -> ClientConnected <-> ClientReconnecting -> Offline
 */

#include "connection/ConnectionState.hpp"
#include "core/TimerScheduler.hpp"
#include "managers/EventManager.hpp"

class SceneChangeEvent;

class OfflineState : public ConnectionState {
public:
    using ConnectionState::ConnectionState;

    void enter() override;
    void exit() override {}
    ConnectionStateId getId() const override { return ConnectionStateId::Offline; }

    void startHostRequest(std::shared_ptr<ConnectionMethod> method) override;
    void startClientRequest(std::shared_ptr<ConnectionMethod> method) override;
};

class StartingHostState : public ConnectionState {
public:
    using ConnectionState::ConnectionState;

    void enter() override;
    void exit() override {}
    ConnectionStateId getId() const override { return ConnectionStateId::StartingHost; }

    void onServerStarted() override;
    void onServerStopped() override { startHostFailed(); }
    void onTransportFailure() override { startHostFailed(); }

private:
    void startHostFailed();
};

class HostingState : public ConnectionState {
public:
    using ConnectionState::ConnectionState;

    void enter() override;
    void exit() override;
    ConnectionStateId getId() const override { return ConnectionStateId::Hosting; }

    void onClientConnected(ClientId clientId) override;
    void onClientDisconnect(ClientId clientId, ConnectStatus reason) override;
    void onServerStopped() override;
    void onTransportFailure() override { onServerStopped(); }
    void onUserRequestedShutdown() override;
    void approvalCheck(ClientId clientId, const std::string& payload) override;

private:
    // A synchronized scene change past CharSelect starts the session
    void onSceneChanged(const SceneChangeEvent& event);

    ScopedSubscription m_sceneSubscription;
};

class ClientConnectingState : public ConnectionState {
public:
    using ConnectionState::ConnectionState;

    void enter() override;
    void exit() override;
    ConnectionStateId getId() const override { return ConnectionStateId::ClientConnecting; }

    void onClientConnected(ClientId clientId) override;
    void onClientDisconnect(ClientId clientId, ConnectStatus reason) override;
    void onTransportFailure() override { connectFailed(ConnectStatus::StartClientFailed); }
    void onUserRequestedShutdown() override;

private:
    VanguardEngine::TimerId m_timeoutTimer{VanguardEngine::INVALID_TIMER_ID};

    void connectFailed(ConnectStatus reason);
    void cancelTimeout();
};

class ClientConnectedState : public ConnectionState {
public:
    using ConnectionState::ConnectionState;

    void enter() override;
    void exit() override {}
    ConnectionStateId getId() const override { return ConnectionStateId::ClientConnected; }

    void onClientDisconnect(ClientId clientId, ConnectStatus reason) override;
    void onTransportFailure() override;
    void onUserRequestedShutdown() override;

    // Reasons after which coming back is impossible or unwanted
    static bool forbidsReconnect(ConnectStatus reason);
};

class ClientReconnectingState : public ConnectionState {
public:
    using ConnectionState::ConnectionState;

    void enter() override;
    void exit() override;
    ConnectionStateId getId() const override { return ConnectionStateId::ClientReconnecting; }

    void onClientConnected(ClientId clientId) override;
    void onClientDisconnect(ClientId clientId, ConnectStatus reason) override;
    void onTransportFailure() override { attemptFailed(); }
    void onUserRequestedShutdown() override;

    int getAttemptCount() const { return m_attempts; }

private:
    int m_attempts{0};
    VanguardEngine::TimerId m_timer{VanguardEngine::INVALID_TIMER_ID};
    // Transport notifications only count while an attempt is in flight
    bool m_awaitingTransport{false};
    // Attempt whose connection method setup is still outstanding, 0 if none
    int m_setupAttempt{0};

    void attempt();
    void attemptFailed();
    void giveUp(ConnectStatus reason);
    void cancelTimer();
};

#endif // CONNECTION_STATES_HPP

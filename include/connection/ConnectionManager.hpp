/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

/**
 * @file ConnectionManager.hpp
 * @brief Host/client lifecycle state machine
 *
 * Exactly one ConnectionState is current. changeState() runs exit() on the
 * old state, swaps, publishes ConnectionStateChangedEvent, then runs
 * enter() on the new state. A transition requested while another is
 * running is queued and applied right after it; a transition into the
 * current state does nothing.
 *
 * Transport and connection-method callbacks can arrive on any thread. They
 * are posted to the InboundQueue and reach the current state when the tick
 * drains it. Method callbacks are dropped if the state changed meanwhile.
 */

#include "connection/ConnectStatus.hpp"
#include "connection/ConnectionMethod.hpp"
#include "connection/ConnectionState.hpp"
#include "connection/INetworkTransport.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

class EventManager;
class SessionManager;

namespace VanguardEngine {
class InboundQueue;
class TimerScheduler;
struct ServerSettings;
}

class ConnectionManager : public ITransportListener {
public:
    ConnectionManager(EventManager& eventManager, VanguardEngine::TimerScheduler& timers,
                      SessionManager& sessions, INetworkTransport& transport,
                      VanguardEngine::InboundQueue& inbound,
                      const VanguardEngine::ServerSettings& settings);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // --- Requests (tick thread) ---
    void startHost(std::shared_ptr<ConnectionMethod> method);
    void startClient(std::shared_ptr<ConnectionMethod> method);
    void requestShutdown();

    // --- ITransportListener (any thread; marshalled onto the tick) ---
    void onServerStarted() override;
    void onServerStopped() override;
    void onClientConnected(ClientId clientId) override;
    void onClientDisconnected(ClientId clientId, ConnectStatus reason) override;
    void onApprovalRequest(ClientId clientId, const std::string& payload) override;
    void onTransportFailure() override;

    // --- State machine ---
    void changeState(ConnectionStateId next);
    ConnectionStateId getCurrentStateId() const { return mp_current->getId(); }
    const ConnectionState& getState(ConnectionStateId id) const;
    bool isTransitioning() const { return m_transitioning; }

    uint32_t getEnterCount(ConnectionStateId id) const { return m_enterCounts[index(id)]; }
    uint32_t getExitCount(ConnectionStateId id) const { return m_exitCounts[index(id)]; }
    uint64_t getTransitionCount() const { return m_transitionCount; }

    /**
     * @brief Host approval policy, first failing check wins:
     * PayloadTooLarge, InvalidPayload, LoggedInAgain, ServerFull,
     * IncompatibleBuildType, else Success
     */
    ConnectStatus evaluateApproval(const std::string& payload) const;

    // --- Used by the states ---
    EventManager& getEventManager() { return m_eventManager; }
    VanguardEngine::TimerScheduler& getTimers() { return m_timers; }
    SessionManager& getSessions() { return m_sessions; }
    INetworkTransport& getTransport() { return m_transport; }
    const VanguardEngine::ServerSettings& getSettings() const { return m_settings; }

    void setConnectionMethod(std::shared_ptr<ConnectionMethod> method) { mp_method = std::move(method); }
    std::shared_ptr<ConnectionMethod> getConnectionMethod() const { return mp_method; }

    void publishStatus(ConnectStatus status);

    /**
     * @brief Wraps a method callback so its result reaches the tick thread,
     * and only while the state that asked is still current
     */
    std::function<void(ConnectionMethodResult)>
    makeMethodCallback(std::function<void(ConnectionMethodResult)> onTick);

    ConnectStatus getLastStatus() const { return m_lastStatus; }

private:
    static constexpr size_t STATE_COUNT = 6;
    static size_t index(ConnectionStateId id) { return static_cast<size_t>(id); }

    EventManager& m_eventManager;
    VanguardEngine::TimerScheduler& m_timers;
    SessionManager& m_sessions;
    INetworkTransport& m_transport;
    VanguardEngine::InboundQueue& m_inbound;
    const VanguardEngine::ServerSettings& m_settings;

    std::array<std::unique_ptr<ConnectionState>, STATE_COUNT> m_states;
    ConnectionState* mp_current{nullptr};
    std::shared_ptr<ConnectionMethod> mp_method;

    bool m_transitioning{false};
    std::deque<ConnectionStateId> m_pendingTransitions;
    uint64_t m_transitionCount{0};
    std::array<uint32_t, STATE_COUNT> m_enterCounts{};
    std::array<uint32_t, STATE_COUNT> m_exitCounts{};

    ConnectStatus m_lastStatus{ConnectStatus::Undefined};

    // Liveness flag checked by posted closures; reset in the destructor
    std::shared_ptr<bool> mp_alive;

    void applyTransition(ConnectionStateId next);
    void postToState(std::function<void(ConnectionState&)> task);
};

#endif // CONNECTION_MANAGER_HPP

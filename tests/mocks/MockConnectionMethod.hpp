/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_CONNECTION_METHOD_HPP
#define MOCK_CONNECTION_METHOD_HPP

#include "connection/ConnectionMethod.hpp"
#include <vector>

/**
 * @brief Connection method with scripted results
 *
 * By default callbacks run immediately. With deferCallbacks set they are
 * held until completePending(), to model a slow relay allocation.
 */
class MockConnectionMethod : public ConnectionMethod {
public:
    explicit MockConnectionMethod(std::string playerId = "player-1",
                                  std::string playerName = "Tester", bool isDebug = false)
        : ConnectionMethod(std::move(playerId), std::move(playerName), isDebug) {}

    void setupHostConnection(SetupCallback callback) override {
        ++hostSetups;
        respond(hostResult, std::move(callback));
    }

    void setupClientConnection(SetupCallback callback) override {
        ++clientSetups;
        respond(clientResult, std::move(callback));
    }

    void setupClientReconnection(SetupCallback callback) override {
        ++reconnectSetups;
        respond(reconnectResult, std::move(callback));
    }

    std::string getName() const override { return "Mock"; }

    void completePending(ConnectionMethodResult result) {
        std::vector<SetupCallback> callbacks;
        callbacks.swap(m_pending);
        for (auto& callback : callbacks) {
            callback(result);
        }
    }

    size_t getPendingCount() const { return m_pending.size(); }

    ConnectionMethodResult hostResult{ConnectionMethodResult::Success};
    ConnectionMethodResult clientResult{ConnectionMethodResult::Success};
    ConnectionMethodResult reconnectResult{ConnectionMethodResult::Success};
    bool deferCallbacks{false};

    int hostSetups{0};
    int clientSetups{0};
    int reconnectSetups{0};

private:
    std::vector<SetupCallback> m_pending;

    void respond(ConnectionMethodResult result, SetupCallback callback) {
        if (deferCallbacks) {
            m_pending.push_back(std::move(callback));
            return;
        }
        callback(result);
    }
};

#endif // MOCK_CONNECTION_METHOD_HPP

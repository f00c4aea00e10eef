/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for lightweight event-bridge controllers
 *
 * Controllers listen on the message bus and turn messages into manager
 * calls. They do NOT own simulation data.
 *
 * Key characteristics:
 * - Owned by a ControllerRegistry (not singletons)
 * - Auto-unsubscribe on destruction
 * - Minimal state (subscription tokens only)
 *
 * Promote to Manager when:
 * - Significant data ownership required
 * - Multiple systems depend on it globally
 */

#include "managers/EventManager.hpp"
#include <string_view>
#include <vector>

class ControllerBase
{
public:
    /**
     * @brief Virtual destructor auto-unsubscribes from all events
     */
    virtual ~ControllerBase() { unsubscribe(); }

    // Non-copyable (event handlers capture 'this')
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    /**
     * @brief Register this controller's bus handlers
     * @note Must be idempotent; use checkAlreadySubscribed()
     */
    virtual void subscribe() = 0;

    [[nodiscard]] virtual std::string_view getName() const = 0;

    /**
     * @brief Unsubscribe from all registered event handlers
     * @note Safe to call multiple times
     */
    void unsubscribe()
    {
        if (!m_subscribed) {
            return;
        }

        for (const auto& token : m_handlerTokens) {
            m_eventManager.removeHandler(token);
        }
        m_handlerTokens.clear();
        m_subscribed = false;
    }

    /**
     * @brief Default suspend drops the subscriptions
     */
    virtual void suspend()
    {
        m_suspended = true;
        unsubscribe();
    }

    /**
     * @brief Default resume re-subscribes
     */
    virtual void resume()
    {
        m_suspended = false;
        subscribe();
    }

    [[nodiscard]] bool isSubscribed() const { return m_subscribed; }
    [[nodiscard]] bool isSuspended() const { return m_suspended; }

protected:
    explicit ControllerBase(EventManager& eventManager) : m_eventManager(eventManager) {}

    EventManager& getEventManager() { return m_eventManager; }

    /**
     * @brief Register a handler token for automatic cleanup
     * @param token The token returned by EventManager::subscribe
     */
    void addHandlerToken(const EventManager::HandlerToken& token)
    {
        m_handlerTokens.push_back(token);
    }

    void setSubscribed(bool subscribed) { m_subscribed = subscribed; }

    /**
     * @brief Check if already subscribed (for idempotent subscribe)
     */
    [[nodiscard]] bool checkAlreadySubscribed() const { return m_subscribed; }

private:
    EventManager& m_eventManager;
    bool m_subscribed{false};
    bool m_suspended{false};
    std::vector<EventManager::HandlerToken> m_handlerTokens;
};

#endif // CONTROLLER_BASE_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_ACTION_CONTROLLER_HPP
#define PLAYER_ACTION_CONTROLLER_HPP

/**
 * @file PlayerActionController.hpp
 * @brief Bridges ActionRequestEvent from the input layer to ActionManager
 *
 * Event flow:
 *   input layer -> ActionRequestEvent
 *     -> PlayerActionController -> ActionManager::requestAction()
 *     -> ActionLifecycleEvent (Started/Queued work)
 */

#include "actions/ActionTypes.hpp"
#include "controllers/ControllerBase.hpp"
#include <cstdint>
#include <optional>

class ActionManager;
class ActionRequestEvent;

class PlayerActionController : public ControllerBase
{
public:
    PlayerActionController(EventManager& eventManager, ActionManager& actionManager);
    ~PlayerActionController() override = default;

    void subscribe() override;

    [[nodiscard]] std::string_view getName() const override { return "PlayerActionController"; }

    [[nodiscard]] uint64_t getAcceptedCount() const { return m_accepted; }
    [[nodiscard]] uint64_t getRejectedCount() const { return m_rejected; }

    /**
     * @brief Result of the most recent forwarded request, if any
     */
    [[nodiscard]] std::optional<ActionRequestResult> getLastResult() const { return m_lastResult; }

private:
    void onActionRequest(const ActionRequestEvent& event);

    ActionManager& m_actionManager;
    uint64_t m_accepted{0};
    uint64_t m_rejected{0};
    std::optional<ActionRequestResult> m_lastResult;
};

#endif // PLAYER_ACTION_CONTROLLER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/PlayerActionController.hpp"
#include "core/Logger.hpp"
#include "events/ActionEvents.hpp"
#include "managers/ActionManager.hpp"

PlayerActionController::PlayerActionController(EventManager& eventManager,
                                               ActionManager& actionManager)
    : ControllerBase(eventManager)
    , m_actionManager(actionManager)
{
}

void PlayerActionController::subscribe()
{
    if (checkAlreadySubscribed()) {
        return;
    }

    auto token = getEventManager().subscribe<ActionRequestEvent>(
        [this](const ActionRequestEvent& event) { onActionRequest(event); });
    addHandlerToken(token);

    setSubscribed(true);
    CONTROLLER_INFO("PlayerActionController subscribed to action requests");
}

void PlayerActionController::onActionRequest(const ActionRequestEvent& event)
{
    const ActionRequestResult result = m_actionManager.requestAction(
        event.getEntityId(), event.getActionId(), event.getTargetIds(), event.getQueueMode());
    m_lastResult = result;

    if (result == ActionRequestResult::Started || result == ActionRequestResult::Queued) {
        ++m_accepted;
        return;
    }

    ++m_rejected;
    CONTROLLER_DEBUG("Action " + event.getActionId() + " for entity " +
                     std::to_string(event.getEntityId()) + " rejected: " + toString(result));
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/session/SceneController.hpp"
#include "controllers/session/ISceneLoader.hpp"
#include "core/Logger.hpp"
#include "events/SceneChangeEvent.hpp"

SceneController::SceneController(EventManager& eventManager, ISceneLoader& loader)
    : ControllerBase(eventManager)
    , m_loader(loader)
{
}

void SceneController::subscribe()
{
    if (checkAlreadySubscribed()) {
        return;
    }

    auto token = getEventManager().subscribe<SceneChangeEvent>(
        [this](const SceneChangeEvent& event) { onSceneChange(event); });
    addHandlerToken(token);

    setSubscribed(true);
    CONTROLLER_INFO("SceneController subscribed to scene changes");
}

void SceneController::onSceneChange(const SceneChangeEvent& event)
{
    if (event.getSceneId() == m_currentScene) {
        CONTROLLER_DEBUG("Scene " + m_currentScene + " already loaded");
        return;
    }

    m_currentScene = event.getSceneId();
    ++m_loadCount;
    CONTROLLER_INFO("Loading scene " + m_currentScene +
                    (event.isNetworkSynchronized() ? " (network synchronized)" : " (local)"));
    m_loader.loadScene(m_currentScene, event.isNetworkSynchronized());
}

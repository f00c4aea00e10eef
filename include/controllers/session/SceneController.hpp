/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCENE_CONTROLLER_HPP
#define SCENE_CONTROLLER_HPP

/**
 * @file SceneController.hpp
 * @brief Forwards SceneChangeEvent to the installed ISceneLoader
 *
 * Event flow:
 *   ConnectionManager (Hosting/Offline enter) -> SceneChangeEvent
 *     -> SceneController -> ISceneLoader::loadScene()
 *
 * Repeated requests for the scene that is already loaded are dropped.
 */

#include "controllers/ControllerBase.hpp"
#include <string>

class ISceneLoader;
class SceneChangeEvent;

class SceneController : public ControllerBase
{
public:
    SceneController(EventManager& eventManager, ISceneLoader& loader);
    ~SceneController() override = default;

    void subscribe() override;

    [[nodiscard]] std::string_view getName() const override { return "SceneController"; }

    [[nodiscard]] const std::string& getCurrentScene() const { return m_currentScene; }
    [[nodiscard]] size_t getLoadCount() const { return m_loadCount; }

private:
    void onSceneChange(const SceneChangeEvent& event);

    ISceneLoader& m_loader;
    std::string m_currentScene;
    size_t m_loadCount{0};
};

#endif // SCENE_CONTROLLER_HPP

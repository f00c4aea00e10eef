/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_SCENE_LOADER_HPP
#define I_SCENE_LOADER_HPP

#include <string>

/**
 * @brief Switches world state when the session moves between scenes
 *
 * A networked loader replicates the switch to every client when
 * networkSynchronized is true; a local loader switches only this process.
 */
class ISceneLoader
{
public:
    virtual ~ISceneLoader() = default;

    virtual void loadScene(const std::string& sceneId, bool networkSynchronized) = 0;
};

#endif // I_SCENE_LOADER_HPP

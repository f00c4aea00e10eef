/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_SCENE_LOADER_HPP
#define MOCK_SCENE_LOADER_HPP

#include "controllers/session/ISceneLoader.hpp"
#include <string>
#include <utility>
#include <vector>

class MockSceneLoader : public ISceneLoader {
public:
    void loadScene(const std::string& sceneId, bool networkSynchronized) override {
        loads.emplace_back(sceneId, networkSynchronized);
    }

    const std::string& lastScene() const {
        static const std::string empty;
        return loads.empty() ? empty : loads.back().first;
    }

    std::vector<std::pair<std::string, bool>> loads;
};

#endif // MOCK_SCENE_LOADER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCENE_CHANGE_EVENT_HPP
#define SCENE_CHANGE_EVENT_HPP

/**
 * @file SceneChangeEvent.hpp
 * @brief Instructs the scene loader to switch world state
 *
 * Network-synchronized scene changes are mirrored to every connected peer;
 * local ones (e.g. returning to the main menu) only affect this process.
 */

#include "events/Event.hpp"
#include <string>
#include <utility>

class SceneChangeEvent : public Event {
public:
    static constexpr EventTypeId TYPE_ID = EventTypeId::SceneChange;

    SceneChangeEvent(std::string sceneId, bool networkSynchronized)
        : m_sceneId(std::move(sceneId)), m_networkSynchronized(networkSynchronized) {}

    std::string getName() const override { return "SceneChangeEvent"; }
    EventTypeId getTypeId() const override { return TYPE_ID; }

    [[nodiscard]] const std::string& getSceneId() const { return m_sceneId; }
    [[nodiscard]] bool isNetworkSynchronized() const { return m_networkSynchronized; }

private:
    std::string m_sceneId;
    bool m_networkSynchronized;
};

#endif // SCENE_CHANGE_EVENT_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_REGISTRY_HPP
#define CONTROLLER_REGISTRY_HPP

/**
 * @file ControllerRegistry.hpp
 * @brief Owns the server's bus-driven controllers, one instance per type
 *
 * ServerEngine registers the scene and player-input controllers at init and
 * subscribes them in one call. Suspending the registry detaches every
 * controller from the bus (e.g. while the host is tearing a session down).
 */

#include "controllers/ControllerBase.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <vector>

class ControllerRegistry
{
public:
    ControllerRegistry() = default;

    ControllerRegistry(const ControllerRegistry&) = delete;
    ControllerRegistry& operator=(const ControllerRegistry&) = delete;

    /**
     * @brief Constructs a controller of type T, or returns the one already held
     * @param args Forwarded to T's constructor on first registration
     */
    template<typename T, typename... Args>
    T& add(Args&&... args)
    {
        static_assert(std::is_base_of_v<ControllerBase, T>,
            "T must derive from ControllerBase");

        if (T* existing = get<T>()) {
            return *existing;
        }
        auto controller = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *controller;
        m_byType.emplace(std::type_index(typeid(T)), &ref);
        m_controllers.push_back(std::move(controller));
        return ref;
    }

    // nullptr when no controller of type T was added
    template<typename T>
    T* get()
    {
        auto it = m_byType.find(std::type_index(typeid(T)));
        return it != m_byType.end() ? static_cast<T*>(it->second) : nullptr;
    }

    template<typename T>
    [[nodiscard]] bool has() const
    {
        return m_byType.count(std::type_index(typeid(T))) > 0;
    }

    void subscribeAll()
    {
        for (auto& controller : m_controllers) {
            controller->subscribe();
        }
    }

    void suspendAll()
    {
        for (auto& controller : m_controllers) {
            controller->suspend();
        }
    }

    void resumeAll()
    {
        for (auto& controller : m_controllers) {
            controller->resume();
        }
    }

    [[nodiscard]] bool empty() const { return m_controllers.empty(); }

    // Controllers unsubscribe in their destructors
    void clear()
    {
        m_byType.clear();
        m_controllers.clear();
    }

private:
    std::vector<std::unique_ptr<ControllerBase>> m_controllers;
    boost::container::flat_map<std::type_index, ControllerBase*> m_byType;
};

#endif // CONTROLLER_REGISTRY_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EVENT_HPP
#define EVENT_HPP

/**
 * @file Event.hpp
 * @brief Base class for all messages carried by the EventManager
 *
 * Events are immutable notifications: a publisher constructs one, the bus
 * hands the same instance to every handler of its type by const reference.
 * Each concrete event declares a static TYPE_ID so typed subscriptions can
 * be resolved at compile time.
 */

#include <memory>
#include <string>
#include "events/EventTypeId.hpp"

class Event;

using EventPtr = std::shared_ptr<const Event>;

class Event {
public:
    virtual ~Event() = default;

    virtual std::string getName() const = 0;
    virtual EventTypeId getTypeId() const = 0;
};

#endif // EVENT_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_TYPE_ID_HPP
#define EVENT_TYPE_ID_HPP

#include <cstdint>

// Strongly typed event type enumeration for fast lookups
enum class EventTypeId : uint8_t {
  SceneChange = 0,
  ConnectionStateChanged = 1,
  ConnectStatus = 2,
  ReconnectAttempt = 3,
  ClientSession = 4,
  HealthChanged = 5,
  LifeStateChanged = 6,
  ActionRequest = 7,
  ActionLifecycle = 8,
  Custom = 9,
  COUNT = 10
};

inline const char *toString(EventTypeId typeId) {
  switch (typeId) {
  case EventTypeId::SceneChange: return "SceneChange";
  case EventTypeId::ConnectionStateChanged: return "ConnectionStateChanged";
  case EventTypeId::ConnectStatus: return "ConnectStatus";
  case EventTypeId::ReconnectAttempt: return "ReconnectAttempt";
  case EventTypeId::ClientSession: return "ClientSession";
  case EventTypeId::HealthChanged: return "HealthChanged";
  case EventTypeId::LifeStateChanged: return "LifeStateChanged";
  case EventTypeId::ActionRequest: return "ActionRequest";
  case EventTypeId::ActionLifecycle: return "ActionLifecycle";
  case EventTypeId::Custom: return "Custom";
  case EventTypeId::COUNT: break;
  }
  return "Unknown";
}

#endif // EVENT_TYPE_ID_HPP

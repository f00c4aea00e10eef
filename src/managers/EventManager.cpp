/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EventManager.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <exception>

namespace {
std::string joinFailures(const std::vector<std::string> &failures) {
  std::string message = std::to_string(failures.size()) +
                        " event handler(s) failed: ";
  for (size_t i = 0; i < failures.size(); ++i) {
    if (i > 0) {
      message += "; ";
    }
    message += failures[i];
  }
  return message;
}

// Resets the dispatch depth even when Rethrow unwinds through publishEvent
struct DispatchDepthGuard {
  int &depth;
  explicit DispatchDepthGuard(int &d) : depth(d) { ++depth; }
  ~DispatchDepthGuard() { --depth; }
};
} // namespace

HandlerDispatchError::HandlerDispatchError(std::vector<std::string> failures)
    : std::runtime_error(joinFailures(failures)),
      m_failures(std::move(failures)) {}

EventManager::EventManager(size_t maxDeferredQueue)
    : m_maxDeferredQueue(maxDeferredQueue > 0 ? maxDeferredQueue : 1) {}

EventManager::HandlerToken
EventManager::registerHandlerWithToken(EventTypeId typeId,
                                       EventHandler handler) {
  const size_t idx = static_cast<size_t>(typeId);
  if (idx >= TYPE_COUNT || !handler) {
    BUS_ERROR("Rejected handler registration for invalid type or empty handler");
    return HandlerToken{};
  }

  HandlerToken token{typeId, m_nextHandlerId++};
  m_pendingAdds.push_back({typeId, HandlerEntry{token.id, std::move(handler)}});
  BUS_DEBUG("Staged handler " + std::to_string(token.id) + " for " +
            toString(typeId));
  return token;
}

bool EventManager::removeHandler(const HandlerToken &token) {
  if (!token.isValid() || static_cast<size_t>(token.typeId) >= TYPE_COUNT) {
    return false;
  }
  if (isPendingRemoval(token)) {
    return false;
  }

  // Unapplied add: dropping it can never disturb an iteration
  auto pendingIt = std::find_if(
      m_pendingAdds.begin(), m_pendingAdds.end(), [&token](const PendingAdd &p) {
        return p.typeId == token.typeId && p.entry.id == token.id;
      });
  if (pendingIt != m_pendingAdds.end()) {
    m_pendingAdds.erase(pendingIt);
    return true;
  }

  const auto &entries = m_handlersByType[static_cast<size_t>(token.typeId)];
  const bool live = std::any_of(
      entries.begin(), entries.end(),
      [&token](const HandlerEntry &entry) { return entry.id == token.id; });
  if (!live) {
    return false;
  }

  m_pendingRemovals.push_back(token);
  return true;
}

void EventManager::clearAllHandlers() {
  m_pendingAdds.clear();
  m_pendingRemovals.clear();
  if (m_dispatchDepth > 0) {
    m_clearPending = true;
    return;
  }
  for (auto &entries : m_handlersByType) {
    entries.clear();
  }
  m_clearPending = false;
}

void EventManager::publishEvent(EventPtr event, DispatchMode mode) {
  if (!event) {
    return;
  }
  if (static_cast<size_t>(event->getTypeId()) >= TYPE_COUNT) {
    BUS_ERROR("Dropping event with invalid type id: " + event->getName());
    return;
  }

  if (mode == DispatchMode::Deferred) {
    std::lock_guard<std::mutex> lock(m_deferredMutex);
    if (m_deferredQueue.size() >= m_maxDeferredQueue) {
      ++m_droppedDeferred;
      BUS_ERROR("Deferred queue full, dropping " + event->getName());
      return;
    }
    m_deferredQueue.push_back(std::move(event));
    return;
  }

  if (m_dispatchDepth > 0) {
    m_nestedQueue.push_back(std::move(event));
    return;
  }

  std::vector<std::string> failures;
  {
    DispatchDepthGuard guard(m_dispatchDepth);
    dispatchOne(*event, failures);
    while (!m_nestedQueue.empty()) {
      EventPtr next = std::move(m_nestedQueue.front());
      m_nestedQueue.pop_front();
      dispatchOne(*next, failures);
    }
  }

  if (!failures.empty() && m_errorPolicy == HandlerErrorPolicy::Rethrow) {
    throw HandlerDispatchError(std::move(failures));
  }
}

size_t EventManager::update() {
  std::deque<EventPtr> local;
  {
    std::lock_guard<std::mutex> lock(m_deferredMutex);
    local.swap(m_deferredQueue);
  }

  // Every drained message is delivered even when an earlier one fails
  std::vector<std::string> failures;
  for (auto &event : local) {
    try {
      publishEvent(std::move(event), DispatchMode::Immediate);
    } catch (const HandlerDispatchError &e) {
      failures.insert(failures.end(), e.getFailures().begin(),
                      e.getFailures().end());
    }
  }
  if (!failures.empty()) {
    throw HandlerDispatchError(std::move(failures));
  }
  return local.size();
}

void EventManager::dispatchOne(const Event &event,
                               std::vector<std::string> &failures) {
  applyPendingChanges();

  const size_t idx = static_cast<size_t>(event.getTypeId());
  const auto &handlers = m_handlersByType[idx];
  if (handlers.empty()) {
    return;
  }

  auto start = std::chrono::steady_clock::now();

  // Stable size: adds and removals are staged until the next dispatch
  const size_t count = handlers.size();
  for (size_t i = 0; i < count; ++i) {
    try {
      handlers[i].callable(event);
    } catch (const std::exception &e) {
      std::string message = event.getName() + ": " + e.what();
      BUS_ERROR("Handler exception: " + message);
      failures.push_back(std::move(message));
    } catch (...) {
      std::string message = event.getName() + ": unknown exception";
      BUS_ERROR("Handler exception: " + message);
      failures.push_back(std::move(message));
    }
  }

  auto elapsed = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - start);
  m_performanceStats[idx].addSample(elapsed.count());
}

void EventManager::applyPendingChanges() {
  if (m_clearPending) {
    for (auto &entries : m_handlersByType) {
      entries.clear();
    }
    m_clearPending = false;
  }

  for (const auto &token : m_pendingRemovals) {
    auto &entries = m_handlersByType[static_cast<size_t>(token.typeId)];
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&token](const HandlerEntry &entry) {
                                   return entry.id == token.id;
                                 }),
                  entries.end());
  }
  m_pendingRemovals.clear();

  for (auto &pending : m_pendingAdds) {
    m_handlersByType[static_cast<size_t>(pending.typeId)].push_back(
        std::move(pending.entry));
  }
  m_pendingAdds.clear();
}

bool EventManager::isPendingRemoval(const HandlerToken &token) const {
  return std::find(m_pendingRemovals.begin(), m_pendingRemovals.end(),
                   token) != m_pendingRemovals.end();
}

size_t EventManager::getHandlerCount(EventTypeId typeId) const {
  const size_t idx = static_cast<size_t>(typeId);
  if (idx >= TYPE_COUNT) {
    return 0;
  }

  size_t count = m_clearPending ? 0 : m_handlersByType[idx].size();
  if (!m_clearPending) {
    count -= static_cast<size_t>(std::count_if(
        m_pendingRemovals.begin(), m_pendingRemovals.end(),
        [typeId](const HandlerToken &t) { return t.typeId == typeId; }));
  }
  count += static_cast<size_t>(std::count_if(
      m_pendingAdds.begin(), m_pendingAdds.end(),
      [typeId](const PendingAdd &p) { return p.typeId == typeId; }));
  return count;
}

size_t EventManager::getPendingCount() const {
  return m_pendingAdds.size() + m_pendingRemovals.size();
}

size_t EventManager::getDeferredCount() const {
  std::lock_guard<std::mutex> lock(m_deferredMutex);
  return m_deferredQueue.size();
}

uint64_t EventManager::getDroppedDeferredCount() const {
  std::lock_guard<std::mutex> lock(m_deferredMutex);
  return m_droppedDeferred;
}

void EventManager::setMaxDeferredQueue(size_t maxQueue) {
  std::lock_guard<std::mutex> lock(m_deferredMutex);
  m_maxDeferredQueue = maxQueue > 0 ? maxQueue : 1;
}

PerformanceStats EventManager::getPerformanceStats(EventTypeId typeId) const {
  const size_t idx = static_cast<size_t>(typeId);
  return idx < TYPE_COUNT ? m_performanceStats[idx] : PerformanceStats{};
}

void EventManager::resetPerformanceStats() {
  for (auto &stats : m_performanceStats) {
    stats.reset();
  }
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_MANAGER_HPP
#define EVENT_MANAGER_HPP

/**
 * @file EventManager.hpp
 * @brief Synchronous publish/subscribe message bus
 *
 * - Type-indexed handler storage (one vector per EventTypeId)
 * - Subscribe and unsubscribe are staged and applied when the next publish
 *   begins, so the live handler vectors are never mutated while iterated
 * - Publishes issued from inside a handler are queued and drained, in
 *   order, after the outer publish finishes
 * - A throwing handler never stops the remaining handlers; the error is
 *   logged, and optionally rethrown to the publisher afterwards
 * - Deferred dispatch queues a message until update() runs in the tick
 */

#include "events/Event.hpp"
#include "events/EventTypeId.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * @brief Performance statistics for monitoring
 */
struct PerformanceStats {
  double totalTime{0.0};
  uint64_t callCount{0};
  double avgTime{0.0};
  double minTime{std::numeric_limits<double>::max()};
  double maxTime{0.0};

  void addSample(double time) {
    totalTime += time;
    callCount++;
    avgTime = totalTime / callCount;
    minTime = std::min(minTime, time);
    maxTime = std::max(maxTime, time);
  }

  void reset() {
    totalTime = 0.0;
    callCount = 0;
    avgTime = 0.0;
    minTime = std::numeric_limits<double>::max();
    maxTime = 0.0;
  }
};

/**
 * @brief Thrown by publish() under HandlerErrorPolicy::Rethrow once every
 * handler has run, carrying one message per failed handler
 */
class HandlerDispatchError : public std::runtime_error {
public:
  explicit HandlerDispatchError(std::vector<std::string> failures);

  [[nodiscard]] const std::vector<std::string> &getFailures() const {
    return m_failures;
  }

private:
  std::vector<std::string> m_failures;
};

class EventManager {
public:
  enum class DispatchMode : uint8_t { Deferred = 0, Immediate = 1 };
  enum class HandlerErrorPolicy : uint8_t { LogAndContinue = 0, Rethrow = 1 };

  using EventHandler = std::function<void(const Event &)>;

  struct HandlerToken {
    EventTypeId typeId{EventTypeId::Custom};
    uint64_t id{0};

    [[nodiscard]] bool isValid() const { return id != 0; }
    bool operator==(const HandlerToken &other) const {
      return typeId == other.typeId && id == other.id;
    }
  };

  explicit EventManager(size_t maxDeferredQueue = 8192);
  ~EventManager() = default;

  EventManager(const EventManager &) = delete;
  EventManager &operator=(const EventManager &) = delete;

  /**
   * @brief Registers a handler for a type id
   * @return Token for removeHandler(); the handler becomes live when the
   * next publish begins
   */
  HandlerToken registerHandlerWithToken(EventTypeId typeId,
                                        EventHandler handler);

  /**
   * @brief Typed subscription; T must derive from Event and expose TYPE_ID
   */
  template <typename T>
  HandlerToken subscribe(std::function<void(const T &)> handler) {
    static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");
    return registerHandlerWithToken(
        T::TYPE_ID, [handler = std::move(handler)](const Event &event) {
          handler(static_cast<const T &>(event));
        });
  }

  /**
   * @brief Stages removal of a handler
   * @return true if the token names a live or pending handler
   *
   * A handler removed during dispatch still receives the message in flight.
   */
  bool removeHandler(const HandlerToken &token);

  /**
   * @brief Drops every handler (staged when called during dispatch)
   */
  void clearAllHandlers();

  /**
   * @brief Publishes a message to every handler of its type
   *
   * Immediate mode dispatches synchronously, or queues behind the current
   * dispatch when called from a handler. Deferred mode waits for update().
   * @throws HandlerDispatchError under HandlerErrorPolicy::Rethrow
   */
  template <typename T>
  void publish(T event, DispatchMode mode = DispatchMode::Immediate) {
    static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");
    publishEvent(std::make_shared<const T>(std::move(event)), mode);
  }

  void publishEvent(EventPtr event,
                    DispatchMode mode = DispatchMode::Immediate);

  /**
   * @brief Dispatches deferred messages queued before this call
   * @return Number of messages dispatched
   * @throws HandlerDispatchError under Rethrow, once every message has been
   * delivered, carrying the failures of all of them
   */
  size_t update();

  // Handlers that will receive the next publish of this type
  size_t getHandlerCount(EventTypeId typeId) const;
  template <typename T> size_t getHandlerCount() const {
    return getHandlerCount(T::TYPE_ID);
  }

  // Staged add/remove operations not yet applied
  size_t getPendingCount() const;

  size_t getDeferredCount() const;
  uint64_t getDroppedDeferredCount() const;
  bool isDispatching() const { return m_dispatchDepth > 0; }

  void setHandlerErrorPolicy(HandlerErrorPolicy policy) { m_errorPolicy = policy; }
  HandlerErrorPolicy getHandlerErrorPolicy() const { return m_errorPolicy; }

  void setMaxDeferredQueue(size_t maxQueue);

  PerformanceStats getPerformanceStats(EventTypeId typeId) const;
  void resetPerformanceStats();

private:
  struct HandlerEntry {
    uint64_t id{0};
    EventHandler callable;
  };

  struct PendingAdd {
    EventTypeId typeId;
    HandlerEntry entry;
  };

  static constexpr size_t TYPE_COUNT = static_cast<size_t>(EventTypeId::COUNT);

  std::array<std::vector<HandlerEntry>, TYPE_COUNT> m_handlersByType;
  std::vector<PendingAdd> m_pendingAdds;
  std::vector<HandlerToken> m_pendingRemovals;
  bool m_clearPending{false};
  uint64_t m_nextHandlerId{1};

  // Immediate publishes issued while dispatching
  std::deque<EventPtr> m_nestedQueue;
  int m_dispatchDepth{0};

  // Deferred dispatch queue (processed in update())
  mutable std::mutex m_deferredMutex;
  std::deque<EventPtr> m_deferredQueue;
  size_t m_maxDeferredQueue;
  uint64_t m_droppedDeferred{0};

  HandlerErrorPolicy m_errorPolicy{HandlerErrorPolicy::LogAndContinue};

  std::array<PerformanceStats, TYPE_COUNT> m_performanceStats;

  void applyPendingChanges();
  void dispatchOne(const Event &event, std::vector<std::string> &failures);
  bool isPendingRemoval(const HandlerToken &token) const;
};

/**
 * @brief Move-only handle that removes its handler when destroyed
 */
class ScopedSubscription {
public:
  ScopedSubscription() = default;
  ScopedSubscription(EventManager &eventManager,
                     EventManager::HandlerToken token)
      : mp_eventManager(&eventManager), m_token(token) {}

  ~ScopedSubscription() { reset(); }

  ScopedSubscription(const ScopedSubscription &) = delete;
  ScopedSubscription &operator=(const ScopedSubscription &) = delete;

  ScopedSubscription(ScopedSubscription &&other) noexcept
      : mp_eventManager(other.mp_eventManager), m_token(other.m_token) {
    other.mp_eventManager = nullptr;
  }

  ScopedSubscription &operator=(ScopedSubscription &&other) noexcept {
    if (this != &other) {
      reset();
      mp_eventManager = other.mp_eventManager;
      m_token = other.m_token;
      other.mp_eventManager = nullptr;
    }
    return *this;
  }

  void reset() {
    if (mp_eventManager && m_token.isValid()) {
      mp_eventManager->removeHandler(m_token);
    }
    mp_eventManager = nullptr;
  }

  [[nodiscard]] const EventManager::HandlerToken &getToken() const {
    return m_token;
  }

private:
  EventManager *mp_eventManager{nullptr};
  EventManager::HandlerToken m_token;
};

#endif // EVENT_MANAGER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for thread-safe logging (transport threads log too)
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace VanguardEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Vanguard Server - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define VANGUARD_CRITICAL(system, msg)                                         \
  VanguardEngine::Logger::Log(VanguardEngine::LogLevel::CRITICAL, system, msg)
#define VANGUARD_ERROR(system, msg)                                            \
  VanguardEngine::Logger::Log(VanguardEngine::LogLevel::ERROR_LEVEL, system, msg)
#define VANGUARD_WARN(system, msg)                                             \
  VanguardEngine::Logger::Log(VanguardEngine::LogLevel::WARNING, system, msg)
#define VANGUARD_INFO(system, msg)                                             \
  VanguardEngine::Logger::Log(VanguardEngine::LogLevel::INFO, system, msg)
#define VANGUARD_DEBUG(system, msg)                                            \
  VanguardEngine::Logger::Log(VanguardEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file, the rest compiles away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Defined in src/core/Logger.cpp
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define VANGUARD_CRITICAL(system, msg)                                         \
  VanguardEngine::Logger::Log("CRITICAL", system, msg)

#define VANGUARD_ERROR(system, msg)                                            \
  VanguardEngine::Logger::Log("ERROR", system, msg)

#define VANGUARD_WARN(system, msg) ((void)0)  // Zero overhead
#define VANGUARD_INFO(system, msg) ((void)0)  // Zero overhead
#define VANGUARD_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each manager and core system

// Core Systems
#define GAMELOOP_CRITICAL(msg) VANGUARD_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) VANGUARD_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) VANGUARD_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) VANGUARD_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) VANGUARD_DEBUG("GameLoop", msg)

#define ENGINE_CRITICAL(msg) VANGUARD_CRITICAL("ServerEngine", msg)
#define ENGINE_ERROR(msg) VANGUARD_ERROR("ServerEngine", msg)
#define ENGINE_WARN(msg) VANGUARD_WARN("ServerEngine", msg)
#define ENGINE_INFO(msg) VANGUARD_INFO("ServerEngine", msg)
#define ENGINE_DEBUG(msg) VANGUARD_DEBUG("ServerEngine", msg)

#define TIMER_CRITICAL(msg) VANGUARD_CRITICAL("TimerScheduler", msg)
#define TIMER_ERROR(msg) VANGUARD_ERROR("TimerScheduler", msg)
#define TIMER_WARN(msg) VANGUARD_WARN("TimerScheduler", msg)
#define TIMER_INFO(msg) VANGUARD_INFO("TimerScheduler", msg)
#define TIMER_DEBUG(msg) VANGUARD_DEBUG("TimerScheduler", msg)

// Manager Systems
#define BUS_CRITICAL(msg) VANGUARD_CRITICAL("EventManager", msg)
#define BUS_ERROR(msg) VANGUARD_ERROR("EventManager", msg)
#define BUS_WARN(msg) VANGUARD_WARN("EventManager", msg)
#define BUS_INFO(msg) VANGUARD_INFO("EventManager", msg)
#define BUS_DEBUG(msg) VANGUARD_DEBUG("EventManager", msg)

#define CONNECTION_CRITICAL(msg) VANGUARD_CRITICAL("ConnectionManager", msg)
#define CONNECTION_ERROR(msg) VANGUARD_ERROR("ConnectionManager", msg)
#define CONNECTION_WARN(msg) VANGUARD_WARN("ConnectionManager", msg)
#define CONNECTION_INFO(msg) VANGUARD_INFO("ConnectionManager", msg)
#define CONNECTION_DEBUG(msg) VANGUARD_DEBUG("ConnectionManager", msg)

#define SESSION_CRITICAL(msg) VANGUARD_CRITICAL("SessionManager", msg)
#define SESSION_ERROR(msg) VANGUARD_ERROR("SessionManager", msg)
#define SESSION_WARN(msg) VANGUARD_WARN("SessionManager", msg)
#define SESSION_INFO(msg) VANGUARD_INFO("SessionManager", msg)
#define SESSION_DEBUG(msg) VANGUARD_DEBUG("SessionManager", msg)

#define TRANSPORT_CRITICAL(msg) VANGUARD_CRITICAL("Transport", msg)
#define TRANSPORT_ERROR(msg) VANGUARD_ERROR("Transport", msg)
#define TRANSPORT_WARN(msg) VANGUARD_WARN("Transport", msg)
#define TRANSPORT_INFO(msg) VANGUARD_INFO("Transport", msg)
#define TRANSPORT_DEBUG(msg) VANGUARD_DEBUG("Transport", msg)

#define ACTION_CRITICAL(msg) VANGUARD_CRITICAL("ActionManager", msg)
#define ACTION_ERROR(msg) VANGUARD_ERROR("ActionManager", msg)
#define ACTION_WARN(msg) VANGUARD_WARN("ActionManager", msg)
#define ACTION_INFO(msg) VANGUARD_INFO("ActionManager", msg)
#define ACTION_DEBUG(msg) VANGUARD_DEBUG("ActionManager", msg)

#define HEALTH_CRITICAL(msg) VANGUARD_CRITICAL("HealthManager", msg)
#define HEALTH_ERROR(msg) VANGUARD_ERROR("HealthManager", msg)
#define HEALTH_WARN(msg) VANGUARD_WARN("HealthManager", msg)
#define HEALTH_INFO(msg) VANGUARD_INFO("HealthManager", msg)
#define HEALTH_DEBUG(msg) VANGUARD_DEBUG("HealthManager", msg)

#define AI_CRITICAL(msg) VANGUARD_CRITICAL("AIManager", msg)
#define AI_ERROR(msg) VANGUARD_ERROR("AIManager", msg)
#define AI_WARN(msg) VANGUARD_WARN("AIManager", msg)
#define AI_INFO(msg) VANGUARD_INFO("AIManager", msg)
#define AI_DEBUG(msg) VANGUARD_DEBUG("AIManager", msg)

#define ENTITY_CRITICAL(msg) VANGUARD_CRITICAL("EntityDataManager", msg)
#define ENTITY_ERROR(msg) VANGUARD_ERROR("EntityDataManager", msg)
#define ENTITY_WARN(msg) VANGUARD_WARN("EntityDataManager", msg)
#define ENTITY_INFO(msg) VANGUARD_INFO("EntityDataManager", msg)
#define ENTITY_DEBUG(msg) VANGUARD_DEBUG("EntityDataManager", msg)

#define REPLICATION_CRITICAL(msg) VANGUARD_CRITICAL("Replication", msg)
#define REPLICATION_ERROR(msg) VANGUARD_ERROR("Replication", msg)
#define REPLICATION_WARN(msg) VANGUARD_WARN("Replication", msg)
#define REPLICATION_INFO(msg) VANGUARD_INFO("Replication", msg)
#define REPLICATION_DEBUG(msg) VANGUARD_DEBUG("Replication", msg)

#define SETTINGS_CRITICAL(msg) VANGUARD_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) VANGUARD_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) VANGUARD_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) VANGUARD_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) VANGUARD_DEBUG("SettingsManager", msg)

#define CATALOG_CRITICAL(msg) VANGUARD_CRITICAL("GameDataCatalog", msg)
#define CATALOG_ERROR(msg) VANGUARD_ERROR("GameDataCatalog", msg)
#define CATALOG_WARN(msg) VANGUARD_WARN("GameDataCatalog", msg)
#define CATALOG_INFO(msg) VANGUARD_INFO("GameDataCatalog", msg)
#define CATALOG_DEBUG(msg) VANGUARD_DEBUG("GameDataCatalog", msg)

// Controllers
#define CONTROLLER_CRITICAL(msg) VANGUARD_CRITICAL("Controller", msg)
#define CONTROLLER_ERROR(msg) VANGUARD_ERROR("Controller", msg)
#define CONTROLLER_WARN(msg) VANGUARD_WARN("Controller", msg)
#define CONTROLLER_INFO(msg) VANGUARD_INFO("Controller", msg)
#define CONTROLLER_DEBUG(msg) VANGUARD_DEBUG("Controller", msg)

// Benchmark mode convenience macros
#define VANGUARD_ENABLE_BENCHMARK_MODE()                                       \
  VanguardEngine::Logger::SetBenchmarkMode(true)
#define VANGUARD_DISABLE_BENCHMARK_MODE()                                      \
  VanguardEngine::Logger::SetBenchmarkMode(false)

} // namespace VanguardEngine

#endif // LOGGER_HPP

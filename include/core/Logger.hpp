/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace ColonySim {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
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
    printf("Colony Sim - [%s] %s: %s\n", system, getLevelString(level),
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

#define COLONY_CRITICAL(system, msg)                                           \
  ColonySim::Logger::Log(ColonySim::LogLevel::CRITICAL, system, msg)
#define COLONY_ERROR(system, msg)                                              \
  ColonySim::Logger::Log(ColonySim::LogLevel::ERROR_LEVEL, system, msg)
#define COLONY_WARN(system, msg)                                               \
  ColonySim::Logger::Log(ColonySim::LogLevel::WARNING, system, msg)
#define COLONY_INFO(system, msg)                                               \
  ColonySim::Logger::Log(ColonySim::LogLevel::INFO, system, msg)
#define COLONY_DEBUG(system, msg)                                              \
  ColonySim::Logger::Log(ColonySim::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to the log file, the rest compiles away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Defined in Logger.cpp (file logger)
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define COLONY_CRITICAL(system, msg)                                           \
  ColonySim::Logger::Log("CRITICAL", system, msg)

#define COLONY_ERROR(system, msg) ColonySim::Logger::Log("ERROR", system, msg)

#define COLONY_WARN(system, msg) ((void)0)  // Zero overhead
#define COLONY_INFO(system, msg) ((void)0)  // Zero overhead
#define COLONY_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define COLONYMAIN_CRITICAL(msg) COLONY_CRITICAL("ColonyMain", msg)
#define COLONYMAIN_ERROR(msg) COLONY_ERROR("ColonyMain", msg)
#define COLONYMAIN_WARN(msg) COLONY_WARN("ColonyMain", msg)
#define COLONYMAIN_INFO(msg) COLONY_INFO("ColonyMain", msg)
#define COLONYMAIN_DEBUG(msg) COLONY_DEBUG("ColonyMain", msg)

#define THREADSYSTEM_CRITICAL(msg) COLONY_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) COLONY_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) COLONY_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) COLONY_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) COLONY_DEBUG("ThreadSystem", msg)

#define SCHEDULER_CRITICAL(msg) COLONY_CRITICAL("TickScheduler", msg)
#define SCHEDULER_ERROR(msg) COLONY_ERROR("TickScheduler", msg)
#define SCHEDULER_WARN(msg) COLONY_WARN("TickScheduler", msg)
#define SCHEDULER_INFO(msg) COLONY_INFO("TickScheduler", msg)
#define SCHEDULER_DEBUG(msg) COLONY_DEBUG("TickScheduler", msg)

// Entity Systems
#define ACTOR_CRITICAL(msg) COLONY_CRITICAL("Actor", msg)
#define ACTOR_ERROR(msg) COLONY_ERROR("Actor", msg)
#define ACTOR_WARN(msg) COLONY_WARN("Actor", msg)
#define ACTOR_INFO(msg) COLONY_INFO("Actor", msg)
#define ACTOR_DEBUG(msg) COLONY_DEBUG("Actor", msg)

// Manager Systems
#define ACTORMGR_CRITICAL(msg) COLONY_CRITICAL("ActorManager", msg)
#define ACTORMGR_ERROR(msg) COLONY_ERROR("ActorManager", msg)
#define ACTORMGR_WARN(msg) COLONY_WARN("ActorManager", msg)
#define ACTORMGR_INFO(msg) COLONY_INFO("ActorManager", msg)
#define ACTORMGR_DEBUG(msg) COLONY_DEBUG("ActorManager", msg)

#define POOL_CRITICAL(msg) COLONY_CRITICAL("ResourcePool", msg)
#define POOL_ERROR(msg) COLONY_ERROR("ResourcePool", msg)
#define POOL_WARN(msg) COLONY_WARN("ResourcePool", msg)
#define POOL_INFO(msg) COLONY_INFO("ResourcePool", msg)
#define POOL_DEBUG(msg) COLONY_DEBUG("ResourcePool", msg)

#define PRESENCE_CRITICAL(msg) COLONY_CRITICAL("PresenceAggregator", msg)
#define PRESENCE_ERROR(msg) COLONY_ERROR("PresenceAggregator", msg)
#define PRESENCE_WARN(msg) COLONY_WARN("PresenceAggregator", msg)
#define PRESENCE_INFO(msg) COLONY_INFO("PresenceAggregator", msg)
#define PRESENCE_DEBUG(msg) COLONY_DEBUG("PresenceAggregator", msg)

#define SETTINGS_CRITICAL(msg) COLONY_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) COLONY_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) COLONY_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) COLONY_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) COLONY_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define COLONY_ENABLE_BENCHMARK_MODE() ColonySim::Logger::SetBenchmarkMode(true)
#define COLONY_DISABLE_BENCHMARK_MODE()                                        \
  ColonySim::Logger::SetBenchmarkMode(false)

} // namespace ColonySim

#endif // LOGGER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t level storage
#include <cstdio> // IWYU pragma: keep - printf()/fflush() in debug builds
#include <mutex> // IWYU pragma: keep - serialised console output
#include <string> // IWYU pragma: keep - std::string messages from std::format

namespace SneakEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (file sink in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  // Quiet mode drops every message; used by tests and scripted replays
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Sneak Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define SNEAK_CRITICAL(system, msg)                                            \
  SneakEngine::Logger::Log(SneakEngine::LogLevel::CRITICAL, system, msg)
#define SNEAK_ERROR(system, msg)                                               \
  SneakEngine::Logger::Log(SneakEngine::LogLevel::ERROR_LEVEL, system, msg)
#define SNEAK_WARN(system, msg)                                                \
  SneakEngine::Logger::Log(SneakEngine::LogLevel::WARNING, system, msg)
#define SNEAK_INFO(system, msg)                                                \
  SneakEngine::Logger::Log(SneakEngine::LogLevel::INFO, system, msg)
#define SNEAK_DEBUG(system, msg)                                               \
  SneakEngine::Logger::Log(SneakEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL/ERROR to a rotating file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  static std::mutex s_logMutex;

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define SNEAK_CRITICAL(system, msg)                                            \
  SneakEngine::Logger::Log("CRITICAL", system, msg)
#define SNEAK_ERROR(system, msg) SneakEngine::Logger::Log("ERROR", system, msg)

#define SNEAK_WARN(system, msg) ((void)0)
#define SNEAK_INFO(system, msg) ((void)0)
#define SNEAK_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

// Per-system convenience macros

#define LEVEL_CRITICAL(msg) SNEAK_CRITICAL("Level", msg)
#define LEVEL_ERROR(msg) SNEAK_ERROR("Level", msg)
#define LEVEL_WARN(msg) SNEAK_WARN("Level", msg)
#define LEVEL_INFO(msg) SNEAK_INFO("Level", msg)
#define LEVEL_DEBUG(msg) SNEAK_DEBUG("Level", msg)

#define LOADER_CRITICAL(msg) SNEAK_CRITICAL("LevelLoader", msg)
#define LOADER_ERROR(msg) SNEAK_ERROR("LevelLoader", msg)
#define LOADER_WARN(msg) SNEAK_WARN("LevelLoader", msg)
#define LOADER_INFO(msg) SNEAK_INFO("LevelLoader", msg)
#define LOADER_DEBUG(msg) SNEAK_DEBUG("LevelLoader", msg)

#define TILESET_ERROR(msg) SNEAK_ERROR("Tileset", msg)
#define TILESET_WARN(msg) SNEAK_WARN("Tileset", msg)
#define TILESET_DEBUG(msg) SNEAK_DEBUG("Tileset", msg)

#define ENTITY_CRITICAL(msg) SNEAK_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) SNEAK_ERROR("Entity", msg)
#define ENTITY_WARN(msg) SNEAK_WARN("Entity", msg)
#define ENTITY_INFO(msg) SNEAK_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) SNEAK_DEBUG("Entity", msg)

#define TRIGGER_ERROR(msg) SNEAK_ERROR("Trigger", msg)
#define TRIGGER_WARN(msg) SNEAK_WARN("Trigger", msg)
#define TRIGGER_INFO(msg) SNEAK_INFO("Trigger", msg)
#define TRIGGER_DEBUG(msg) SNEAK_DEBUG("Trigger", msg)

#define GUARD_ERROR(msg) SNEAK_ERROR("Guard", msg)
#define GUARD_WARN(msg) SNEAK_WARN("Guard", msg)
#define GUARD_INFO(msg) SNEAK_INFO("Guard", msg)
#define GUARD_DEBUG(msg) SNEAK_DEBUG("Guard", msg)

#define VISION_WARN(msg) SNEAK_WARN("Vision", msg)
#define VISION_DEBUG(msg) SNEAK_DEBUG("Vision", msg)

#define TURN_ERROR(msg) SNEAK_ERROR("TurnController", msg)
#define TURN_WARN(msg) SNEAK_WARN("TurnController", msg)
#define TURN_INFO(msg) SNEAK_INFO("TurnController", msg)
#define TURN_DEBUG(msg) SNEAK_DEBUG("TurnController", msg)

#define SETTINGS_CRITICAL(msg) SNEAK_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) SNEAK_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) SNEAK_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) SNEAK_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) SNEAK_DEBUG("SettingsManager", msg)

#define RUNNER_CRITICAL(msg) SNEAK_CRITICAL("Runner", msg)
#define RUNNER_ERROR(msg) SNEAK_ERROR("Runner", msg)
#define RUNNER_INFO(msg) SNEAK_INFO("Runner", msg)

#define SNEAK_ENABLE_QUIET_MODE() SneakEngine::Logger::SetQuietMode(true)
#define SNEAK_DISABLE_QUIET_MODE() SneakEngine::Logger::SetQuietMode(false)

} // namespace SneakEngine

#endif // LOGGER_HPP

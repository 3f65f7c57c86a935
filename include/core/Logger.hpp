/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Serialises output from the host and test runners
// - atomic: Required for std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialised logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Cosmic {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  // Quiet mode mutes everything, used by benchmarks and long soak tests
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
    printf("Cosmic Defenders - [%s] %s: %s\n", system, getLevelString(level),
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

inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

#define COSMIC_CRITICAL(system, msg)                                           \
  Cosmic::Logger::Log(Cosmic::LogLevel::CRITICAL, system, msg)
#define COSMIC_ERROR(system, msg)                                              \
  Cosmic::Logger::Log(Cosmic::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define COSMIC_WARN(system, msg)                                               \
  Cosmic::Logger::Log(Cosmic::LogLevel::WARNING, system, msg)
#define COSMIC_INFO(system, msg)                                               \
  Cosmic::Logger::Log(Cosmic::LogLevel::INFO, system, msg)
#define COSMIC_DEBUG(system, msg)                                              \
  Cosmic::Logger::Log(Cosmic::LogLevel::DEBUG_LEVEL, system, msg)
#else
// Release builds - zero overhead, the message expression is never evaluated
#define COSMIC_WARN(system, msg) ((void)0)
#define COSMIC_INFO(system, msg) ((void)0)
#define COSMIC_DEBUG(system, msg) ((void)0)
#endif

// Convenience macros for each simulation system

#define GAMELOOP_CRITICAL(msg) COSMIC_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) COSMIC_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) COSMIC_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) COSMIC_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) COSMIC_DEBUG("GameLoop", msg)

#define SESSION_CRITICAL(msg) COSMIC_CRITICAL("GameSession", msg)
#define SESSION_ERROR(msg) COSMIC_ERROR("GameSession", msg)
#define SESSION_WARN(msg) COSMIC_WARN("GameSession", msg)
#define SESSION_INFO(msg) COSMIC_INFO("GameSession", msg)
#define SESSION_DEBUG(msg) COSMIC_DEBUG("GameSession", msg)

#define ENTITY_CRITICAL(msg) COSMIC_CRITICAL("EntityStore", msg)
#define ENTITY_ERROR(msg) COSMIC_ERROR("EntityStore", msg)
#define ENTITY_WARN(msg) COSMIC_WARN("EntityStore", msg)
#define ENTITY_INFO(msg) COSMIC_INFO("EntityStore", msg)
#define ENTITY_DEBUG(msg) COSMIC_DEBUG("EntityStore", msg)

#define BEHAVIOR_CRITICAL(msg) COSMIC_CRITICAL("BehaviorEngine", msg)
#define BEHAVIOR_ERROR(msg) COSMIC_ERROR("BehaviorEngine", msg)
#define BEHAVIOR_WARN(msg) COSMIC_WARN("BehaviorEngine", msg)
#define BEHAVIOR_INFO(msg) COSMIC_INFO("BehaviorEngine", msg)
#define BEHAVIOR_DEBUG(msg) COSMIC_DEBUG("BehaviorEngine", msg)

#define COLLISION_CRITICAL(msg) COSMIC_CRITICAL("CollisionSystem", msg)
#define COLLISION_ERROR(msg) COSMIC_ERROR("CollisionSystem", msg)
#define COLLISION_WARN(msg) COSMIC_WARN("CollisionSystem", msg)
#define COLLISION_INFO(msg) COSMIC_INFO("CollisionSystem", msg)
#define COLLISION_DEBUG(msg) COSMIC_DEBUG("CollisionSystem", msg)

#define COMBAT_CRITICAL(msg) COSMIC_CRITICAL("CombatResolver", msg)
#define COMBAT_ERROR(msg) COSMIC_ERROR("CombatResolver", msg)
#define COMBAT_WARN(msg) COSMIC_WARN("CombatResolver", msg)
#define COMBAT_INFO(msg) COSMIC_INFO("CombatResolver", msg)
#define COMBAT_DEBUG(msg) COSMIC_DEBUG("CombatResolver", msg)

#define SPAWN_CRITICAL(msg) COSMIC_CRITICAL("WaveSpawner", msg)
#define SPAWN_ERROR(msg) COSMIC_ERROR("WaveSpawner", msg)
#define SPAWN_WARN(msg) COSMIC_WARN("WaveSpawner", msg)
#define SPAWN_INFO(msg) COSMIC_INFO("WaveSpawner", msg)
#define SPAWN_DEBUG(msg) COSMIC_DEBUG("WaveSpawner", msg)

#define POWERUP_CRITICAL(msg) COSMIC_CRITICAL("PowerUpEffectTimer", msg)
#define POWERUP_ERROR(msg) COSMIC_ERROR("PowerUpEffectTimer", msg)
#define POWERUP_WARN(msg) COSMIC_WARN("PowerUpEffectTimer", msg)
#define POWERUP_INFO(msg) COSMIC_INFO("PowerUpEffectTimer", msg)
#define POWERUP_DEBUG(msg) COSMIC_DEBUG("PowerUpEffectTimer", msg)

#define PARTICLE_CRITICAL(msg) COSMIC_CRITICAL("ParticleManager", msg)
#define PARTICLE_ERROR(msg) COSMIC_ERROR("ParticleManager", msg)
#define PARTICLE_WARN(msg) COSMIC_WARN("ParticleManager", msg)
#define PARTICLE_INFO(msg) COSMIC_INFO("ParticleManager", msg)
#define PARTICLE_DEBUG(msg) COSMIC_DEBUG("ParticleManager", msg)

#define CONFIG_CRITICAL(msg) COSMIC_CRITICAL("ConfigLoader", msg)
#define CONFIG_ERROR(msg) COSMIC_ERROR("ConfigLoader", msg)
#define CONFIG_WARN(msg) COSMIC_WARN("ConfigLoader", msg)
#define CONFIG_INFO(msg) COSMIC_INFO("ConfigLoader", msg)
#define CONFIG_DEBUG(msg) COSMIC_DEBUG("ConfigLoader", msg)

// Quiet mode convenience macros
#define COSMIC_ENABLE_QUIET_MODE() Cosmic::Logger::SetQuietMode(true)
#define COSMIC_DISABLE_QUIET_MODE() Cosmic::Logger::SetQuietMode(false)

} // namespace Cosmic

#endif // LOGGER_HPP

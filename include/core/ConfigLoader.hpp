/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

/**
 * @file ConfigLoader.hpp
 * @brief Overlays a JSON tuning document onto a GameConfig
 *
 * Document layout (every section and key optional):
 * @code
 * {
 *   "difficulty": "ace",
 *   "field":        { "width": 1200, "height": 800, "prune_margin": 50 },
 *   "player":       { "speed": 5, "max_health": 100, "fire_rate": 10, ... },
 *   "bullet":       { "speed": 8, "damage": 1, "max_per_faction": 100, ... },
 *   "behavior":     { "fire_range": 400, "boss_pattern_duration": 5, ... },
 *   "enemies":      { "fast": { "speed": 4, "health": 1, "score": 150 } },
 *   "difficulties": { "legend": { "score_mult": 3.0 } },
 *   "wave":         { "base_enemies": 5, "tables": [ { "max_wave": 2, "weights": { "basic": 100 } } ] },
 *   "level":        { "start_level": 1, "max_level": 20, "base_waves": 10, "waves_per_level": 2 },
 *   "power_ups":    { "drop_chance": 0.15, "weights": { "health": 25 } },
 *   "particles":    { "max_particles": 500 }
 * }
 * @endcode
 *
 * Unknown keys are ignored. A value of the wrong type or out of range, an
 * unknown difficulty name, or unparsable JSON rejects the whole document:
 * the target config is only written when every value was accepted.
 */

#include "core/GameConfig.hpp"
#include "utils/JsonReader.hpp"
#include <string>

namespace Cosmic
{

class ConfigLoader
{
public:
    ConfigLoader() = default;

    /**
     * @brief Read a JSON file and overlay it onto @p config
     * @return false on any error; @p config is unchanged
     */
    bool loadFromFile(const std::string& path, GameConfig& config);

    /**
     * @brief Parse a JSON document and overlay it onto @p config
     * @return false on any error; @p config is unchanged
     */
    bool loadFromString(const std::string& json, GameConfig& config);

    /**
     * @brief Overlay an already parsed document onto @p config
     */
    bool apply(const JsonValue& root, GameConfig& config);

    [[nodiscard]] const std::string& getLastError() const { return m_lastError; }

private:
    bool applyField(const JsonObject& section, FieldConfig& field);
    bool applyPlayer(const JsonObject& section, PlayerConfig& player);
    bool applyBullet(const JsonObject& section, BulletConfig& bullet);
    bool applyBehavior(const JsonObject& section, BehaviorConfig& behavior);
    bool applyEnemies(const JsonObject& section, GameConfig& config);
    bool applyDifficulties(const JsonObject& section, GameConfig& config);
    bool applyWave(const JsonObject& section, WaveConfig& wave);
    bool applyLevel(const JsonObject& section, LevelConfig& level);
    bool applyPowerUps(const JsonObject& section, PowerUpConfig& powerUp);
    bool applyParticles(const JsonObject& section, ParticleConfig& particle);

    // Typed readers: an absent key leaves @p out untouched and succeeds
    bool readFloat(const JsonObject& section, const std::string& key, float& out,
                   float minValue, float maxValue = 1.0e9f);
    bool readInt(const JsonObject& section, const std::string& key, int& out, int minValue);
    bool readSize(const JsonObject& section, const std::string& key, size_t& out);
    bool readExtent(const JsonObject& section, Vector2D& out);

    // A present non-object fails; an absent section sets @p out to nullptr and succeeds
    bool readSection(const JsonObject& parent, const std::string& key, const JsonObject*& out);

    bool fail(const std::string& message);

    std::string m_path;                   // Section currently being read, for error messages
    std::string m_lastError;
};

} // namespace Cosmic

#endif // CONFIG_LOADER_HPP

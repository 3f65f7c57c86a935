/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <limits>

namespace Cosmic
{

namespace
{

constexpr float NO_MIN = std::numeric_limits<float>::lowest();

const JsonValue* findKey(const JsonObject& section, const std::string& key)
{
    auto it = section.find(key);
    return it != section.end() ? &it->second : nullptr;
}

} // namespace

bool ConfigLoader::loadFromFile(const std::string& path, GameConfig& config)
{
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        m_lastError = "Failed to load config file: " + path + " - " + reader.getLastError();
        CONFIG_ERROR(m_lastError);
        return false;
    }

    if (!apply(reader.getRoot(), config)) {
        CONFIG_ERROR("Rejected config file " + path + ": " + m_lastError);
        return false;
    }

    CONFIG_INFO("Loaded config file: " + path);
    return true;
}

bool ConfigLoader::loadFromString(const std::string& json, GameConfig& config)
{
    JsonReader reader;
    if (!reader.parse(json)) {
        m_lastError = "Failed to parse config JSON: " + reader.getLastError();
        CONFIG_ERROR(m_lastError);
        return false;
    }
    return apply(reader.getRoot(), config);
}

bool ConfigLoader::apply(const JsonValue& root, GameConfig& config)
{
    m_lastError.clear();
    m_path.clear();

    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        return fail("config root is not a JSON object");
    }

    // Work on a copy so a rejected document never leaves a half-applied config
    GameConfig staged = config;

    if (const JsonValue* difficulty = findKey(*rootObj, "difficulty")) {
        const std::string* name = difficulty->tryAsString();
        if (!name) {
            return fail("difficulty: expected a string");
        }
        const auto parsed = parseDifficulty(*name);
        if (!parsed) {
            return fail("difficulty: unknown difficulty '" + *name + "'");
        }
        staged.difficulty = *parsed;
    }

    const JsonObject* section = nullptr;

    if (!readSection(*rootObj, "field", section) || (section && !applyField(*section, staged.field))) {
        return false;
    }
    if (!readSection(*rootObj, "player", section) ||
        (section && !applyPlayer(*section, staged.player))) {
        return false;
    }
    if (!readSection(*rootObj, "bullet", section) ||
        (section && !applyBullet(*section, staged.bullet))) {
        return false;
    }
    if (!readSection(*rootObj, "behavior", section) ||
        (section && !applyBehavior(*section, staged.behavior))) {
        return false;
    }
    if (!readSection(*rootObj, "enemies", section) || (section && !applyEnemies(*section, staged))) {
        return false;
    }
    if (!readSection(*rootObj, "difficulties", section) ||
        (section && !applyDifficulties(*section, staged))) {
        return false;
    }
    if (!readSection(*rootObj, "wave", section) || (section && !applyWave(*section, staged.wave))) {
        return false;
    }
    if (!readSection(*rootObj, "level", section) || (section && !applyLevel(*section, staged.level))) {
        return false;
    }
    if (!readSection(*rootObj, "power_ups", section) ||
        (section && !applyPowerUps(*section, staged.powerUp))) {
        return false;
    }
    if (!readSection(*rootObj, "particles", section) ||
        (section && !applyParticles(*section, staged.particle))) {
        return false;
    }

    config = staged;
    CONFIG_INFO("Config overlay applied, difficulty " + std::string(toString(config.difficulty)));
    return true;
}

bool ConfigLoader::applyField(const JsonObject& section, FieldConfig& field)
{
    m_path = "field";
    return readFloat(section, "width", field.width, 1.0f) &&
           readFloat(section, "height", field.height, 1.0f) &&
           readFloat(section, "prune_margin", field.pruneMargin, 0.0f);
}

bool ConfigLoader::applyPlayer(const JsonObject& section, PlayerConfig& player)
{
    m_path = "player";
    return readFloat(section, "speed", player.speed, 0.0f) &&
           readFloat(section, "max_health", player.maxHealth, 1.0f) &&
           readFloat(section, "fire_rate", player.fireRate, 0.0f) &&
           readFloat(section, "invulnerability_time", player.invulnerabilityTime, 0.0f) &&
           readFloat(section, "special_cooldown", player.specialCooldown, 0.0f) &&
           readFloat(section, "time_freeze_duration", player.timeFreezeDuration, 0.0f) &&
           readFloat(section, "contact_damage", player.contactDamage, 0.0f) &&
           readFloat(section, "rapid_fire_mult", player.rapidFireMult, 0.0f) &&
           readExtent(section, player.size);
}

bool ConfigLoader::applyBullet(const JsonObject& section, BulletConfig& bullet)
{
    m_path = "bullet";
    return readFloat(section, "speed", bullet.speed, 0.0f) &&
           readFloat(section, "damage", bullet.damage, 0.0f) &&
           readFloat(section, "max_lifetime", bullet.maxLifetime, 0.0f) &&
           readSize(section, "max_per_faction", bullet.maxPerFaction) &&
           readFloat(section, "homing_speed", bullet.homingSpeed, 0.0f) &&
           readFloat(section, "homing_turn_rate", bullet.homingTurnRate, 0.0f) &&
           readFloat(section, "homing_range", bullet.homingRange, 0.0f) &&
           readExtent(section, bullet.size);
}

bool ConfigLoader::applyBehavior(const JsonObject& section, BehaviorConfig& behavior)
{
    m_path = "behavior";
    return readFloat(section, "fire_range", behavior.fireRange, 0.0f) &&
           readFloat(section, "aimed_shot_speed_scale", behavior.aimedShotSpeedScale, 0.0f) &&
           readFloat(section, "fast_retarget_interval", behavior.fast.retargetInterval, 0.0f) &&
           readFloat(section, "zigzag_frequency", behavior.zigzag.frequency, NO_MIN) &&
           readFloat(section, "zigzag_amplitude", behavior.zigzag.amplitude, 0.0f) &&
           readFloat(section, "boss_pattern_duration", behavior.boss.patternDuration, 0.01f) &&
           readInt(section, "boss_spread_count", behavior.boss.spreadCount, 0) &&
           readInt(section, "boss_circle_count", behavior.boss.circleCount, 0) &&
           readInt(section, "boss_missile_count", behavior.boss.missileCount, 0);
}

bool ConfigLoader::applyEnemies(const JsonObject& section, GameConfig& config)
{
    for (const auto& [name, value] : section) {
        const auto variant = parseEnemyVariant(name);
        if (!variant) {
            CONFIG_WARN("Ignoring unknown enemy variant '" + name + "'");
            continue;
        }
        const JsonObject* stats = value.tryAsObject();
        if (!stats) {
            return fail("enemies." + name + ": expected an object");
        }

        EnemyStats& target = config.enemies[toIndex(*variant)];
        m_path = "enemies." + name;
        if (!readFloat(*stats, "speed", target.speed, 0.0f) ||
            !readFloat(*stats, "health", target.health, 1.0f) ||
            !readInt(*stats, "score", target.score, 0) ||
            !readFloat(*stats, "fire_rate", target.fireRate, 0.0f) ||
            !readFloat(*stats, "bullet_damage", target.bulletDamage, 0.0f) ||
            !readExtent(*stats, target.size)) {
            return false;
        }
    }
    return true;
}

bool ConfigLoader::applyDifficulties(const JsonObject& section, GameConfig& config)
{
    for (const auto& [name, value] : section) {
        const auto difficulty = parseDifficulty(name);
        if (!difficulty) {
            return fail("difficulties: unknown difficulty '" + name + "'");
        }
        const JsonObject* profile = value.tryAsObject();
        if (!profile) {
            return fail("difficulties." + name + ": expected an object");
        }

        DifficultyProfile& target = config.difficulties[static_cast<size_t>(*difficulty)];
        m_path = "difficulties." + name;
        if (!readFloat(*profile, "enemy_speed_mult", target.enemySpeedMult, 0.0f) ||
            !readFloat(*profile, "enemy_health_mult", target.enemyHealthMult, 0.0f) ||
            !readFloat(*profile, "player_damage_mult", target.playerDamageMult, 0.0f) ||
            !readFloat(*profile, "score_mult", target.scoreMult, 0.0f) ||
            !readFloat(*profile, "player_health_mult", target.playerHealthMult, 0.01f)) {
            return false;
        }
    }
    return true;
}

bool ConfigLoader::applyWave(const JsonObject& section, WaveConfig& wave)
{
    m_path = "wave";
    if (!readInt(section, "base_enemies", wave.baseEnemies, 0) ||
        !readInt(section, "enemies_per_wave", wave.enemiesPerWave, 0) ||
        !readInt(section, "boss_interval", wave.bossInterval, 0) ||
        !readFloat(section, "spawn_delay", wave.spawnDelay, 0.0f)) {
        return false;
    }

    const JsonValue* tablesValue = findKey(section, "tables");
    if (!tablesValue) {
        return true;
    }
    const JsonArray* tables = tablesValue->tryAsArray();
    if (!tables || tables->empty()) {
        return fail("wave.tables: expected a non-empty array");
    }

    std::vector<WaveTable> parsed;
    parsed.reserve(tables->size());
    for (size_t i = 0; i < tables->size(); ++i) {
        m_path = "wave.tables[" + std::to_string(i) + "]";
        const JsonObject* entry = (*tables)[i].tryAsObject();
        if (!entry) {
            return fail(m_path + ": expected an object");
        }

        WaveTable table{0, {}};
        table.weights.fill(0);
        const JsonValue* maxWave = findKey(*entry, "max_wave");
        if (!maxWave) {
            return fail(m_path + ".max_wave: missing");
        }
        if (!readInt(*entry, "max_wave", table.maxWave, 1)) {
            return false;
        }
        if (!parsed.empty() && table.maxWave <= parsed.back().maxWave) {
            return fail(m_path + ".max_wave: tables must be in increasing wave order");
        }

        const JsonValue* weightsValue = findKey(*entry, "weights");
        const JsonObject* weights = weightsValue ? weightsValue->tryAsObject() : nullptr;
        if (!weights) {
            return fail(m_path + ".weights: expected an object");
        }
        m_path += ".weights";
        for (const auto& weightEntry : *weights) {
            const std::string& name = weightEntry.first;
            const auto variant = parseEnemyVariant(name);
            if (!variant) {
                CONFIG_WARN("Ignoring unknown enemy variant '" + name + "' in " + m_path);
                continue;
            }
            if (*variant == EnemyVariant::Boss) {
                return fail(m_path + ".boss: bosses are only spawned on boss waves");
            }
            if (!readInt(*weights, name, table.weights[toIndex(*variant)], 0)) {
                return false;
            }
        }
        parsed.push_back(table);
    }

    wave.tables = std::move(parsed);
    return true;
}

bool ConfigLoader::applyLevel(const JsonObject& section, LevelConfig& level)
{
    m_path = "level";
    if (!readInt(section, "start_level", level.startLevel, 1) ||
        !readInt(section, "max_level", level.maxLevel, 1) ||
        !readInt(section, "base_waves", level.baseWaves, 1) ||
        !readInt(section, "waves_per_level", level.wavesPerLevel, 0)) {
        return false;
    }
    if (level.startLevel > level.maxLevel) {
        return fail("level.start_level: level " + std::to_string(level.startLevel) +
                    " is above max_level " + std::to_string(level.maxLevel));
    }
    return true;
}

bool ConfigLoader::applyPowerUps(const JsonObject& section, PowerUpConfig& powerUp)
{
    m_path = "power_ups";
    if (!readFloat(section, "drop_chance", powerUp.dropChance, 0.0f, 1.0f) ||
        !readFloat(section, "duration", powerUp.duration, 0.0f) ||
        !readFloat(section, "descent_speed", powerUp.descentSpeed, NO_MIN) ||
        !readFloat(section, "max_age", powerUp.maxAge, 0.0f) ||
        !readFloat(section, "heal_amount", powerUp.healAmount, 0.0f) ||
        !readFloat(section, "time_slow_scale", powerUp.timeSlowScale, 0.0f, 1.0f) ||
        !readExtent(section, powerUp.size)) {
        return false;
    }

    const JsonValue* weightsValue = findKey(section, "weights");
    if (!weightsValue) {
        return true;
    }
    const JsonObject* weights = weightsValue->tryAsObject();
    if (!weights) {
        return fail("power_ups.weights: expected an object");
    }

    m_path = "power_ups.weights";
    for (const auto& weightEntry : *weights) {
        const std::string& name = weightEntry.first;
        const auto kind = parsePowerUpKind(name);
        if (!kind) {
            CONFIG_WARN("Ignoring unknown power-up kind '" + name + "'");
            continue;
        }
        if (!readInt(*weights, name, powerUp.weights[toIndex(*kind)], 0)) {
            return false;
        }
    }
    return true;
}

bool ConfigLoader::applyParticles(const JsonObject& section, ParticleConfig& particle)
{
    m_path = "particles";
    return readSize(section, "max_particles", particle.maxParticles) &&
           readInt(section, "hit_intensity", particle.hitIntensity, 0) &&
           readInt(section, "blast_intensity", particle.blastIntensity, 0);
}

bool ConfigLoader::readFloat(const JsonObject& section, const std::string& key, float& out,
                             float minValue, float maxValue)
{
    const JsonValue* value = findKey(section, key);
    if (!value) {
        return true;
    }

    const auto number = value->tryAsNumber();
    if (!number) {
        return fail(m_path + "." + key + ": expected a number, got " +
                    std::string(toString(value->getType())));
    }
    if (!std::isfinite(*number) || *number < minValue || *number > maxValue) {
        return fail(m_path + "." + key + ": value " + std::to_string(*number) + " out of range");
    }

    out = static_cast<float>(*number);
    return true;
}

bool ConfigLoader::readInt(const JsonObject& section, const std::string& key, int& out,
                           int minValue)
{
    const JsonValue* value = findKey(section, key);
    if (!value) {
        return true;
    }

    const auto number = value->tryAsInt();
    if (!number) {
        return fail(m_path + "." + key + ": expected an integer");
    }
    if (*number < minValue) {
        return fail(m_path + "." + key + ": value " + std::to_string(*number) +
                    " is below " + std::to_string(minValue));
    }

    out = *number;
    return true;
}

bool ConfigLoader::readSize(const JsonObject& section, const std::string& key, size_t& out)
{
    int value = static_cast<int>(out);
    if (!readInt(section, key, value, 0)) {
        return false;
    }
    out = static_cast<size_t>(value);
    return true;
}

bool ConfigLoader::readExtent(const JsonObject& section, Vector2D& out)
{
    float width = out.getX();
    float height = out.getY();
    if (!readFloat(section, "width", width, 0.0f) || !readFloat(section, "height", height, 0.0f)) {
        return false;
    }
    out = Vector2D(width, height);
    return true;
}

bool ConfigLoader::readSection(const JsonObject& parent, const std::string& key,
                               const JsonObject*& out)
{
    out = nullptr;
    const JsonValue* value = findKey(parent, key);
    if (!value) {
        return true;
    }

    out = value->tryAsObject();
    if (!out) {
        return fail(key + ": expected an object");
    }
    return true;
}

bool ConfigLoader::fail(const std::string& message)
{
    m_lastError = message;
    CONFIG_WARN("Config rejected: " + message);
    return false;
}

} // namespace Cosmic

#include "CombatDataLoader.h"

#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

#include "../engine/core/Logger.h"

namespace Defense {

namespace {

using Bulwark::ECS::CategoryMask;
namespace Category = Bulwark::ECS::Category;

ETargetPriority readPriority(const nlohmann::json& j, const std::string& owner) {
    const std::string text = j.value("priority", std::string("First"));
    if (auto p = parsePriority(text)) return *p;
    Bulwark::logWarn("[CombatData] " + owner + ": unknown priority '" + text + "', using First");
    return ETargetPriority::First;
}

Bulwark::Gameplay::DamageType readDamageType(const nlohmann::json& j, const std::string& owner) {
    const std::string text = j.value("damageType", std::string("True"));
    if (auto t = Bulwark::Gameplay::parseDamageType(text)) return *t;
    Bulwark::logWarn("[CombatData] " + owner + ": unknown damage type '" + text + "', using True");
    return Bulwark::Gameplay::DamageType::True;
}

CategoryMask readTargets(const nlohmann::json& j, const std::string& owner) {
    if (!j.contains("targets") || !j["targets"].is_array()) {
        return Category::Enemy;
    }
    CategoryMask mask = Category::None;
    for (const auto& v : j["targets"]) {
        if (!v.is_string()) continue;
        const std::string name = v.get<std::string>();
        if (name == "Ground") {
            mask |= Category::Ground;
        } else if (name == "Air") {
            mask |= Category::Air;
        } else {
            Bulwark::logWarn("[CombatData] " + owner + ": unknown target category '" + name + "'");
        }
    }
    return mask == Category::None ? Category::Enemy : mask;
}

// Negative sizes keep the fallback; oversized ones are clamped.
std::size_t readPoolSize(const nlohmann::json& j, const char* key, std::size_t fallback, const std::string& owner) {
    if (!j.contains(key)) return fallback;
    const long long raw = j[key].get<long long>();
    if (raw < 0) {
        Bulwark::logWarn("[CombatData] " + owner + ": negative " + key + " " + std::to_string(raw) + ", using " +
                         std::to_string(fallback));
        return fallback;
    }
    if (static_cast<unsigned long long>(raw) > kMaxPoolSize) {
        Bulwark::logWarn("[CombatData] " + owner + ": " + key + " " + std::to_string(raw) + " clamped to " +
                         std::to_string(kMaxPoolSize));
        return kMaxPoolSize;
    }
    return static_cast<std::size_t>(raw);
}

CombatSettings readSettings(const nlohmann::json& j) {
    CombatSettings s;
    s.targetUpdateInterval = j.value("targetUpdateInterval", s.targetUpdateInterval);
    s.aimToleranceDegrees = j.value("aimToleranceDegrees", s.aimToleranceDegrees);
    s.turretRotationSpeed = j.value("turretRotationSpeed", s.turretRotationSpeed);
    s.useLeadPrediction = j.value("useLeadPrediction", s.useLeadPrediction);
    s.lockVerticalAxis = j.value("lockVerticalAxis", s.lockVerticalAxis);
    s.requireAiming = j.value("requireAiming", s.requireAiming);
    s.projectilePoolSize = readPoolSize(j, "projectilePoolSize", s.projectilePoolSize, "settings");
    return s;
}

ProjectileArchetype readProjectile(const nlohmann::json& j) {
    ProjectileArchetype p;
    p.id = j.value("id", std::string{});
    p.speed = j.value("speed", p.speed);
    p.lifetime = j.value("lifetime", p.lifetime);
    p.trackTarget = j.value("trackTarget", p.trackTarget);
    p.rotationSpeed = j.value("rotationSpeed", p.rotationSpeed);
    p.hitRadius = j.value("hitRadius", p.hitRadius);
    p.poolSize = readPoolSize(j, "poolSize", p.poolSize, "projectile '" + p.id + "'");
    return p;
}

TowerStats readTower(const nlohmann::json& j) {
    TowerStats t;
    t.id = j.value("id", std::string{});
    t.name = j.value("name", t.id);
    const std::string owner = "tower '" + t.id + "'";
    t.range = j.value("range", t.range);
    t.attackSpeed = j.value("attackSpeed", t.attackSpeed);
    t.damage = j.value("damage", t.damage);
    t.damageType = readDamageType(j, owner);
    t.critChance = j.value("critChance", t.critChance);
    t.critMultiplier = j.value("critMultiplier", t.critMultiplier);
    t.aoeRadius = j.value("aoeRadius", t.aoeRadius);
    t.projectile = j.value("projectile", std::string{});
    t.projectileSpeed = j.value("projectileSpeed", t.projectileSpeed);
    t.priority = readPriority(j, owner);
    t.targets = readTargets(j, owner);
    t.slowAmount = j.value("slowAmount", t.slowAmount);
    t.slowDuration = j.value("slowDuration", t.slowDuration);
    t.dotDamagePerTick = j.value("dotDamagePerTick", t.dotDamagePerTick);
    t.dotTickInterval = j.value("dotTickInterval", t.dotTickInterval);
    t.dotDuration = j.value("dotDuration", t.dotDuration);
    return t;
}

EnemyDefinition readEnemy(const nlohmann::json& j) {
    EnemyDefinition e;
    e.id = j.value("id", std::string{});
    e.maxHealth = j.value("maxHealth", e.maxHealth);
    e.armor = j.value("armor", e.armor);
    e.moveSpeed = j.value("moveSpeed", e.moveSpeed);
    e.flying = j.value("flying", e.flying);
    e.reward = j.value("reward", e.reward);
    e.radius = j.value("radius", e.radius);
    return e;
}

std::optional<CombatData> parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        Bulwark::logError("[CombatData] root must be an object");
        return std::nullopt;
    }
    CombatData data;
    if (j.contains("settings") && j["settings"].is_object()) {
        data.settings = readSettings(j["settings"]);
    }
    if (j.contains("projectiles") && j["projectiles"].is_array()) {
        for (const auto& p : j["projectiles"]) {
            if (p.is_object()) data.projectiles.push_back(readProjectile(p));
        }
    }
    if (j.contains("towers") && j["towers"].is_array()) {
        for (const auto& t : j["towers"]) {
            if (t.is_object()) data.towers.push_back(readTower(t));
        }
    }
    if (j.contains("enemies") && j["enemies"].is_array()) {
        for (const auto& e : j["enemies"]) {
            if (e.is_object()) data.enemies.push_back(readEnemy(e));
        }
    }
    return data;
}

}  // namespace

const ProjectileArchetype* CombatData::findProjectile(const std::string& id) const {
    for (const auto& p : projectiles) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

const TowerStats* CombatData::findTower(const std::string& id) const {
    for (const auto& t : towers) {
        if (t.id == id) return &t;
    }
    return nullptr;
}

const EnemyDefinition* CombatData::findEnemy(const std::string& id) const {
    for (const auto& e : enemies) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

std::optional<CombatData> CombatDataLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Bulwark::logError("[CombatData] cannot open " + path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        in >> j;
        return parse(j);
    } catch (const nlohmann::json::exception& ex) {
        Bulwark::logError("[CombatData] failed to parse " + path + ": " + ex.what());
        return std::nullopt;
    }
}

std::optional<CombatData> CombatDataLoader::loadFromString(const std::string& text) {
    try {
        return parse(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& ex) {
        Bulwark::logError(std::string("[CombatData] failed to parse document: ") + ex.what());
        return std::nullopt;
    }
}

std::size_t CombatDataLoader::validate(const CombatData& data) {
    std::size_t errors = 0;
    auto report = [&errors](const std::string& msg) {
        Bulwark::logError("[CombatData] " + msg);
        ++errors;
    };

    if (data.settings.projectilePoolSize > kMaxPoolSize) {
        report("settings.projectilePoolSize " + std::to_string(data.settings.projectilePoolSize) + " exceeds " +
               std::to_string(kMaxPoolSize));
    }
    for (const auto& p : data.projectiles) {
        if (p.id.empty()) report("projectile without id");
        if (p.poolSize > kMaxPoolSize) {
            report("projectile '" + p.id + "' pool size " + std::to_string(p.poolSize) + " exceeds " +
                   std::to_string(kMaxPoolSize));
        }
        if (p.speed <= 0.0f) report("projectile '" + p.id + "' has non-positive speed");
        if (p.lifetime <= 0.0f) report("projectile '" + p.id + "' has non-positive lifetime");
    }
    for (const auto& t : data.towers) {
        if (t.id.empty()) report("tower without id");
        if (t.attackSpeed <= 0.0f) report("tower '" + t.id + "' has non-positive attack speed");
        if (t.range <= 0.0f) report("tower '" + t.id + "' has non-positive range");
        if (t.usesProjectile()) {
            if (!data.findProjectile(t.projectile)) {
                report("tower '" + t.id + "' references unknown projectile '" + t.projectile + "'");
            }
            if (t.projectileSpeed < 0.0f) report("tower '" + t.id + "' has negative projectile speed");
        }
    }
    for (const auto& e : data.enemies) {
        if (e.id.empty()) report("enemy without id");
        if (e.maxHealth <= 0.0f) report("enemy '" + e.id + "' has non-positive max health");
    }
    return errors;
}

}  // namespace Defense

// Damage types, hit payload and the armor/critical damage laws.
#pragma once

#include <optional>
#include <random>
#include <string_view>

#include "../ecs/Entity.h"
#include "../math/Vec3.h"

namespace Bulwark::Gameplay {

enum class DamageType {
    Physical,  // reduced by armor
    Magic,     // reduced by armor
    True       // ignores armor
};

struct DamageInfo {
    float amount{0.0f};
    ECS::Entity source{ECS::kInvalidEntity};
    Vec3 hitPoint{};
    bool isCritical{false};
    DamageType type{DamageType::Physical};
};

// Every landed hit deals at least this much.
constexpr float kMinimumDamage = 1.0f;
constexpr float kDefaultCritMultiplier = 2.0f;

inline bool damageUsesArmor(DamageType type) { return type != DamageType::True; }

// max(1, base * multiplier - armor).
float calculateDamage(float baseDamage, float armor, float multiplier = 1.0f);

// Applies armor to an already scaled amount; True damage skips armor but keeps the floor.
float applyArmorReduction(float damage, float armor, DamageType type);

float calculateCriticalDamage(float baseDamage, float critMultiplier = kDefaultCritMultiplier);

bool rollCritical(float critChance, std::mt19937& rng);

struct CritResult {
    float damage{0.0f};
    bool isCritical{false};
};

// Rolls a crit against critChance, scales, then applies armor.
CritResult calculateDamageWithCrit(float baseDamage, float armor, float critChance, float critMultiplier,
                                   DamageType type, std::mt19937& rng);

std::string_view toString(DamageType type);
std::optional<DamageType> parseDamageType(std::string_view text);

}  // namespace Bulwark::Gameplay

// Authoring data for combat units, projectile archetypes and enemies.
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "../engine/ecs/components/Collider.h"
#include "../engine/gameplay/Damage.h"

namespace Defense {

enum class ETargetPriority {
    First,      // furthest along the path
    Nearest,
    Strongest,
    Weakest,
    Fastest
};

std::string_view toString(ETargetPriority priority);
std::optional<ETargetPriority> parsePriority(std::string_view text);

// Pool sizes above this are clamped when loading and rejected by validation.
constexpr std::size_t kMaxPoolSize = 4096;

struct CombatSettings {
    float targetUpdateInterval{0.1f};
    float aimToleranceDegrees{5.0f};
    float turretRotationSpeed{180.0f};  // degrees per second
    bool useLeadPrediction{true};
    bool lockVerticalAxis{true};
    bool requireAiming{true};
    std::size_t projectilePoolSize{20};
};

struct ProjectileArchetype {
    std::string id;
    float speed{15.0f};
    float lifetime{5.0f};
    bool trackTarget{true};
    float rotationSpeed{720.0f};  // degrees per second
    float hitRadius{0.25f};
    std::size_t poolSize{0};  // 0 uses CombatSettings::projectilePoolSize
};

// Used when attackSpeed is not positive.
constexpr float kFallbackAttackInterval = 1.0f;

struct TowerStats {
    std::string id;
    std::string name;
    float range{5.0f};
    float attackSpeed{1.0f};  // attacks per second
    float damage{10.0f};
    Bulwark::Gameplay::DamageType damageType{Bulwark::Gameplay::DamageType::True};
    float critChance{0.0f};
    float critMultiplier{Bulwark::Gameplay::kDefaultCritMultiplier};
    float aoeRadius{0.0f};          // 0 = single target
    std::string projectile;         // archetype id; empty = direct damage
    float projectileSpeed{10.0f};   // <= 0 disables lead prediction
    ETargetPriority priority{ETargetPriority::First};
    Bulwark::ECS::CategoryMask targets{Bulwark::ECS::Category::Enemy};
    float slowAmount{0.0f};
    float slowDuration{0.0f};
    float dotDamagePerTick{0.0f};
    float dotTickInterval{1.0f};
    float dotDuration{0.0f};

    float attackInterval() const { return attackSpeed > 0.0f ? 1.0f / attackSpeed : kFallbackAttackInterval; }
    bool usesProjectile() const { return !projectile.empty(); }
    bool hasSlow() const { return slowAmount > 0.0f && slowDuration > 0.0f; }
    bool hasDamageOverTime() const { return dotDamagePerTick > 0.0f && dotDuration > 0.0f; }
    float damagePerSecond() const { return damage * attackSpeed; }
};

struct EnemyDefinition {
    std::string id;
    float maxHealth{100.0f};
    float armor{0.0f};
    float moveSpeed{3.0f};
    bool flying{false};
    int reward{0};
    float radius{0.5f};

    Bulwark::ECS::CategoryMask category() const {
        return flying ? Bulwark::ECS::Category::Air : Bulwark::ECS::Category::Ground;
    }
};

}  // namespace Defense

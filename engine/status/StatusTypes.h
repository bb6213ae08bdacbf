// Status effect record: tagged kind with per-kind payloads.
#pragma once

#include <cstdint>
#include <string_view>

#include "../ecs/Entity.h"
#include "../gameplay/Damage.h"

namespace Bulwark::Status {

enum class EEffectKind : std::uint8_t { Slow, DamageOverTime };

constexpr std::size_t kEffectKindCount = 2;

// Damage-over-time intervals below this are raised to it.
constexpr float kMinimumTickInterval = 0.1f;

struct SlowPayload {
    float amount{0.0f};  // fraction of speed removed, [0,1]
};

struct DamageOverTimePayload {
    float damagePerTick{0.0f};
    float tickInterval{1.0f};
    float sinceLastTick{0.0f};
    Gameplay::DamageType damageType{Gameplay::DamageType::Magic};
};

struct StatusEffect {
    EEffectKind kind{EEffectKind::Slow};
    std::uint64_t id{0};  // assigned by the owning tracker
    float duration{0.0f};
    float remaining{0.0f};
    ECS::Entity source{ECS::kInvalidEntity};
    SlowPayload slowPayload{};
    DamageOverTimePayload dotPayload{};

    static StatusEffect slow(float amount, float duration, ECS::Entity source = ECS::kInvalidEntity);
    static StatusEffect damageOverTime(float damagePerTick, float tickInterval, float duration,
                                       Gameplay::DamageType type = Gameplay::DamageType::Magic,
                                       ECS::Entity source = ECS::kInvalidEntity);

    bool expired() const { return remaining <= 0.0f; }
    bool canStack() const { return kind == EEffectKind::DamageOverTime; }

    void refresh() { remaining = duration; }
    void refresh(float newDuration) {
        duration = newDuration;
        remaining = newDuration;
    }

    // Zero for non-damaging kinds.
    float damagePerSecond() const;
    float totalRemainingDamage() const;
};

std::string_view toString(EEffectKind kind);

}  // namespace Bulwark::Status

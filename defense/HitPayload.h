// Damage plus optional status payloads delivered by one hit.
#pragma once

#include "../engine/ecs/Entity.h"
#include "../engine/gameplay/Damage.h"
#include "CombatConfig.h"
#include "Targetable.h"

namespace Defense {

struct HitPayload {
    Bulwark::Gameplay::DamageInfo damage{};
    float slowAmount{0.0f};
    float slowDuration{0.0f};
    float dotDamagePerTick{0.0f};
    float dotTickInterval{1.0f};
    float dotDuration{0.0f};
    Bulwark::Gameplay::DamageType dotDamageType{Bulwark::Gameplay::DamageType::Magic};

    bool hasSlow() const { return slowAmount > 0.0f && slowDuration > 0.0f; }
    bool hasDamageOverTime() const { return dotDamagePerTick > 0.0f && dotDuration > 0.0f; }

    void clear() { *this = HitPayload{}; }
};

// Fills the status payload fields from tower stats; damage is left to the caller.
void copyEffectPayload(const TowerStats& stats, HitPayload& payload);

// Damage first, then status effects; a target killed by the damage receives no effects.
void deliverHit(IDamageable& target, const HitPayload& payload, const Bulwark::Vec3& hitPoint);

}  // namespace Defense

// Per-unit attack gating: cooldown, target and aim checks, projectile or direct damage.
#pragma once

#include <vector>

#include "../engine/core/Signal.h"
#include "../engine/ecs/Entity.h"
#include "CombatContext.h"
#include "HitPayload.h"

namespace Defense {

class Aiming;
class Projectile;
class Targeting;
struct CombatUnit;

class AttackController {
public:
    AttackController() = default;
    explicit AttackController(bool requireAiming) : requireAiming_(requireAiming) {}

    AttackController(const AttackController&) = delete;
    AttackController& operator=(const AttackController&) = delete;
    AttackController(AttackController&&) = default;
    AttackController& operator=(AttackController&&) = default;

    // Advances the cooldown and fires when every gate passes. `self` must carry
    // Transform, CombatUnit and Targeting; Aiming is optional.
    void update(Bulwark::ECS::Entity self, CombatContext& context, float dt);

    bool isReadyToAttack(Bulwark::ECS::Entity self, CombatContext& context) const;
    // Skips the cooldown but still needs a valid target and, when required, aim.
    bool forceAttack(Bulwark::ECS::Entity self, CombatContext& context);

    float cooldownRemaining(const CombatUnit& unit) const;
    float cooldownProgress(const CombatUnit& unit) const;
    float cooldownTimer() const { return timer_; }

    void setRequireAiming(bool required) { requireAiming_ = required; }
    bool requireAiming() const { return requireAiming_; }

    std::size_t projectilesInFlight() const;

    Bulwark::Signal<Bulwark::ECS::Entity, Bulwark::ECS::Entity> onAttack;  // unit, target
    Bulwark::Signal<Bulwark::ECS::Entity, float> onProjectileHit;           // unit, damage

private:
    bool targetAndAimReady(Bulwark::ECS::Entity self, CombatContext& context) const;
    void attack(Bulwark::ECS::Entity self, CombatContext& context);
    HitPayload buildPayload(Bulwark::ECS::Entity self, const CombatUnit& unit, std::mt19937& rng) const;
    bool launchProjectile(Bulwark::ECS::Entity self, Bulwark::ECS::Entity target, const HitPayload& payload,
                          CombatContext& context);
    void applyDirectDamage(Bulwark::ECS::Entity target, const CombatUnit& unit, const HitPayload& payload,
                           CombatContext& context);
    void pruneConnections();

    bool requireAiming_{true};
    float timer_{0.0f};
    std::vector<Bulwark::ScopedConnection> projectileConnections_;
};

}  // namespace Defense

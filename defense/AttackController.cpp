#include "AttackController.h"

#include <algorithm>

#include "../engine/core/Logger.h"
#include "../engine/spatial/SpatialQuery.h"
#include "Aiming.h"
#include "ProjectilePool.h"
#include "TargetDirectory.h"
#include "Targeting.h"
#include "components/CombatUnit.h"

namespace Defense {

using Bulwark::ECS::Entity;
using Bulwark::ECS::Transform;

void AttackController::update(Entity self, CombatContext& context, float dt) {
    timer_ += dt;
    pruneConnections();
    if (isReadyToAttack(self, context)) {
        attack(self, context);
    }
}

bool AttackController::targetAndAimReady(Entity self, CombatContext& context) const {
    const auto* targeting = context.registry.get<Targeting>(self);
    if (!targeting || !context.directory.isValid(targeting->currentTarget())) {
        return false;
    }
    const auto* aiming = context.registry.get<Aiming>(self);
    if (requireAiming_ && aiming && !aiming->isAimed()) {
        return false;
    }
    return true;
}

bool AttackController::isReadyToAttack(Entity self, CombatContext& context) const {
    const auto* unit = context.registry.get<CombatUnit>(self);
    if (!unit || timer_ < unit->stats.attackInterval()) {
        return false;
    }
    return targetAndAimReady(self, context);
}

bool AttackController::forceAttack(Entity self, CombatContext& context) {
    if (!context.registry.get<CombatUnit>(self) || !targetAndAimReady(self, context)) {
        return false;
    }
    attack(self, context);
    return true;
}

float AttackController::cooldownRemaining(const CombatUnit& unit) const {
    return std::max(0.0f, unit.stats.attackInterval() - timer_);
}

float AttackController::cooldownProgress(const CombatUnit& unit) const {
    return std::clamp(timer_ / unit.stats.attackInterval(), 0.0f, 1.0f);
}

std::size_t AttackController::projectilesInFlight() const {
    return static_cast<std::size_t>(std::count_if(projectileConnections_.begin(), projectileConnections_.end(),
                                                  [](const Bulwark::ScopedConnection& c) { return c.connected(); }));
}

HitPayload AttackController::buildPayload(Entity self, const CombatUnit& unit, std::mt19937& rng) const {
    const auto& stats = unit.stats;
    HitPayload payload;
    payload.damage.source = self;
    payload.damage.type = stats.damageType;
    payload.damage.isCritical = Bulwark::Gameplay::rollCritical(stats.critChance, rng);
    payload.damage.amount = payload.damage.isCritical
                                ? Bulwark::Gameplay::calculateCriticalDamage(stats.damage, stats.critMultiplier)
                                : stats.damage;
    copyEffectPayload(stats, payload);
    return payload;
}

void AttackController::attack(Entity self, CombatContext& context) {
    const auto* targeting = context.registry.get<Targeting>(self);
    const auto* unit = context.registry.get<CombatUnit>(self);
    const Entity target = targeting->currentTarget();

    timer_ = 0.0f;
    const HitPayload payload = buildPayload(self, *unit, context.rng);

    if (!unit->stats.usesProjectile() || !launchProjectile(self, target, payload, context)) {
        applyDirectDamage(target, *unit, payload, context);
    }
    onAttack.emit(self, target);
}

bool AttackController::launchProjectile(Entity self, Entity target, const HitPayload& payload,
                                        CombatContext& context) {
    const auto* unit = context.registry.get<CombatUnit>(self);
    const auto* transform = context.registry.get<Transform>(self);
    const std::string& archetypeId = unit->stats.projectile;

    if (!context.projectiles) {
        Bulwark::logWarn("[AttackController] no projectile pool for '" + archetypeId +
                         "'; falling back to direct damage");
        return false;
    }
    if (!context.projectiles->hasPool(archetypeId)) {
        Bulwark::logWarn("[AttackController] unknown projectile archetype '" + archetypeId +
                         "'; falling back to direct damage");
        return false;
    }

    const Bulwark::Vec3 origin = transform ? unit->firePoint(*transform) : Bulwark::Vec3{};
    const Bulwark::Vec3 forward = transform ? transform->forward : Bulwark::Vec3::forward();
    Projectile* projectile = context.projectiles->get(archetypeId, origin, forward);
    if (!projectile) {
        Bulwark::logWarn("[AttackController] projectile pool '" + archetypeId +
                         "' returned nothing; falling back to direct damage");
        return false;
    }

    ProjectileLaunch launch;
    launch.target = target;
    launch.speed = unit->stats.projectileSpeed;
    launch.aoeRadius = unit->stats.aoeRadius;
    launch.mask = unit->stats.targets;
    launch.payload = payload;
    projectile->initialize(launch, context.directory);

    // Released when the projectile resets on return, or with this controller.
    projectileConnections_.emplace_back(projectile->onHit.connect(
        [this, self](Projectile&, float damage) { onProjectileHit.emit(self, damage); }));
    return true;
}

void AttackController::applyDirectDamage(Entity target, const CombatUnit& unit, const HitPayload& payload,
                                         CombatContext& context) {
    auto& directory = context.directory;
    const Bulwark::Vec3 center = directory.targetable(target)->aimPoint();

    if (IDamageable* primary = directory.damageable(target)) {
        deliverHit(*primary, payload, center);
    }

    if (unit.stats.aoeRadius <= 0.0f) {
        return;
    }
    Bulwark::QueryBuffer<> splash;
    splash.query(directory, center, unit.stats.aoeRadius, unit.stats.targets);
    for (Entity e : splash) {
        // The primary target was already hit above.
        if (e == target || !directory.isValid(e)) continue;
        if (IDamageable* d = directory.damageable(e)) {
            deliverHit(*d, payload, center);
        }
    }
}

void AttackController::pruneConnections() {
    projectileConnections_.erase(
        std::remove_if(projectileConnections_.begin(), projectileConnections_.end(),
                       [](const Bulwark::ScopedConnection& c) { return !c.connected(); }),
        projectileConnections_.end());
}

}  // namespace Defense

#include "CombatSimulation.h"

#include <algorithm>

namespace Defense {

using Bulwark::ECS::Entity;
using Bulwark::ECS::Transform;

CombatSimulation::CombatSimulation(CombatSettings settings, std::uint32_t seed)
    : settings_(settings),
      directory_(registry_),
      projectiles_(settings.projectilePoolSize),
      rng_(seed),
      context_{registry_, directory_, &projectiles_, rng_} {}

Entity CombatSimulation::addUnit(const TowerStats& stats, const Bulwark::Vec3& position, const Bulwark::Vec3& forward) {
    const Entity e = registry_.create();
    registry_.emplace<Transform>(e, Transform{position, forward.nearlyZero() ? Bulwark::Vec3::forward() : forward.normalized()});
    registry_.emplace<CombatUnit>(e, CombatUnit{stats, {0.0f, 0.5f, 0.0f}});
    registry_.emplace<Targeting>(e, stats.range, stats.priority, stats.targets, settings_.targetUpdateInterval);
    registry_.emplace<Aiming>(e, settings_.turretRotationSpeed, settings_.aimToleranceDegrees,
                              settings_.useLeadPrediction, settings_.lockVerticalAxis);
    registry_.emplace<AttackController>(e, settings_.requireAiming);
    units_.push_back(e);
    return e;
}

void CombatSimulation::removeUnit(Entity unit) {
    auto it = std::find(units_.begin(), units_.end(), unit);
    if (it == units_.end()) {
        return;
    }
    units_.erase(it);
    registry_.destroy(unit);
}

Entity CombatSimulation::addTarget(ITargetable& targetable, IDamageable* damageable,
                                   const Bulwark::ECS::Collider& collider) {
    return directory_.add(targetable, damageable, collider);
}

void CombatSimulation::removeTarget(Entity target) { directory_.remove(target); }

void CombatSimulation::tick(const Bulwark::TimeStep& step) { tick(step.dt()); }

void CombatSimulation::tick(float dt) {
    for (Entity e : units_) {
        auto* tf = registry_.get<Transform>(e);
        auto* targeting = registry_.get<Targeting>(e);
        if (tf && targeting) {
            targeting->update(tf->position, directory_, dt);
        }
    }

    for (Entity e : units_) {
        auto* tf = registry_.get<Transform>(e);
        auto* unit = registry_.get<CombatUnit>(e);
        auto* targeting = registry_.get<Targeting>(e);
        auto* aiming = registry_.get<Aiming>(e);
        if (tf && unit && targeting && aiming) {
            aiming->update(*tf, unit->firePoint(*tf), targeting->currentTarget(), directory_, unit->leadSpeed(), dt);
        }
    }

    for (Entity e : units_) {
        if (auto* attack = registry_.get<AttackController>(e)) {
            attack->update(e, context_, dt);
        }
    }

    projectiles_.update(dt, context_);

    // Ticking may kill a target and let a listener unregister it.
    trackerScratch_.assign(directory_.entities().begin(), directory_.entities().end());
    for (Entity e : trackerScratch_) {
        IDamageable* d = directory_.damageable(e);
        if (!d) continue;
        if (auto* tracker = d->effects()) {
            tracker->update(dt);
        }
    }
}

}  // namespace Defense

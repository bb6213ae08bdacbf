// Owns the combat services and runs one ordered simulation tick over every unit.
#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "../engine/core/Time.h"
#include "../engine/ecs/Registry.h"
#include "../engine/ecs/components/Transform.h"
#include "Aiming.h"
#include "AttackController.h"
#include "CombatConfig.h"
#include "CombatContext.h"
#include "ProjectilePool.h"
#include "TargetDirectory.h"
#include "Targeting.h"
#include "components/CombatUnit.h"

namespace Defense {

class CombatSimulation {
public:
    explicit CombatSimulation(CombatSettings settings = {}, std::uint32_t seed = 1337u);

    CombatSimulation(const CombatSimulation&) = delete;
    CombatSimulation& operator=(const CombatSimulation&) = delete;

    Bulwark::ECS::Entity addUnit(const TowerStats& stats, const Bulwark::Vec3& position,
                                 const Bulwark::Vec3& forward = Bulwark::Vec3::forward());
    void removeUnit(Bulwark::ECS::Entity unit);
    const std::vector<Bulwark::ECS::Entity>& units() const { return units_; }

    Bulwark::ECS::Entity addTarget(ITargetable& targetable, IDamageable* damageable,
                                   const Bulwark::ECS::Collider& collider);
    void removeTarget(Bulwark::ECS::Entity target);

    bool registerProjectile(const ProjectileArchetype& archetype) { return projectiles_.registerArchetype(archetype); }

    // Targeting, Aiming, AttackController, projectiles, then effect trackers.
    void tick(const Bulwark::TimeStep& step);
    void tick(float dt);

    Bulwark::ECS::Transform* transform(Bulwark::ECS::Entity unit) { return registry_.get<Bulwark::ECS::Transform>(unit); }
    CombatUnit* unit(Bulwark::ECS::Entity unit) { return registry_.get<CombatUnit>(unit); }
    Targeting* targeting(Bulwark::ECS::Entity unit) { return registry_.get<Targeting>(unit); }
    Aiming* aiming(Bulwark::ECS::Entity unit) { return registry_.get<Aiming>(unit); }
    AttackController* attack(Bulwark::ECS::Entity unit) { return registry_.get<AttackController>(unit); }

    Bulwark::ECS::Registry& registry() { return registry_; }
    TargetDirectory& directory() { return directory_; }
    ProjectilePool& projectiles() { return projectiles_; }
    CombatContext& context() { return context_; }
    const CombatSettings& settings() const { return settings_; }
    std::mt19937& rng() { return rng_; }

private:
    CombatSettings settings_;
    Bulwark::ECS::Registry registry_;
    TargetDirectory directory_;
    ProjectilePool projectiles_;
    std::mt19937 rng_;
    CombatContext context_;
    std::vector<Bulwark::ECS::Entity> units_;
    std::vector<Bulwark::ECS::Entity> trackerScratch_;
};

}  // namespace Defense

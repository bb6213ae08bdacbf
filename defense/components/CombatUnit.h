// Placed combat unit: tower stats plus firing point offset from its transform.
#pragma once

#include "../../engine/ecs/components/Transform.h"
#include "../CombatConfig.h"

namespace Defense {

struct CombatUnit {
    TowerStats stats{};
    Bulwark::Vec3 firePointOffset{0.0f, 0.5f, 0.0f};

    Bulwark::Vec3 firePoint(const Bulwark::ECS::Transform& transform) const { return transform.position + firePointOffset; }

    // Lead prediction only applies to projectile towers.
    float leadSpeed() const { return stats.usesProjectile() ? stats.projectileSpeed : 0.0f; }
};

}  // namespace Defense

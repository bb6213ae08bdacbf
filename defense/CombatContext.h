// Explicit simulation services handed to per-unit components each tick.
#pragma once

#include <random>

#include "../engine/ecs/Registry.h"

namespace Defense {

class TargetDirectory;
class ProjectilePool;

struct CombatContext {
    Bulwark::ECS::Registry& registry;
    TargetDirectory& directory;
    ProjectilePool* projectiles{nullptr};  // null forces direct damage
    std::mt19937& rng;
};

}  // namespace Defense

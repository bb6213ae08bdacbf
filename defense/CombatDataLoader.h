// Loads combat settings, projectile archetypes, towers and enemies from JSON.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CombatConfig.h"

namespace Defense {

struct CombatData {
    CombatSettings settings{};
    std::vector<ProjectileArchetype> projectiles;
    std::vector<TowerStats> towers;
    std::vector<EnemyDefinition> enemies;

    const ProjectileArchetype* findProjectile(const std::string& id) const;
    const TowerStats* findTower(const std::string& id) const;
    const EnemyDefinition* findEnemy(const std::string& id) const;
};

class CombatDataLoader {
public:
    // nullopt when the file is missing or is not valid JSON.
    static std::optional<CombatData> loadFromFile(const std::string& path);
    static std::optional<CombatData> loadFromString(const std::string& text);

    // Logs every configuration error and returns how many were found. Entries stay in
    // place so the runtime fallbacks apply.
    static std::size_t validate(const CombatData& data);
};

}  // namespace Defense

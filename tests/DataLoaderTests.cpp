// JSON combat data: parsing, defaults, fallbacks and validation.
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

#include "../defense/CombatDataLoader.h"
#include "../defense/ProjectilePool.h"
#include "TestSupport.h"

using Defense::CombatData;
using Defense::CombatDataLoader;
using Defense::ETargetPriority;

namespace Category = Bulwark::ECS::Category;

int main() {
    {
        // Full document.
        const std::string doc = R"({
            "settings": { "targetUpdateInterval": 0.2, "requireAiming": false, "projectilePoolSize": 8 },
            "projectiles": [ { "id": "arrow", "speed": 18, "lifetime": 3, "trackTarget": false, "poolSize": 4 } ],
            "towers": [ {
                "id": "archer", "name": "Archer", "range": 6, "attackSpeed": 2, "damage": 8,
                "damageType": "Physical", "critChance": 0.25, "projectile": "arrow", "projectileSpeed": 18,
                "priority": "Nearest", "targets": ["Air"], "slowAmount": 0.3, "slowDuration": 1.5
            } ],
            "enemies": [ { "id": "wasp", "maxHealth": 40, "armor": 2, "moveSpeed": 4.5, "flying": true, "reward": 6 } ]
        })";
        const auto data = CombatDataLoader::loadFromString(doc);
        assert(data.has_value());
        assert(data->settings.targetUpdateInterval == 0.2f);
        assert(!data->settings.requireAiming);
        assert(data->settings.projectilePoolSize == 8);
        assert(data->settings.aimToleranceDegrees == 5.0f);

        const auto* arrow = data->findProjectile("arrow");
        assert(arrow && arrow->speed == 18.0f && !arrow->trackTarget && arrow->poolSize == 4);

        const auto* archer = data->findTower("archer");
        assert(archer);
        assert(archer->name == "Archer");
        assert(archer->attackInterval() == 0.5f);
        assert(archer->damageType == Bulwark::Gameplay::DamageType::Physical);
        assert(archer->critChance == 0.25f);
        assert(archer->usesProjectile());
        assert(archer->priority == ETargetPriority::Nearest);
        assert(archer->targets == Category::Air);
        assert(archer->hasSlow());
        assert(!archer->hasDamageOverTime());

        const auto* wasp = data->findEnemy("wasp");
        assert(wasp && wasp->flying && wasp->category() == Category::Air);
        assert(wasp->radius == 0.5f);
        assert(data->findTower("ghost") == nullptr);
        assert(CombatDataLoader::validate(*data) == 0);
    }
    {
        // Missing fields take defaults; unknown enum text warns and falls back.
        TestSupport::LogCapture logs;
        const auto data = CombatDataLoader::loadFromString(
            R"({ "towers": [ { "id": "odd", "priority": "Loudest", "damageType": "Fire", "targets": ["Water"] } ] })");
        assert(data.has_value());
        const auto& tower = data->towers.front();
        assert(tower.name == "odd");
        assert(tower.priority == ETargetPriority::First);
        assert(tower.damageType == Bulwark::Gameplay::DamageType::True);
        assert(tower.targets == Category::Enemy);
        assert(!tower.usesProjectile());
        assert(logs.count(Bulwark::LogLevel::Warning) == 3);
        assert(data->settings.projectilePoolSize == 20);
    }
    {
        // Malformed input yields nullopt with an error.
        TestSupport::LogCapture logs;
        assert(!CombatDataLoader::loadFromString("{ \"towers\": [ ").has_value());
        assert(!CombatDataLoader::loadFromString("[1, 2, 3]").has_value());
        assert(!CombatDataLoader::loadFromString(R"({ "towers": [ { "range": "far" } ] })").has_value());
        assert(logs.count(Bulwark::LogLevel::Error) == 3);
    }
    {
        // Validation reports every broken entry.
        TestSupport::LogCapture logs;
        const auto data = CombatDataLoader::loadFromString(R"({
            "projectiles": [ { "id": "", "speed": 0 } ],
            "towers": [ { "id": "bad", "attackSpeed": 0, "range": -1, "projectile": "nowhere" } ],
            "enemies": [ { "id": "ghost", "maxHealth": 0 } ]
        })");
        assert(data.has_value());
        assert(CombatDataLoader::validate(*data) == 6);
        assert(logs.contains("references unknown projectile 'nowhere'"));
    }
    {
        // Negative pool sizes fall back to the defaults instead of wrapping around.
        TestSupport::LogCapture logs;
        const auto data = CombatDataLoader::loadFromString(
            R"({ "settings": { "projectilePoolSize": -1 }, "projectiles": [ { "id": "a", "poolSize": -5 } ] })");
        assert(data.has_value());
        assert(data->settings.projectilePoolSize == 20);
        assert(data->findProjectile("a")->poolSize == 0);
        assert(logs.count(Bulwark::LogLevel::Warning) == 2);
        assert(CombatDataLoader::validate(*data) == 0);

        Defense::ProjectilePool pool(data->settings.projectilePoolSize);
        assert(pool.registerArchetype(*data->findProjectile("a")));
        assert(pool.totalInactive() == 20);
    }
    {
        // Oversized pools are clamped on load and rejected when built by hand.
        TestSupport::LogCapture logs;
        auto data = CombatDataLoader::loadFromString(R"({ "projectiles": [ { "id": "a", "poolSize": 1000000 } ] })");
        assert(data.has_value());
        assert(data->findProjectile("a")->poolSize == Defense::kMaxPoolSize);
        assert(logs.contains("clamped"));
        assert(CombatDataLoader::validate(*data) == 0);

        data->settings.projectilePoolSize = Defense::kMaxPoolSize + 1;
        data->projectiles.front().poolSize = Defense::kMaxPoolSize + 1;
        assert(CombatDataLoader::validate(*data) == 2);
    }
    {
        // Files: missing path, and a written round trip through disk.
        TestSupport::LogCapture logs;
        assert(!CombatDataLoader::loadFromFile("/nonexistent/combat.json").has_value());
        assert(logs.contains("cannot open"));

        const std::string path = "bulwark_loader_test.json";
        {
            std::ofstream out(path);
            out << R"({ "enemies": [ { "id": "grunt", "maxHealth": 60 } ] })";
        }
        const auto data = CombatDataLoader::loadFromFile(path);
        std::remove(path.c_str());
        assert(data.has_value());
        assert(data->findEnemy("grunt")->maxHealth == 60.0f);
    }
    {
        // The shipped data set loads and validates cleanly.
        const auto data = CombatDataLoader::loadFromFile(std::string(BULWARK_DATA_DIR) + "/combat.json");
        assert(data.has_value());
        assert(CombatDataLoader::validate(*data) == 0);
        assert(data->towers.size() == 5);
        assert(data->findTower("cannon")->aoeRadius > 0.0f);
        assert(data->findProjectile("shell")->poolSize == 10);
    }
    return 0;
}

// Projectile pools keyed by archetype id, plus the per-tick flight update.
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../engine/pool/Pool.h"
#include "CombatConfig.h"
#include "CombatContext.h"
#include "Projectile.h"

namespace Defense {

struct ProjectilePoolStats {
    std::size_t active{0};
    std::size_t inactive{0};
    std::size_t created{0};
};

class ProjectilePool {
public:
    static constexpr std::size_t kDefaultPoolSize = 20;

    explicit ProjectilePool(std::size_t defaultPoolSize = kDefaultPoolSize) : defaultPoolSize_(defaultPoolSize) {}

    ProjectilePool(const ProjectilePool&) = delete;
    ProjectilePool& operator=(const ProjectilePool&) = delete;

    // Creates the pool and prewarms it. Re-registering an id keeps the existing pool.
    bool registerArchetype(const ProjectileArchetype& archetype);

    // Reset projectile bound to this pool, or nullptr for unknown ids / exhausted pools.
    Projectile* get(const std::string& id);
    Projectile* get(const std::string& id, const Bulwark::Vec3& position, const Bulwark::Vec3& forward);

    void returnProjectile(Projectile& projectile);
    void returnAll();
    void prewarm(const std::string& id, std::size_t count);

    // Advances every in-flight projectile; projectiles may return themselves during this call.
    void update(float dt, CombatContext& context);

    template <typename Func>
    void forEachActive(Func&& func) const {
        for (const auto& [_, entry] : pools_) {
            entry->pool.forEachActive(func);
        }
    }

    bool hasPool(const std::string& id) const { return pools_.count(id) > 0; }
    const ProjectileArchetype* archetype(const std::string& id) const;
    std::optional<ProjectilePoolStats> stats(const std::string& id) const;
    std::size_t totalActive() const;
    std::size_t totalInactive() const;
    std::size_t poolCount() const { return pools_.size(); }

    // Destroys every projectile.
    void clear();

private:
    struct Entry {
        ProjectileArchetype archetype;
        Bulwark::Pool<Projectile> pool;

        explicit Entry(const ProjectileArchetype& a);
    };

    Entry* find(const std::string& id);

    std::size_t defaultPoolSize_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> pools_;
    std::vector<Projectile*> scratch_;
};

}  // namespace Defense

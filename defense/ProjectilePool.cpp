#include "ProjectilePool.h"

#include "../engine/core/Logger.h"

namespace Defense {

ProjectilePool::Entry::Entry(const ProjectileArchetype& a)
    : archetype(a),
      pool([this]() { return std::make_unique<Projectile>(archetype); }, "Projectile:" + a.id, true) {}

bool ProjectilePool::registerArchetype(const ProjectileArchetype& archetype) {
    if (archetype.id.empty()) {
        Bulwark::logError("[ProjectilePool] cannot register an archetype without an id");
        return false;
    }
    if (hasPool(archetype.id)) {
        return false;
    }

    auto entry = std::make_unique<Entry>(archetype);
    entry->pool.setHooks(
        [this](Projectile& p) {
            p.reset();
            p.bindOwner(this);
        },
        [](Projectile& p) { p.reset(); });

    const std::size_t size = archetype.poolSize > 0 ? archetype.poolSize : defaultPoolSize_;
    entry->pool.prewarm(size);
    pools_.emplace(archetype.id, std::move(entry));
    Bulwark::logInfo("[ProjectilePool] '" + archetype.id + "' prewarmed with " + std::to_string(size));
    return true;
}

ProjectilePool::Entry* ProjectilePool::find(const std::string& id) {
    auto it = pools_.find(id);
    return it != pools_.end() ? it->second.get() : nullptr;
}

Projectile* ProjectilePool::get(const std::string& id) {
    Entry* entry = find(id);
    if (!entry) {
        Bulwark::logWarn("[ProjectilePool] no pool for archetype '" + id + "'");
        return nullptr;
    }
    return entry->pool.get();
}

Projectile* ProjectilePool::get(const std::string& id, const Bulwark::Vec3& position, const Bulwark::Vec3& forward) {
    Entry* entry = find(id);
    if (!entry) {
        Bulwark::logWarn("[ProjectilePool] no pool for archetype '" + id + "'");
        return nullptr;
    }
    return entry->pool.get(position, forward);
}

void ProjectilePool::returnProjectile(Projectile& projectile) {
    Entry* entry = find(projectile.archetypeId());
    if (!entry || projectile.owner() != this) {
        Bulwark::logWarn("[ProjectilePool] no pool for returned projectile '" + projectile.archetypeId() +
                         "'; deactivating it");
        projectile.reset();
        projectile.setActive(false);
        return;
    }
    entry->pool.release(projectile);
}

void ProjectilePool::returnAll() {
    for (auto& [_, entry] : pools_) {
        entry->pool.releaseAll();
    }
}

void ProjectilePool::prewarm(const std::string& id, std::size_t count) {
    if (Entry* entry = find(id)) {
        entry->pool.prewarm(count);
    } else {
        Bulwark::logWarn("[ProjectilePool] cannot prewarm unknown archetype '" + id + "'");
    }
}

void ProjectilePool::update(float dt, CombatContext& context) {
    scratch_.clear();
    for (auto& [_, entry] : pools_) {
        entry->pool.forEachActive([this](Projectile& p) { scratch_.push_back(&p); });
    }
    for (Projectile* p : scratch_) {
        // A projectile returned earlier in this pass is no longer active.
        if (p->isActive()) {
            p->update(dt, context);
        }
    }
}

const ProjectileArchetype* ProjectilePool::archetype(const std::string& id) const {
    auto it = pools_.find(id);
    return it != pools_.end() ? &it->second->archetype : nullptr;
}

std::optional<ProjectilePoolStats> ProjectilePool::stats(const std::string& id) const {
    auto it = pools_.find(id);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    const auto& pool = it->second->pool;
    return ProjectilePoolStats{pool.activeCount(), pool.inactiveCount(), pool.createdCount()};
}

std::size_t ProjectilePool::totalActive() const {
    std::size_t total = 0;
    for (const auto& [_, entry] : pools_) total += entry->pool.activeCount();
    return total;
}

std::size_t ProjectilePool::totalInactive() const {
    std::size_t total = 0;
    for (const auto& [_, entry] : pools_) total += entry->pool.inactiveCount();
    return total;
}

void ProjectilePool::clear() {
    scratch_.clear();
    pools_.clear();
}

}  // namespace Defense

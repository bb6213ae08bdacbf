// Registry-backed lookup of targetable entities and the proximity query over them.
#pragma once

#include <cstddef>
#include <vector>

#include "../engine/ecs/Registry.h"
#include "../engine/ecs/components/Collider.h"
#include "../engine/spatial/SpatialQuery.h"
#include "Targetable.h"

namespace Defense {

// Capabilities resolved once when the entity is registered.
struct TargetRecord {
    ITargetable* targetable{nullptr};
    IDamageable* damageable{nullptr};
    Bulwark::ECS::Collider collider{};
};

class TargetDirectory : public Bulwark::ISpatialQuery {
public:
    explicit TargetDirectory(Bulwark::ECS::Registry& registry) : registry_(registry) {}

    TargetDirectory(const TargetDirectory&) = delete;
    TargetDirectory& operator=(const TargetDirectory&) = delete;

    Bulwark::ECS::Entity add(ITargetable& targetable, IDamageable* damageable, const Bulwark::ECS::Collider& collider);
    // Invalidates every handle to the entity.
    void remove(Bulwark::ECS::Entity e);
    void clear();

    bool contains(Bulwark::ECS::Entity e) const;
    // Registered and reporting itself as a valid target.
    bool isValid(Bulwark::ECS::Entity e) const;

    ITargetable* targetable(Bulwark::ECS::Entity e) const;
    IDamageable* damageable(Bulwark::ECS::Entity e) const;
    const Bulwark::ECS::Collider* collider(Bulwark::ECS::Entity e) const;

    // Registration order; stops writing at capacity.
    std::size_t overlapSphere(const Bulwark::Vec3& center, float radius, Bulwark::ECS::CategoryMask mask,
                              Bulwark::ECS::Entity* out, std::size_t capacity) const override;

    // func must not add or remove entries.
    template <typename Func>
    void forEachDamageable(Func&& func) const {
        for (Bulwark::ECS::Entity e : order_) {
            const auto* record = registry_.get<TargetRecord>(e);
            if (record && record->damageable) {
                func(e, *record->damageable);
            }
        }
    }

    const std::vector<Bulwark::ECS::Entity>& entities() const { return order_; }
    std::size_t size() const { return order_.size(); }

private:
    const TargetRecord* record(Bulwark::ECS::Entity e) const { return registry_.get<TargetRecord>(e); }

    Bulwark::ECS::Registry& registry_;
    std::vector<Bulwark::ECS::Entity> order_;
};

}  // namespace Defense

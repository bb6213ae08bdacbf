#include "TargetDirectory.h"

#include <algorithm>

namespace Defense {

using Bulwark::ECS::Entity;

Entity TargetDirectory::add(ITargetable& targetable, IDamageable* damageable, const Bulwark::ECS::Collider& collider) {
    const Entity e = registry_.create();
    registry_.emplace<TargetRecord>(e, TargetRecord{&targetable, damageable, collider});
    order_.push_back(e);
    return e;
}

void TargetDirectory::remove(Entity e) {
    auto it = std::find(order_.begin(), order_.end(), e);
    if (it == order_.end()) {
        return;
    }
    order_.erase(it);
    registry_.destroy(e);
}

void TargetDirectory::clear() {
    for (Entity e : order_) {
        registry_.destroy(e);
    }
    order_.clear();
}

bool TargetDirectory::contains(Entity e) const { return record(e) != nullptr; }

bool TargetDirectory::isValid(Entity e) const {
    const auto* r = record(e);
    return r && r->targetable && r->targetable->isValidTarget();
}

ITargetable* TargetDirectory::targetable(Entity e) const {
    const auto* r = record(e);
    return r ? r->targetable : nullptr;
}

IDamageable* TargetDirectory::damageable(Entity e) const {
    const auto* r = record(e);
    return r ? r->damageable : nullptr;
}

const Bulwark::ECS::Collider* TargetDirectory::collider(Entity e) const {
    const auto* r = record(e);
    return r ? &r->collider : nullptr;
}

std::size_t TargetDirectory::overlapSphere(const Bulwark::Vec3& center, float radius, Bulwark::ECS::CategoryMask mask,
                                           Entity* out, std::size_t capacity) const {
    std::size_t count = 0;
    for (Entity e : order_) {
        if (count >= capacity) break;
        const auto* r = record(e);
        if (!r || !r->targetable || (r->collider.category & mask) == 0) continue;
        const float reach = radius + r->collider.radius;
        if (Bulwark::distanceSquared(r->targetable->aimPoint(), center) <= reach * reach) {
            out[count++] = e;
        }
    }
    return count;
}

}  // namespace Defense

#include "Targeting.h"

#include <limits>
#include <string>

#include "../engine/core/Logger.h"

namespace Defense {

using Bulwark::ECS::Entity;

namespace {
float priorityScore(ETargetPriority priority, const ITargetable& t, const Bulwark::Vec3& origin) {
    // Higher wins.
    switch (priority) {
        case ETargetPriority::First:
            return t.distanceTraveled();
        case ETargetPriority::Nearest:
            return -Bulwark::distanceSquared(origin, t.aimPoint());
        case ETargetPriority::Strongest:
            return t.currentHealth();
        case ETargetPriority::Weakest:
            return -t.currentHealth();
        case ETargetPriority::Fastest:
        default:
            return t.currentSpeed();
    }
}
}  // namespace

Entity selectBestTarget(const Entity* candidates, std::size_t count, ETargetPriority priority,
                        const Bulwark::Vec3& origin, const TargetDirectory& directory) {
    Entity best{};
    float bestScore = -std::numeric_limits<float>::infinity();
    for (std::size_t i = 0; i < count; ++i) {
        const ITargetable* t = directory.targetable(candidates[i]);
        if (!t) continue;
        const float score = priorityScore(priority, *t, origin);
        if (!best.valid() || score > bestScore) {
            best = candidates[i];
            bestScore = score;
        }
    }
    return best;
}

Targeting::Targeting(float range, ETargetPriority priority, Bulwark::ECS::CategoryMask mask, float updateInterval)
    : range_(range), priority_(priority), mask_(mask), updateInterval_(updateInterval), sinceRescan_(updateInterval) {}

void Targeting::update(const Bulwark::Vec3& origin, const TargetDirectory& directory, float dt) {
    sinceRescan_ += dt;
    if (sinceRescan_ >= updateInterval_) {
        sinceRescan_ = 0.0f;
        rescan(origin, directory);
    } else {
        validate(origin, directory);
    }
}

void Targeting::forceUpdate(const Bulwark::Vec3& origin, const TargetDirectory& directory) {
    sinceRescan_ = 0.0f;
    rescan(origin, directory);
}

void Targeting::clearTarget() {
    candidateCount_ = 0;
    setTarget(Entity{});
}

std::vector<Entity> Targeting::targetsInRange() const {
    return std::vector<Entity>(candidates_.begin(), candidates_.begin() + static_cast<std::ptrdiff_t>(candidateCount_));
}

void Targeting::rescan(const Bulwark::Vec3& origin, const TargetDirectory& directory) {
    hits_.query(directory, origin, range_, mask_);
    if (hits_.saturated()) {
        Bulwark::logWarn("[Targeting] query buffer saturated at " + std::to_string(hits_.capacity()) +
                " hits; some targets in range may be ignored");
    }

    candidateCount_ = 0;
    for (Entity e : hits_) {
        if (directory.isValid(e)) {
            candidates_[candidateCount_++] = e;
        }
    }

    setTarget(selectBestTarget(candidates_.data(), candidateCount_, priority_, origin, directory));
}

void Targeting::validate(const Bulwark::Vec3& origin, const TargetDirectory& directory) {
    if (!current_.valid()) {
        return;
    }
    if (!directory.isValid(current_)) {
        setTarget(Entity{});
        return;
    }
    // Same reach as the rescan query: range plus the target's hit radius.
    const auto* col = directory.collider(current_);
    const float reach = range_ + (col ? col->radius : 0.0f);
    const ITargetable* t = directory.targetable(current_);
    if (Bulwark::distanceSquared(origin, t->aimPoint()) > reach * reach) {
        setTarget(Entity{});
    }
}

void Targeting::setTarget(Entity target) {
    if (target == current_) {
        return;
    }
    current_ = target;
    onTargetChanged.emit(current_);
}

}  // namespace Defense

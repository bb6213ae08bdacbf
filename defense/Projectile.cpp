#include "Projectile.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "ProjectilePool.h"
#include "TargetDirectory.h"

namespace Defense {

using Bulwark::Vec3;
using Bulwark::ECS::Entity;

namespace {
constexpr float kUntargetedTravel = 100.0f;

// Where along segment ab, in [0,1], a sphere of radius `reach` around `point` is first touched.
// Returns a negative value when the segment misses the sphere.
float segmentEntry(const Vec3& point, float reach, const Vec3& a, const Vec3& b) {
    const Vec3 ab = b - a;
    const float lenSq = ab.lengthSquared();
    if (lenSq <= 1e-12f) {
        return Bulwark::distanceSquared(point, a) <= reach * reach ? 0.0f : -1.0f;
    }
    const float t = std::clamp(Bulwark::dot(point - a, ab) / lenSq, 0.0f, 1.0f);
    const float missSq = Bulwark::distanceSquared(point, a + ab * t);
    if (missSq > reach * reach) return -1.0f;
    const float back = std::sqrt((reach * reach - missSq) / lenSq);
    return std::max(0.0f, t - back);
}
}  // namespace

Projectile::Projectile(ProjectileArchetype archetype) : archetype_(std::move(archetype)) {}

void Projectile::setPose(const Vec3& position, const Vec3& forward) {
    position_ = position;
    const Vec3 dir = forward.normalized();
    forward_ = dir.nearlyZero() ? Vec3::forward() : dir;
}

void Projectile::initialize(const ProjectileLaunch& launch, const TargetDirectory& directory) {
    target_ = launch.target;
    speed_ = launch.speed > 0.0f ? launch.speed : archetype_.speed;
    aoeRadius_ = std::max(0.0f, launch.aoeRadius);
    mask_ = launch.mask;
    payload_ = launch.payload;
    elapsed_ = 0.0f;

    if (const ITargetable* t = directory.isValid(target_) ? directory.targetable(target_) : nullptr) {
        lastTargetPosition_ = t->aimPoint();
        const Vec3 dir = (lastTargetPosition_ - position_).normalized();
        if (!dir.nearlyZero()) {
            forward_ = dir;
        }
    } else {
        target_ = Entity{};
        lastTargetPosition_ = position_ + forward_ * kUntargetedTravel;
    }
    state_ = EProjectileState::InFlight;
}

void Projectile::update(float dt, CombatContext& context) {
    if (!active_ || state_ != EProjectileState::InFlight) {
        return;
    }

    elapsed_ += dt;
    if (elapsed_ >= archetype_.lifetime) {
        expire();
        return;
    }

    if (target_.valid()) {
        if (context.directory.isValid(target_)) {
            lastTargetPosition_ = context.directory.targetable(target_)->aimPoint();
        } else {
            // Keep flying toward the last known position.
            target_ = Entity{};
        }
    }

    const Vec3 from = position_;
    move(dt);

    const Entity hit = findCollision(from, context.directory);
    if (hit.valid()) {
        resolveHit(hit, context);
    }
}

void Projectile::move(float dt) {
    Vec3 direction = (lastTargetPosition_ - position_).normalized();
    if (direction.nearlyZero()) {
        direction = forward_;
    }
    if (archetype_.trackTarget) {
        forward_ = Bulwark::rotateTowards(forward_, direction, archetype_.rotationSpeed * Bulwark::kDegToRad * dt);
    }
    position_ += forward_ * (speed_ * dt);
}

Entity Projectile::findCollision(const Vec3& from, const TargetDirectory& directory) {
    const Vec3 mid = (from + position_) * 0.5f;
    const float sweep = archetype_.hitRadius + Bulwark::distance(from, position_) * 0.5f;
    hits_.query(directory, mid, sweep, mask_);
    Entity first{};
    float firstEntry = 2.0f;
    for (Entity e : hits_) {
        if (!directory.isValid(e)) continue;
        const auto* col = directory.collider(e);
        const float reach = archetype_.hitRadius + (col ? col->radius : 0.0f);
        const float entry = segmentEntry(directory.targetable(e)->aimPoint(), reach, from, position_);
        if (entry >= 0.0f && entry < firstEntry) {
            first = e;
            firstEntry = entry;
        }
    }
    return first;
}

void Projectile::resolveHit(Entity trigger, CombatContext& context) {
    state_ = EProjectileState::Resolved;
    auto& directory = context.directory;
    const Vec3 impact = position_;

    if (aoeRadius_ > 0.0f) {
        hits_.query(directory, impact, aoeRadius_, mask_);
        bool triggerHit = false;
        for (Entity e : hits_) {
            if (e == trigger) triggerHit = true;
            if (!directory.isValid(e)) continue;
            if (IDamageable* d = directory.damageable(e)) {
                deliverHit(*d, payload_, impact);
            }
        }
        // The entity that set off the impact always takes the hit.
        if (!triggerHit && directory.isValid(trigger)) {
            if (IDamageable* d = directory.damageable(trigger)) {
                deliverHit(*d, payload_, impact);
            }
        }
    } else if (IDamageable* d = directory.damageable(trigger)) {
        deliverHit(*d, payload_, impact);
    }

    onHit.emit(*this, payload_.damage.amount);
    deactivate();
}

void Projectile::expire() {
    state_ = EProjectileState::Resolved;
    onExpired.emit(*this);
    deactivate();
}

void Projectile::deactivate() {
    if (!active_) {
        return;
    }
    if (owner_) {
        owner_->returnProjectile(*this);
    } else {
        reset();
        active_ = false;
    }
}

void Projectile::reset() {
    state_ = EProjectileState::Idle;
    target_ = Entity{};
    lastTargetPosition_ = Vec3{};
    position_ = Vec3{};
    forward_ = Vec3::forward();
    speed_ = 0.0f;
    aoeRadius_ = 0.0f;
    elapsed_ = 0.0f;
    mask_ = Bulwark::ECS::Category::Enemy;
    payload_.clear();
    hits_.count = 0;
    onHit.disconnectAll();
    onExpired.disconnectAll();
}

}  // namespace Defense

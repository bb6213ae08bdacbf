#include "Aiming.h"

#include <algorithm>

namespace Defense {

using Bulwark::Vec3;

Vec3 predictInterceptPosition(const Vec3& firePoint, const Vec3& targetPosition, const Vec3& targetVelocity,
                              float projectileSpeed) {
    if (projectileSpeed <= 0.0f || targetVelocity.lengthSquared() < kNegligibleVelocitySq) {
        return targetPosition;
    }

    Vec3 predicted = targetPosition;
    for (int i = 0; i < kLeadIterations; ++i) {
        const float dist = Bulwark::distance(firePoint, predicted);
        if (dist < 0.001f) {
            return targetPosition;
        }
        const float timeToHit = std::clamp(dist / projectileSpeed, 0.0f, kMaxLeadTime);
        predicted = targetPosition + targetVelocity * timeToHit;
    }
    return predicted;
}

Aiming::Aiming(float rotationSpeedDegrees, float toleranceDegrees, bool useLeadPrediction, bool lockVerticalAxis)
    : rotationSpeedDegrees_(rotationSpeedDegrees),
      toleranceDegrees_(toleranceDegrees),
      useLeadPrediction_(useLeadPrediction),
      lockVerticalAxis_(lockVerticalAxis) {}

Vec3 Aiming::facing(const Bulwark::ECS::Transform& transform) const {
    return lockVerticalAxis_ ? transform.forward.flattened() : transform.forward;
}

bool Aiming::computeAim(const Vec3& firePoint, Bulwark::ECS::Entity target, const TargetDirectory& directory,
                        float projectileSpeed) {
    if (!directory.isValid(target)) {
        aimed_ = false;
        return false;
    }
    const ITargetable* t = directory.targetable(target);
    const Vec3 position = t->aimPoint();
    predicted_ = useLeadPrediction_ ? predictInterceptPosition(firePoint, position, t->velocity(), projectileSpeed)
                                    : position;

    direction_ = predicted_ - firePoint;
    if (lockVerticalAxis_) {
        direction_ = direction_.flattened();
    }
    return true;
}

void Aiming::update(Bulwark::ECS::Transform& transform, const Vec3& firePoint, Bulwark::ECS::Entity target,
                    const TargetDirectory& directory, float projectileSpeed, float dt) {
    if (!computeAim(firePoint, target, directory, projectileSpeed)) {
        return;
    }
    // Target on top of the turret: any facing works.
    if (direction_.nearlyZero()) {
        aimed_ = true;
        return;
    }

    Vec3 current = facing(transform);
    if (current.nearlyZero()) {
        current = direction_;
    }
    const float maxStep = rotationSpeedDegrees_ * Bulwark::kDegToRad * dt;
    transform.forward = Bulwark::rotateTowards(current, direction_, maxStep);
    aimed_ = Bulwark::angleDegrees(transform.forward, direction_) < toleranceDegrees_;
}

void Aiming::snapToTarget(Bulwark::ECS::Transform& transform, const Vec3& firePoint, Bulwark::ECS::Entity target,
                          const TargetDirectory& directory, float projectileSpeed) {
    if (!computeAim(firePoint, target, directory, projectileSpeed)) {
        return;
    }
    if (!direction_.nearlyZero()) {
        transform.forward = direction_.normalized();
    }
    aimed_ = true;
}

}  // namespace Defense

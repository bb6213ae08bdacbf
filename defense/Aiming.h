// Turret rotation toward the current target with iterative lead prediction.
#pragma once

#include "../engine/ecs/Entity.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/math/Vec3.h"
#include "TargetDirectory.h"

namespace Defense {

constexpr int kLeadIterations = 3;
constexpr float kMaxLeadTime = 3.0f;
// Squared speed below which a target is treated as stationary (0.1 units/s).
constexpr float kNegligibleVelocitySq = 0.01f;

// Fixed-iteration intercept estimate; returns targetPosition for stationary targets or
// non-positive projectile speeds. Not exact for accelerating or turning targets.
Bulwark::Vec3 predictInterceptPosition(const Bulwark::Vec3& firePoint, const Bulwark::Vec3& targetPosition,
                                       const Bulwark::Vec3& targetVelocity, float projectileSpeed);

class Aiming {
public:
    Aiming() = default;
    Aiming(float rotationSpeedDegrees, float toleranceDegrees, bool useLeadPrediction, bool lockVerticalAxis);

    // Rotates `transform.forward` toward the (predicted) aim point.
    void update(Bulwark::ECS::Transform& transform, const Bulwark::Vec3& firePoint, Bulwark::ECS::Entity target,
                const TargetDirectory& directory, float projectileSpeed, float dt);

    // Faces the aim point immediately.
    void snapToTarget(Bulwark::ECS::Transform& transform, const Bulwark::Vec3& firePoint, Bulwark::ECS::Entity target,
                      const TargetDirectory& directory, float projectileSpeed);

    bool isAimed() const { return aimed_; }
    const Bulwark::Vec3& predictedPosition() const { return predicted_; }
    const Bulwark::Vec3& aimDirection() const { return direction_; }

    float rotationSpeed() const { return rotationSpeedDegrees_; }
    void setRotationSpeed(float degreesPerSecond) { rotationSpeedDegrees_ = degreesPerSecond; }
    float tolerance() const { return toleranceDegrees_; }
    void setLeadPrediction(bool enabled) { useLeadPrediction_ = enabled; }
    bool leadPrediction() const { return useLeadPrediction_; }

private:
    // False when there is nothing to aim at.
    bool computeAim(const Bulwark::Vec3& firePoint, Bulwark::ECS::Entity target, const TargetDirectory& directory,
                    float projectileSpeed);
    Bulwark::Vec3 facing(const Bulwark::ECS::Transform& transform) const;

    float rotationSpeedDegrees_{180.0f};
    float toleranceDegrees_{5.0f};
    bool useLeadPrediction_{true};
    bool lockVerticalAxis_{true};

    bool aimed_{false};
    Bulwark::Vec3 predicted_{};
    Bulwark::Vec3 direction_{};
};

}  // namespace Defense

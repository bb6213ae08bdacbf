// Capability contracts the combat core consumes from enemy-side entities.
#pragma once

#include "../engine/math/Vec3.h"
#include "../engine/status/EffectTracker.h"
#include "../engine/status/IEffectTarget.h"

namespace Defense {

class ITargetable {
public:
    virtual ~ITargetable() = default;

    virtual Bulwark::Vec3 aimPoint() const = 0;
    // Alive and still in play.
    virtual bool isValidTarget() const = 0;
    virtual float currentHealth() const = 0;
    virtual float distanceTraveled() const = 0;
    virtual float currentSpeed() const = 0;
    virtual Bulwark::Vec3 velocity() const = 0;
};

class IDamageable : public Bulwark::Status::IEffectTarget {
public:
    // Tracker owned by the damageable; may be null for entities that take no effects.
    virtual Bulwark::Status::EffectTracker* effects() = 0;
};

}  // namespace Defense

// Contract an entity implements to receive damage and status effects.
#pragma once

#include "../gameplay/Damage.h"

namespace Bulwark::Status {

class IEffectTarget {
public:
    virtual ~IEffectTarget() = default;

    // Returns health remaining after the hit.
    virtual float applyDamage(const Gameplay::DamageInfo& info) = 0;
    virtual void applySlow(float amount, float duration) = 0;
    virtual void removeSlow() = 0;
    virtual bool isDead() const = 0;
};

}  // namespace Bulwark::Status

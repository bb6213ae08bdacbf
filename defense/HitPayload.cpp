#include "HitPayload.h"

#include "../engine/status/StatusTypes.h"

namespace Defense {

using Bulwark::Status::StatusEffect;

void copyEffectPayload(const TowerStats& stats, HitPayload& payload) {
    if (stats.hasSlow()) {
        payload.slowAmount = stats.slowAmount;
        payload.slowDuration = stats.slowDuration;
    }
    if (stats.hasDamageOverTime()) {
        payload.dotDamagePerTick = stats.dotDamagePerTick;
        payload.dotTickInterval = stats.dotTickInterval;
        payload.dotDuration = stats.dotDuration;
    }
}

void deliverHit(IDamageable& target, const HitPayload& payload, const Bulwark::Vec3& hitPoint) {
    Bulwark::Gameplay::DamageInfo info = payload.damage;
    info.hitPoint = hitPoint;
    target.applyDamage(info);
    if (target.isDead()) {
        return;
    }

    auto* tracker = target.effects();
    if (!tracker) {
        return;
    }
    if (payload.hasSlow()) {
        tracker->add(StatusEffect::slow(payload.slowAmount, payload.slowDuration, info.source));
    }
    if (payload.hasDamageOverTime()) {
        tracker->add(StatusEffect::damageOverTime(payload.dotDamagePerTick, payload.dotTickInterval,
                                                  payload.dotDuration, payload.dotDamageType, info.source));
    }
}

}  // namespace Defense

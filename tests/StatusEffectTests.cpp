// Slow and damage-over-time stacking, ticking, expiry and tracker lifecycle.
#include <cassert>

#include "../engine/status/EffectTracker.h"
#include "TestSupport.h"

using Bulwark::Status::EEffectKind;
using Bulwark::Status::StatusEffect;
using TestSupport::StubTarget;

namespace {
void advance(Bulwark::Status::EffectTracker& tracker, float seconds, float dt = 0.25f) {
    for (float t = 0.0f; t < seconds; t += dt) {
        tracker.update(dt);
    }
}
}  // namespace

int main() {
    {
        // Slow amount is clamped into [0,1].
        assert(StatusEffect::slow(1.7f, 1.0f).slowPayload.amount == 1.0f);
        assert(StatusEffect::slow(-0.2f, 1.0f).slowPayload.amount == 0.0f);
        assert(StatusEffect::slow(0.35f, 1.0f).slowPayload.amount == 0.35f);
    }
    {
        // Damage-over-time inputs are sanitized.
        const auto dot = StatusEffect::damageOverTime(-3.0f, 0.01f, 2.0f);
        assert(dot.dotPayload.damagePerTick == 0.0f);
        assert(dot.dotPayload.tickInterval == Bulwark::Status::kMinimumTickInterval);
        assert(dot.dotPayload.damageType == Bulwark::Gameplay::DamageType::Magic);
        assert(dot.canStack());
        assert(!StatusEffect::slow(0.5f, 1.0f).canStack());
    }
    {
        // Weaker then stronger slow: stronger wins with the new duration.
        StubTarget target;
        target.tracker.add(StatusEffect::slow(0.3f, 2.0f));
        assert(target.slow == 0.3f);
        assert(target.tracker.add(StatusEffect::slow(0.5f, 3.0f)));
        assert(target.tracker.count() == 1);
        const auto* slow = target.tracker.find(EEffectKind::Slow);
        assert(slow->slowPayload.amount == 0.5f);
        assert(slow->remaining == 3.0f);
        assert(target.slow == 0.5f);
    }
    {
        // Stronger then weaker slow: the weaker one changes nothing.
        StubTarget target;
        target.tracker.add(StatusEffect::slow(0.5f, 2.0f));
        target.tracker.update(0.5f);
        assert(!target.tracker.add(StatusEffect::slow(0.3f, 5.0f)));
        const auto* slow = target.tracker.find(EEffectKind::Slow);
        assert(target.tracker.count() == 1);
        assert(slow->slowPayload.amount == 0.5f);
        assert(slow->remaining == 1.5f);
        assert(target.slow == 0.5f);
        assert(target.slowApplied == 1);
    }
    {
        // Equal slow refreshes the duration.
        StubTarget target;
        target.tracker.add(StatusEffect::slow(0.4f, 2.0f));
        target.tracker.update(1.5f);
        assert(target.tracker.add(StatusEffect::slow(0.4f, 2.0f)));
        assert(target.tracker.find(EEffectKind::Slow)->remaining == 2.0f);
    }
    {
        // Expiry removes the slow and restores speed through the remove hook.
        StubTarget target;
        int removedEvents = 0;
        target.tracker.onEffectRemoved.connect([&removedEvents](const StatusEffect&) { ++removedEvents; });
        target.tracker.add(StatusEffect::slow(0.5f, 1.0f));
        target.tracker.update(0.75f);
        assert(target.tracker.has(EEffectKind::Slow));
        target.tracker.update(0.25f);
        assert(!target.tracker.has(EEffectKind::Slow));
        assert(target.slowRemoved == 1);
        assert(target.slow == 0.0f);
        assert(removedEvents == 1);
    }
    {
        // Two independent 5/s damage-over-time effects add up to 10/s, each on its own schedule.
        StubTarget target;
        target.health = 1000.0f;
        target.tracker.add(StatusEffect::damageOverTime(5.0f, 1.0f, 4.0f));
        advance(target.tracker, 0.5f);
        target.tracker.add(StatusEffect::damageOverTime(5.0f, 1.0f, 4.0f));
        assert(target.tracker.count(EEffectKind::DamageOverTime) == 2);

        float dps = 0.0f;
        for (const auto* e : target.tracker.findAll(EEffectKind::DamageOverTime)) dps += e->damagePerSecond();
        assert(dps == 10.0f);

        // t = 2.0: first effect ticked at 1.0 and 2.0, second at 1.5.
        advance(target.tracker, 1.5f);
        assert(target.damageTaken == 15.0f);
        assert(target.hits == 3);

        // The tick that would land on expiry is dropped, so each effect deals three.
        advance(target.tracker, 3.0f);
        assert(target.damageTaken == 30.0f);
        assert(target.hits == 6);
        assert(target.tracker.count() == 0);
    }
    {
        // Tick time carries over across uneven frames.
        StubTarget target;
        target.health = 1000.0f;
        target.tracker.add(StatusEffect::damageOverTime(1.0f, 0.5f, 3.0f));
        target.tracker.update(0.75f);
        assert(target.hits == 1);
        target.tracker.update(0.75f);
        assert(target.hits == 3);
        target.tracker.update(0.75f);
        assert(target.hits == 4);
        // The frame that ends the effect pays out nothing, even with a tick owed.
        target.tracker.update(0.75f);
        assert(target.hits == 4);
        assert(target.tracker.count() == 0);
    }
    {
        // A 4 s effect ticking every second in whole-second frames deals three ticks.
        StubTarget target;
        target.health = 1000.0f;
        target.tracker.add(StatusEffect::damageOverTime(5.0f, 1.0f, 4.0f));
        for (int i = 0; i < 4; ++i) target.tracker.update(1.0f);
        assert(target.hits == 3);
        assert(target.damageTaken == 15.0f);
        assert(target.tracker.count() == 0);
    }
    {
        // Remaining damage and per-second figures.
        const auto dot = StatusEffect::damageOverTime(5.0f, 1.0f, 4.0f);
        assert(dot.totalRemainingDamage() == 20.0f);
        StubTarget target;
        target.health = 1000.0f;
        target.tracker.add(StatusEffect::damageOverTime(5.0f, 1.0f, 4.0f));
        target.tracker.update(1.5f);
        assert(target.tracker.find(EEffectKind::DamageOverTime)->totalRemainingDamage() == 10.0f);
        assert(dot.damagePerSecond() == 5.0f);
        assert(StatusEffect::slow(0.5f, 1.0f).totalRemainingDamage() == 0.0f);
    }
    {
        // Death during a tick clears everything and stops the pass.
        StubTarget target;
        target.health = 8.0f;
        int removedEvents = 0;
        target.tracker.onEffectRemoved.connect([&removedEvents](const StatusEffect&) { ++removedEvents; });
        target.tracker.add(StatusEffect::damageOverTime(5.0f, 1.0f, 4.0f));
        target.tracker.add(StatusEffect::damageOverTime(5.0f, 1.0f, 4.0f));
        target.tracker.add(StatusEffect::slow(0.2f, 4.0f));
        target.tracker.update(1.0f);
        assert(target.isDead());
        assert(target.tracker.count() == 0);
        assert(removedEvents == 3);
        assert(target.slowRemoved == 1);
    }
    {
        // Dead targets take no new effects.
        StubTarget target;
        target.health = 0.0f;
        assert(!target.tracker.add(StatusEffect::slow(0.5f, 1.0f)));
        assert(target.tracker.count() == 0);
    }
    {
        // Removal by kind and by id runs the remove hook.
        StubTarget target;
        target.tracker.add(StatusEffect::slow(0.5f, 5.0f));
        target.tracker.add(StatusEffect::damageOverTime(1.0f, 1.0f, 5.0f));
        target.tracker.add(StatusEffect::damageOverTime(1.0f, 1.0f, 5.0f));
        const auto dots = target.tracker.findAll(EEffectKind::DamageOverTime);
        assert(dots.size() == 2);
        assert(dots[0]->id != dots[1]->id);
        assert(target.tracker.remove(dots[0]->id));
        assert(target.tracker.count(EEffectKind::DamageOverTime) == 1);
        target.tracker.remove(EEffectKind::Slow);
        assert(target.slowRemoved == 1);
        assert(!target.tracker.remove(std::uint64_t{9999}));
    }
    {
        // clearAll runs every remove hook; reset also drops subscribers.
        StubTarget target;
        int added = 0;
        target.tracker.onEffectAdded.connect([&added](const StatusEffect&) { ++added; });
        target.tracker.add(StatusEffect::slow(0.5f, 5.0f));
        target.tracker.clearAll();
        assert(target.slowRemoved == 1);
        assert(target.tracker.count() == 0);
        target.tracker.add(StatusEffect::slow(0.5f, 5.0f));
        assert(added == 2);
        target.tracker.reset();
        assert(target.slowRemoved == 2);
        target.tracker.add(StatusEffect::slow(0.5f, 5.0f));
        assert(added == 2);
        assert(target.tracker.onEffectAdded.empty());
    }
    return 0;
}

#include "EffectTracker.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace Bulwark::Status {

namespace {

// Returns false when the target died during the tick; the effect must not be touched afterwards.
using UpdateFn = bool (*)(StatusEffect&, IEffectTarget&, float);
using HookFn = void (*)(StatusEffect&, IEffectTarget&);

struct EffectHandlers {
    HookFn onApply;
    UpdateFn onUpdate;
    HookFn onRemove;
};

void applySlow(StatusEffect& effect, IEffectTarget& target) {
    target.applySlow(effect.slowPayload.amount, effect.remaining);
}

bool updateTimerOnly(StatusEffect& effect, IEffectTarget&, float dt) {
    effect.remaining -= dt;
    return true;
}

void removeSlow(StatusEffect&, IEffectTarget& target) { target.removeSlow(); }

void noHook(StatusEffect&, IEffectTarget&) {}

bool updateDamageOverTime(StatusEffect& effect, IEffectTarget& target, float dt) {
    auto& dot = effect.dotPayload;
    effect.remaining -= dt;
    dot.sinceLastTick += dt;
    // Ticks still owed once the effect has run out are dropped.
    while (dot.sinceLastTick >= dot.tickInterval && !effect.expired()) {
        dot.sinceLastTick -= dot.tickInterval;
        Gameplay::DamageInfo info;
        info.amount = dot.damagePerTick;
        info.source = effect.source;
        info.type = dot.damageType;
        target.applyDamage(info);
        if (target.isDead()) {
            return false;
        }
    }
    return true;
}

constexpr EffectHandlers kHandlers[kEffectKindCount] = {
    {applySlow, updateTimerOnly, removeSlow},
    {noHook, updateDamageOverTime, noHook},
};

const EffectHandlers& handlersFor(EEffectKind kind) { return kHandlers[static_cast<std::size_t>(kind)]; }

}  // namespace

StatusEffect StatusEffect::slow(float amount, float duration, ECS::Entity source) {
    StatusEffect effect;
    effect.kind = EEffectKind::Slow;
    effect.duration = duration;
    effect.remaining = duration;
    effect.source = source;
    effect.slowPayload.amount = std::clamp(amount, 0.0f, 1.0f);
    return effect;
}

StatusEffect StatusEffect::damageOverTime(float damagePerTick, float tickInterval, float duration,
                                          Gameplay::DamageType type, ECS::Entity source) {
    StatusEffect effect;
    effect.kind = EEffectKind::DamageOverTime;
    effect.duration = duration;
    effect.remaining = duration;
    effect.source = source;
    effect.dotPayload.damagePerTick = std::max(0.0f, damagePerTick);
    effect.dotPayload.tickInterval = std::max(kMinimumTickInterval, tickInterval);
    effect.dotPayload.damageType = type;
    return effect;
}

float StatusEffect::damagePerSecond() const {
    if (kind != EEffectKind::DamageOverTime) return 0.0f;
    return dotPayload.damagePerTick / dotPayload.tickInterval;
}

float StatusEffect::totalRemainingDamage() const {
    if (kind != EEffectKind::DamageOverTime || expired()) return 0.0f;
    return std::floor(remaining / dotPayload.tickInterval) * dotPayload.damagePerTick;
}

std::string_view toString(EEffectKind kind) {
    switch (kind) {
        case EEffectKind::Slow:
            return "Slow";
        case EEffectKind::DamageOverTime:
        default:
            return "DamageOverTime";
    }
}

bool EffectTracker::add(StatusEffect effect) {
    if (target_->isDead()) {
        return false;
    }

    if (!effect.canStack()) {
        auto it = std::find_if(effects_.begin(), effects_.end(),
                               [&](const StatusEffect& e) { return e.kind == effect.kind; });
        if (it != effects_.end()) {
            if (effect.kind == EEffectKind::Slow) {
                if (effect.slowPayload.amount < it->slowPayload.amount) {
                    return false;
                }
                it->slowPayload.amount = effect.slowPayload.amount;
            }
            it->source = effect.source;
            it->refresh(effect.duration);
            handlersFor(it->kind).onApply(*it, *target_);
            return true;
        }
    }

    effect.id = ++nextId_;
    effects_.push_back(effect);
    StatusEffect& stored = effects_.back();
    handlersFor(stored.kind).onApply(stored, *target_);
    onEffectAdded.emit(effects_.back());
    return true;
}

void EffectTracker::update(float dt) {
    const std::uint64_t generation = clearGeneration_;
    std::size_t i = 0;
    while (i < effects_.size()) {
        const bool targetAlive = handlersFor(effects_[i].kind).onUpdate(effects_[i], *target_, dt);
        if (!targetAlive || generation != clearGeneration_) {
            // Death handling cleared (or will clear) the list.
            return;
        }
        if (effects_[i].expired()) {
            removeAt(i);
            if (generation != clearGeneration_) return;
        } else {
            ++i;
        }
    }
}

void EffectTracker::removeAt(std::size_t index) {
    StatusEffect removed = effects_[index];
    effects_.erase(effects_.begin() + static_cast<std::ptrdiff_t>(index));
    handlersFor(removed.kind).onRemove(removed, *target_);
    onEffectRemoved.emit(removed);
}

void EffectTracker::remove(EEffectKind kind) {
    std::size_t i = 0;
    while (i < effects_.size()) {
        if (effects_[i].kind == kind) {
            removeAt(i);
        } else {
            ++i;
        }
    }
}

bool EffectTracker::remove(std::uint64_t id) {
    for (std::size_t i = 0; i < effects_.size(); ++i) {
        if (effects_[i].id == id) {
            removeAt(i);
            return true;
        }
    }
    return false;
}

bool EffectTracker::has(EEffectKind kind) const { return find(kind) != nullptr; }

const StatusEffect* EffectTracker::find(EEffectKind kind) const {
    for (const auto& effect : effects_) {
        if (effect.kind == kind) return &effect;
    }
    return nullptr;
}

std::vector<const StatusEffect*> EffectTracker::findAll(EEffectKind kind) const {
    std::vector<const StatusEffect*> out;
    for (const auto& effect : effects_) {
        if (effect.kind == kind) out.push_back(&effect);
    }
    return out;
}

std::size_t EffectTracker::count(EEffectKind kind) const {
    return static_cast<std::size_t>(
        std::count_if(effects_.begin(), effects_.end(), [kind](const StatusEffect& e) { return e.kind == kind; }));
}

void EffectTracker::clearAll() {
    ++clearGeneration_;
    std::vector<StatusEffect> removed;
    removed.swap(effects_);
    for (auto& effect : removed) {
        handlersFor(effect.kind).onRemove(effect, *target_);
        onEffectRemoved.emit(effect);
    }
}

void EffectTracker::reset() {
    clearAll();
    onEffectAdded.disconnectAll();
    onEffectRemoved.disconnectAll();
}

}  // namespace Bulwark::Status

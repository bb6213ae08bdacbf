// Per-target list of timed effects: stacking, refresh, ticking and expiry.
#pragma once

#include <cstdint>
#include <vector>

#include "../core/Signal.h"
#include "IEffectTarget.h"
#include "StatusTypes.h"

namespace Bulwark::Status {

class EffectTracker {
public:
    explicit EffectTracker(IEffectTarget& target) : target_(&target) {}

    EffectTracker(const EffectTracker&) = delete;
    EffectTracker& operator=(const EffectTracker&) = delete;

    // Stackable kinds append; others refresh the existing instance.
    // A weaker slow never replaces or extends a stronger one.
    // Returns false when the effect was ignored.
    bool add(StatusEffect effect);

    void update(float dt);

    void remove(EEffectKind kind);
    bool remove(std::uint64_t id);

    bool has(EEffectKind kind) const;
    const StatusEffect* find(EEffectKind kind) const;
    std::vector<const StatusEffect*> findAll(EEffectKind kind) const;
    std::size_t count() const { return effects_.size(); }
    std::size_t count(EEffectKind kind) const;
    const std::vector<StatusEffect>& all() const { return effects_; }

    // Runs every remove hook.
    void clearAll();
    // clearAll() plus detaching every subscriber; used on death or pool return.
    void reset();

    Signal<const StatusEffect&> onEffectAdded;
    Signal<const StatusEffect&> onEffectRemoved;

private:
    void removeAt(std::size_t index);

    IEffectTarget* target_;
    std::vector<StatusEffect> effects_;
    std::uint64_t nextId_{0};
    std::uint64_t clearGeneration_{0};
};

}  // namespace Bulwark::Status

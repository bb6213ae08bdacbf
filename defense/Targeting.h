// Per-unit target acquisition: throttled rescans, per-tick validation, priority selection.
#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "../engine/core/Signal.h"
#include "../engine/ecs/Entity.h"
#include "../engine/spatial/SpatialQuery.h"
#include "CombatConfig.h"
#include "TargetDirectory.h"

namespace Defense {

constexpr float kDefaultTargetUpdateInterval = 0.1f;

// Picks the best of `count` candidates; ties keep the earlier candidate.
Bulwark::ECS::Entity selectBestTarget(const Bulwark::ECS::Entity* candidates, std::size_t count,
                                      ETargetPriority priority, const Bulwark::Vec3& origin,
                                      const TargetDirectory& directory);

class Targeting {
public:
    Targeting() = default;
    Targeting(float range, ETargetPriority priority, Bulwark::ECS::CategoryMask mask,
              float updateInterval = kDefaultTargetUpdateInterval);

    // Rescans once the update interval has elapsed; otherwise only revalidates the current target.
    void update(const Bulwark::Vec3& origin, const TargetDirectory& directory, float dt);
    void forceUpdate(const Bulwark::Vec3& origin, const TargetDirectory& directory);
    void clearTarget();

    Bulwark::ECS::Entity currentTarget() const { return current_; }
    bool hasTarget() const { return current_.valid(); }

    // Valid candidates found by the last rescan.
    std::vector<Bulwark::ECS::Entity> targetsInRange() const;

    ETargetPriority priority() const { return priority_; }
    void setPriority(ETargetPriority priority) { priority_ = priority; }
    float range() const { return range_; }
    void setRange(float range) { range_ = range; }
    Bulwark::ECS::CategoryMask mask() const { return mask_; }
    float updateInterval() const { return updateInterval_; }

    // Fires with the new target, or an invalid handle when the target is lost.
    Bulwark::Signal<Bulwark::ECS::Entity> onTargetChanged;

private:
    void rescan(const Bulwark::Vec3& origin, const TargetDirectory& directory);
    void validate(const Bulwark::Vec3& origin, const TargetDirectory& directory);
    void setTarget(Bulwark::ECS::Entity target);

    float range_{5.0f};
    ETargetPriority priority_{ETargetPriority::First};
    Bulwark::ECS::CategoryMask mask_{Bulwark::ECS::Category::Enemy};
    float updateInterval_{kDefaultTargetUpdateInterval};
    float sinceRescan_{kDefaultTargetUpdateInterval};

    Bulwark::ECS::Entity current_{};
    Bulwark::QueryBuffer<> hits_{};
    std::array<Bulwark::ECS::Entity, Bulwark::kQueryBufferCapacity> candidates_{};
    std::size_t candidateCount_{0};
};

}  // namespace Defense

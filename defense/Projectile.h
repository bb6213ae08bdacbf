// Single pooled projectile: flight, collision, single/area hit resolution and reset.
#pragma once

#include <string>

#include "../engine/core/Signal.h"
#include "../engine/ecs/Entity.h"
#include "../engine/ecs/components/Collider.h"
#include "../engine/math/Vec3.h"
#include "../engine/spatial/SpatialQuery.h"
#include "CombatConfig.h"
#include "CombatContext.h"
#include "HitPayload.h"

namespace Defense {

class ProjectilePool;

enum class EProjectileState { Idle, InFlight, Resolved };

// Everything the firing unit hands over at launch.
struct ProjectileLaunch {
    Bulwark::ECS::Entity target{};
    float speed{0.0f};  // <= 0 uses the archetype speed
    float aoeRadius{0.0f};
    Bulwark::ECS::CategoryMask mask{Bulwark::ECS::Category::Enemy};
    HitPayload payload{};
};

class Projectile {
public:
    explicit Projectile(ProjectileArchetype archetype = {});

    Projectile(const Projectile&) = delete;
    Projectile& operator=(const Projectile&) = delete;

    void initialize(const ProjectileLaunch& launch, const TargetDirectory& directory);
    void update(float dt, CombatContext& context);

    // Back to the canonical idle state; detaches every subscriber.
    void reset();

    // Pool integration.
    void setActive(bool active) { active_ = active; }
    bool isActive() const { return active_; }
    void setPose(const Bulwark::Vec3& position, const Bulwark::Vec3& forward);
    void bindOwner(ProjectilePool* owner) { owner_ = owner; }
    ProjectilePool* owner() const { return owner_; }

    EProjectileState state() const { return state_; }
    const ProjectileArchetype& archetype() const { return archetype_; }
    const std::string& archetypeId() const { return archetype_.id; }
    const Bulwark::Vec3& position() const { return position_; }
    const Bulwark::Vec3& forward() const { return forward_; }
    Bulwark::ECS::Entity target() const { return target_; }
    const Bulwark::Vec3& lastKnownTargetPosition() const { return lastTargetPosition_; }
    float damage() const { return payload_.damage.amount; }
    float speed() const { return speed_; }
    float aoeRadius() const { return aoeRadius_; }
    float elapsed() const { return elapsed_; }
    float lifetime() const { return archetype_.lifetime; }
    const HitPayload& payload() const { return payload_; }

    Bulwark::Signal<Projectile&, float> onHit;
    Bulwark::Signal<Projectile&> onExpired;

private:
    void move(float dt);
    // Valid entity the last movement segment touched earliest; ties keep registration order.
    Bulwark::ECS::Entity findCollision(const Bulwark::Vec3& from, const TargetDirectory& directory);
    void resolveHit(Bulwark::ECS::Entity trigger, CombatContext& context);
    void expire();
    void deactivate();

    ProjectileArchetype archetype_;
    ProjectilePool* owner_{nullptr};
    bool active_{false};
    EProjectileState state_{EProjectileState::Idle};

    Bulwark::Vec3 position_{};
    Bulwark::Vec3 forward_{Bulwark::Vec3::forward()};
    Bulwark::ECS::Entity target_{};
    Bulwark::Vec3 lastTargetPosition_{};
    float speed_{0.0f};
    float aoeRadius_{0.0f};
    float elapsed_{0.0f};
    Bulwark::ECS::CategoryMask mask_{Bulwark::ECS::Category::Enemy};
    HitPayload payload_{};

    Bulwark::QueryBuffer<> hits_{};
};

}  // namespace Defense

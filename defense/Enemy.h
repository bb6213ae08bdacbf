// Reference pooled enemy: follows a given waypoint path and takes damage and effects.
#pragma once

#include <cstddef>
#include <vector>

#include "../engine/core/Signal.h"
#include "../engine/ecs/Entity.h"
#include "../engine/status/EffectTracker.h"
#include "CombatConfig.h"
#include "Targetable.h"

namespace Defense {

class Enemy : public ITargetable, public IDamageable {
public:
    Enemy();

    Enemy(const Enemy&) = delete;
    Enemy& operator=(const Enemy&) = delete;

    // Places the enemy at the first waypoint with full health.
    void spawn(const EnemyDefinition& definition, std::vector<Bulwark::Vec3> path);
    // Moves along the path; reaching the last waypoint calls reachEnd().
    void update(float dt);

    // ITargetable
    Bulwark::Vec3 aimPoint() const override { return position_; }
    bool isValidTarget() const override { return active_ && !dead_ && !reachedEnd_; }
    float currentHealth() const override { return health_; }
    float distanceTraveled() const override { return distanceTraveled_; }
    float currentSpeed() const override { return speed_; }
    Bulwark::Vec3 velocity() const override { return velocity_; }

    // IDamageable
    float applyDamage(const Bulwark::Gameplay::DamageInfo& info) override;
    void applySlow(float amount, float duration) override;
    void removeSlow() override;
    bool isDead() const override { return dead_; }
    Bulwark::Status::EffectTracker* effects() override { return &effects_; }

    // Raw damage that bypasses armor.
    float takeDamage(float amount);
    void die();
    void reachEnd();
    // Pool return: clears effects, state and every subscriber.
    void resetEnemy();

    // Pool integration.
    void setActive(bool active) { active_ = active; }
    bool isActive() const { return active_; }
    void setPose(const Bulwark::Vec3& position, const Bulwark::Vec3& forward);

    void setEntity(Bulwark::ECS::Entity e) { entity_ = e; }
    Bulwark::ECS::Entity entity() const { return entity_; }

    const EnemyDefinition& definition() const { return definition_; }
    const Bulwark::Vec3& position() const { return position_; }
    float maxHealth() const { return definition_.maxHealth; }
    float healthPercent() const { return definition_.maxHealth > 0.0f ? health_ / definition_.maxHealth : 0.0f; }
    float armor() const { return definition_.armor; }
    float baseSpeed() const { return definition_.moveSpeed; }
    float slowAmount() const { return slowAmount_; }
    bool hasReachedEnd() const { return reachedEnd_; }

    Bulwark::Signal<Enemy&> onDeath;
    Bulwark::Signal<Enemy&> onReachedEnd;
    Bulwark::Signal<Enemy&, float, bool> onDamageTaken;  // final damage, critical

private:
    EnemyDefinition definition_{};
    Bulwark::Status::EffectTracker effects_;
    Bulwark::ECS::Entity entity_{};
    bool active_{false};
    bool dead_{false};
    bool reachedEnd_{false};
    float health_{0.0f};
    float speed_{0.0f};
    float slowAmount_{0.0f};
    float distanceTraveled_{0.0f};
    Bulwark::Vec3 position_{};
    Bulwark::Vec3 forward_{Bulwark::Vec3::forward()};
    Bulwark::Vec3 velocity_{};
    std::vector<Bulwark::Vec3> path_;
    std::size_t nextWaypoint_{0};
};

}  // namespace Defense

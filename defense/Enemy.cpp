#include "Enemy.h"

#include <algorithm>
#include <utility>

namespace Defense {

using Bulwark::Vec3;

Enemy::Enemy() : effects_(*this) {}

void Enemy::spawn(const EnemyDefinition& definition, std::vector<Vec3> path) {
    definition_ = definition;
    path_ = std::move(path);
    nextWaypoint_ = path_.empty() ? 0 : 1;
    position_ = path_.empty() ? Vec3{} : path_.front();
    health_ = definition_.maxHealth;
    speed_ = definition_.moveSpeed;
    slowAmount_ = 0.0f;
    distanceTraveled_ = 0.0f;
    velocity_ = Vec3{};
    dead_ = false;
    reachedEnd_ = false;
}

void Enemy::setPose(const Vec3& position, const Vec3& forward) {
    position_ = position;
    forward_ = forward.nearlyZero() ? Vec3::forward() : forward.normalized();
}

void Enemy::update(float dt) {
    velocity_ = Vec3{};
    if (!isValidTarget() || dt <= 0.0f) {
        return;
    }

    float budget = speed_ * dt;
    const Vec3 start = position_;
    while (budget > 0.0f && nextWaypoint_ < path_.size()) {
        const Vec3 toNext = path_[nextWaypoint_] - position_;
        const float dist = toNext.length();
        if (dist <= budget) {
            position_ = path_[nextWaypoint_];
            budget -= dist;
            ++nextWaypoint_;
            distanceTraveled_ += dist;
        } else {
            forward_ = toNext / dist;
            position_ += forward_ * budget;
            distanceTraveled_ += budget;
            budget = 0.0f;
        }
    }
    velocity_ = (position_ - start) / dt;

    if (nextWaypoint_ >= path_.size()) {
        reachEnd();
    }
}

float Enemy::applyDamage(const Bulwark::Gameplay::DamageInfo& info) {
    if (dead_ || reachedEnd_) {
        return health_;
    }
    const float finalDamage = Bulwark::Gameplay::applyArmorReduction(info.amount, definition_.armor, info.type);
    health_ -= finalDamage;
    onDamageTaken.emit(*this, finalDamage, info.isCritical);
    if (health_ <= 0.0f) {
        health_ = 0.0f;
        die();
    }
    return health_;
}

float Enemy::takeDamage(float amount) {
    Bulwark::Gameplay::DamageInfo info;
    info.amount = amount;
    info.hitPoint = position_;
    info.type = Bulwark::Gameplay::DamageType::True;
    return applyDamage(info);
}

void Enemy::applySlow(float amount, float /*duration*/) {
    amount = std::clamp(amount, 0.0f, 1.0f);
    if (amount > slowAmount_) {
        slowAmount_ = amount;
        speed_ = definition_.moveSpeed * (1.0f - slowAmount_);
    }
}

void Enemy::removeSlow() {
    slowAmount_ = 0.0f;
    speed_ = definition_.moveSpeed;
}

void Enemy::die() {
    if (dead_) {
        return;
    }
    dead_ = true;
    velocity_ = Vec3{};
    effects_.clearAll();
    onDeath.emit(*this);
}

void Enemy::reachEnd() {
    if (dead_ || reachedEnd_) {
        return;
    }
    reachedEnd_ = true;
    velocity_ = Vec3{};
    effects_.clearAll();
    onReachedEnd.emit(*this);
}

void Enemy::resetEnemy() {
    effects_.reset();
    definition_ = EnemyDefinition{};
    entity_ = Bulwark::ECS::Entity{};
    dead_ = false;
    reachedEnd_ = false;
    health_ = 0.0f;
    speed_ = 0.0f;
    slowAmount_ = 0.0f;
    distanceTraveled_ = 0.0f;
    velocity_ = Vec3{};
    path_.clear();
    nextWaypoint_ = 0;
    onDeath.disconnectAll();
    onReachedEnd.disconnectAll();
    onDamageTaken.disconnectAll();
}

}  // namespace Defense

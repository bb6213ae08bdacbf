// Lead prediction and bounded turret rotation.
#include <cassert>
#include <cmath>
#include <deque>

#include "../defense/Aiming.h"
#include "../engine/ecs/Registry.h"
#include "TestSupport.h"

using Bulwark::Vec3;
using Bulwark::ECS::Collider;
using Bulwark::ECS::Entity;
using Bulwark::ECS::Transform;
using Defense::Aiming;
using Defense::TargetDirectory;
using Defense::predictInterceptPosition;
using TestSupport::StubTarget;

namespace {
struct Field {
    Bulwark::ECS::Registry registry;
    TargetDirectory directory{registry};
    std::deque<StubTarget> targets;

    Entity spawn(const Vec3& position) {
        StubTarget& t = targets.emplace_back(position);
        return directory.add(t, &t, Collider{});
    }
};

bool near(float a, float b, float eps = 1e-3f) { return std::fabs(a - b) <= eps; }
}  // namespace

int main() {
    {
        // Stationary targets are aimed at directly, whatever the projectile speed.
        const Vec3 target{7.0f, 1.0f, -3.0f};
        assert(predictInterceptPosition({}, target, {}, 5.0f) == target);
        assert(predictInterceptPosition({}, target, {}, 500.0f) == target);
        assert(predictInterceptPosition({}, target, {0.05f, 0.0f, 0.0f}, 5.0f) == target);
    }
    {
        // Without a projectile there is nothing to lead.
        const Vec3 target{10.0f, 0.0f, 0.0f};
        assert(predictInterceptPosition({}, target, {0.0f, 0.0f, 4.0f}, 0.0f) == target);
        assert(predictInterceptPosition({}, target, {0.0f, 0.0f, 4.0f}, -1.0f) == target);
    }
    {
        // Moving target: the aim point moves ahead along its velocity.
        const Vec3 predicted = predictInterceptPosition({}, {10.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 2.0f}, 10.0f);
        assert(predicted.x == 10.0f);
        assert(predicted.z > 2.0f && predicted.z < 2.1f);
    }
    {
        // Flight time is capped at three seconds.
        const Vec3 predicted = predictInterceptPosition({}, {100.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, 1.0f);
        assert(predicted.x == 100.0f);
        assert(predicted.z == Defense::kMaxLeadTime);
    }
    {
        // Rotation is limited by the turn rate and the unit is aimed once within tolerance.
        Field field;
        const Entity e = field.spawn({10.0f, 0.0f, 0.0f});
        Aiming aiming(90.0f, 5.0f, true, true);
        Transform tf;

        aiming.update(tf, tf.position, e, field.directory, 0.0f, 0.5f);
        assert(near(Bulwark::angleDegrees(tf.forward, {1.0f, 0.0f, 0.0f}), 45.0f, 0.1f));
        assert(!aiming.isAimed());

        aiming.update(tf, tf.position, e, field.directory, 0.0f, 0.5f);
        assert(aiming.isAimed());
        assert(near(tf.forward.x, 1.0f));
        assert(near(tf.forward.z, 0.0f));
    }
    {
        // Aim tolerance: 4 degrees off counts, 6 degrees off does not.
        Field field;
        const float inside = 4.0f * Bulwark::kDegToRad;
        const float outside = 6.0f * Bulwark::kDegToRad;
        const Entity a = field.spawn({10.0f * std::sin(inside), 0.0f, 10.0f * std::cos(inside)});
        const Entity b = field.spawn({10.0f * std::sin(outside), 0.0f, 10.0f * std::cos(outside)});
        Aiming frozen(0.0f, 5.0f, false, true);

        Transform tf;
        frozen.update(tf, tf.position, a, field.directory, 0.0f, 0.1f);
        assert(frozen.isAimed());
        assert(tf.forward == Vec3::forward());

        frozen.update(tf, tf.position, b, field.directory, 0.0f, 0.1f);
        assert(!frozen.isAimed());
    }
    {
        // Vertical offset is ignored when the vertical axis is locked.
        Field field;
        const Entity e = field.spawn({0.0f, 5.0f, 10.0f});
        Aiming aiming(0.0f, 5.0f, false, true);
        Transform tf;
        aiming.update(tf, tf.position, e, field.directory, 0.0f, 0.1f);
        assert(aiming.isAimed());
        assert(aiming.aimDirection().y == 0.0f);

        Aiming free(0.0f, 5.0f, false, false);
        free.update(tf, tf.position, e, field.directory, 0.0f, 0.1f);
        assert(!free.isAimed());
    }
    {
        // A raised fire point aims level at a target at the same height.
        Field field;
        const Entity e = field.spawn({0.0f, 2.0f, 10.0f});
        Aiming aiming(180.0f, 5.0f, false, false);
        Transform tf;
        const Vec3 muzzle{0.0f, 2.0f, 0.0f};
        aiming.snapToTarget(tf, muzzle, e, field.directory, 0.0f);
        assert(aiming.aimDirection().y == 0.0f);
        assert(near(tf.forward.z, 1.0f));
        aiming.update(tf, muzzle, e, field.directory, 0.0f, 0.1f);
        assert(aiming.isAimed());
    }
    {
        // Lead prediction feeds the aim direction.
        Field field;
        const Entity e = field.spawn({10.0f, 0.0f, 0.0f});
        field.targets[0].moveVelocity = {0.0f, 0.0f, 2.0f};
        Aiming leading(180.0f, 5.0f, true, true);
        Transform tf;
        leading.snapToTarget(tf, tf.position, e, field.directory, 10.0f);
        assert(leading.isAimed());
        assert(leading.predictedPosition().z > 2.0f);
        assert(tf.forward.z > 0.0f);

        Aiming plain(180.0f, 5.0f, false, true);
        plain.snapToTarget(tf, tf.position, e, field.directory, 10.0f);
        assert(plain.predictedPosition() == field.targets[0].position);
        assert(near(tf.forward.x, 1.0f));
    }
    {
        // Invalid targets leave the facing alone and clear the aimed flag.
        Field field;
        const Entity e = field.spawn({10.0f, 0.0f, 0.0f});
        Aiming aiming(90.0f, 5.0f, true, true);
        Transform tf;
        aiming.snapToTarget(tf, tf.position, e, field.directory, 0.0f);
        assert(aiming.isAimed());

        field.targets[0].health = 0.0f;
        const Vec3 before = tf.forward;
        aiming.update(tf, tf.position, e, field.directory, 0.0f, 1.0f);
        assert(!aiming.isAimed());
        assert(tf.forward == before);

        aiming.update(tf, tf.position, Entity{}, field.directory, 0.0f, 1.0f);
        assert(!aiming.isAimed());
    }
    {
        // Facing directly away still turns, around an arbitrary axis.
        Field field;
        const Entity e = field.spawn({0.0f, 0.0f, -10.0f});
        Aiming aiming(90.0f, 5.0f, false, true);
        Transform tf;
        aiming.update(tf, tf.position, e, field.directory, 0.0f, 1.0f);
        assert(near(Bulwark::angleDegrees(tf.forward, Vec3::forward()), 90.0f, 0.1f));
        aiming.update(tf, tf.position, e, field.directory, 0.0f, 1.0f);
        assert(aiming.isAimed());
    }
    return 0;
}

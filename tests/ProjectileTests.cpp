// Projectile flight, single and area hits, expiry and the pooled reset contract.
#include <cassert>
#include <deque>
#include <random>

#include "../defense/ProjectilePool.h"
#include "../defense/TargetDirectory.h"
#include "../engine/ecs/Registry.h"
#include "TestSupport.h"

using Bulwark::Vec3;
using Bulwark::ECS::Collider;
using Bulwark::ECS::Entity;
using Defense::EProjectileState;
using Defense::Projectile;
using Defense::ProjectileArchetype;
using Defense::ProjectileLaunch;
using Defense::ProjectilePool;
using TestSupport::StubTarget;

namespace {
struct World {
    Bulwark::ECS::Registry registry;
    Defense::TargetDirectory directory{registry};
    ProjectilePool pool{4};
    std::mt19937 rng{7u};
    Defense::CombatContext context{registry, directory, &pool, rng};
    std::deque<StubTarget> targets;

    Entity spawn(const Vec3& position) {
        StubTarget& t = targets.emplace_back(position);
        return directory.add(t, &t, Collider{0.5f, Bulwark::ECS::Category::Ground});
    }
};

ProjectileArchetype archetype(const char* id, float speed = 10.0f) {
    ProjectileArchetype a;
    a.id = id;
    a.speed = speed;
    a.lifetime = 2.0f;
    a.hitRadius = 0.25f;
    return a;
}

ProjectileLaunch launchAt(Entity target, float damage, float aoe = 0.0f) {
    ProjectileLaunch launch;
    launch.target = target;
    launch.aoeRadius = aoe;
    launch.payload.damage.amount = damage;
    return launch;
}

void fly(World& world, float seconds, float dt = 0.05f) {
    for (float t = 0.0f; t < seconds; t += dt) world.pool.update(dt, world.context);
}
}  // namespace

int main() {
    {
        // Area hit damages every entity within the radius exactly once, the trigger included.
        World world;
        world.pool.registerArchetype(archetype("shell"));
        const Entity trigger = world.spawn({0.0f, 0.0f, 5.0f});
        world.spawn({2.0f, 0.0f, 5.0f});
        world.spawn({0.0f, 0.0f, 7.5f});
        world.spawn({-1.5f, 0.0f, 6.5f});
        world.spawn({4.0f, 0.0f, 5.0f});

        Projectile* p = world.pool.get("shell", {}, Vec3::forward());
        assert(p);
        p->initialize(launchAt(trigger, 10.0f, 3.0f), world.directory);
        int hitEvents = 0;
        p->onHit.connect([&hitEvents](Projectile&, float damage) {
            assert(damage == 10.0f);
            ++hitEvents;
        });

        fly(world, 1.0f);
        assert(hitEvents == 1);
        assert(world.targets[0].hits == 1);
        assert(world.targets[1].hits == 1);
        assert(world.targets[2].hits == 1);
        assert(world.targets[3].hits == 1);
        assert(world.targets[4].hits == 0);
        assert(!p->isActive());
        assert(p->state() == EProjectileState::Idle);
    }
    {
        // Single-target hit touches only the entity it collided with.
        World world;
        world.pool.registerArchetype(archetype("arrow", 20.0f));
        const Entity target = world.spawn({0.0f, 0.0f, 4.0f});
        world.spawn({0.8f, 0.0f, 4.2f});

        Projectile* p = world.pool.get("arrow", {}, Vec3::forward());
        p->initialize(launchAt(target, 6.0f), world.directory);
        assert(p->state() == EProjectileState::InFlight);
        assert(p->lastKnownTargetPosition() == world.targets[0].position);

        fly(world, 0.5f);
        assert(world.targets[0].hits == 1);
        assert(world.targets[0].damageTaken == 6.0f);
        assert(world.targets[1].hits == 0);
        assert(world.pool.totalActive() == 0);
    }
    {
        // A long step through two entities hits the nearer one, whatever the registration order.
        World world;
        world.pool.registerArchetype(archetype("arrow", 20.0f));
        const Entity far = world.spawn({0.0f, 0.0f, 8.0f});
        world.spawn({0.0f, 0.0f, 3.0f});

        Projectile* p = world.pool.get("arrow", {}, Vec3::forward());
        p->initialize(launchAt(far, 5.0f), world.directory);
        fly(world, 0.5f, 0.5f);
        assert(world.targets[1].hits == 1);
        assert(world.targets[0].hits == 0);
        assert(!p->isActive());
    }
    {
        // Slow payload is applied on impact.
        World world;
        world.pool.registerArchetype(archetype("frost", 20.0f));
        const Entity target = world.spawn({0.0f, 0.0f, 3.0f});
        Projectile* p = world.pool.get("frost", {}, Vec3::forward());
        ProjectileLaunch launch = launchAt(target, 2.0f);
        launch.payload.slowAmount = 0.5f;
        launch.payload.slowDuration = 2.0f;
        p->initialize(launch, world.directory);
        fly(world, 0.5f);
        assert(world.targets[0].slow == 0.5f);
        assert(world.targets[0].tracker.has(Bulwark::Status::EEffectKind::Slow));
    }
    {
        // Projectiles home on a moving target.
        World world;
        world.pool.registerArchetype(archetype("arrow", 15.0f));
        const Entity target = world.spawn({0.0f, 0.0f, 6.0f});
        Projectile* p = world.pool.get("arrow", {}, Vec3::forward());
        p->initialize(launchAt(target, 1.0f), world.directory);

        world.targets[0].position = {3.0f, 0.0f, 6.0f};
        fly(world, 1.0f);
        assert(world.targets[0].hits == 1);
    }
    {
        // Target lost mid-flight: the projectile continues to the last known position.
        World world;
        world.pool.registerArchetype(archetype("arrow", 10.0f));
        const Entity target = world.spawn({0.0f, 0.0f, 5.0f});
        Projectile* p = world.pool.get("arrow", {}, Vec3::forward());
        p->initialize(launchAt(target, 1.0f), world.directory);

        world.pool.update(0.1f, world.context);
        world.targets[0].health = 0.0f;
        world.pool.update(0.1f, world.context);
        assert(p->isActive());
        assert(!p->target().valid());
        assert(p->lastKnownTargetPosition() == Vec3(0.0f, 0.0f, 5.0f));

        // Something else standing there gets hit instead.
        world.spawn({0.0f, 0.0f, 5.0f});
        fly(world, 1.0f);
        assert(world.targets[1].hits == 1);
        assert(world.targets[0].hits == 0);
    }
    {
        // Lifetime expiry returns the projectile without a hit.
        World world;
        world.pool.registerArchetype(archetype("arrow", 1.0f));
        Projectile* p = world.pool.get("arrow", {}, Vec3::forward());
        p->initialize(launchAt(Entity{}, 1.0f), world.directory);
        assert(p->lastKnownTargetPosition() == Vec3(0.0f, 0.0f, 100.0f));

        int expired = 0;
        int hits = 0;
        p->onExpired.connect([&expired](Projectile&) { ++expired; });
        p->onHit.connect([&hits](Projectile&, float) { ++hits; });
        world.pool.update(1.0f, world.context);
        assert(p->isActive());
        world.pool.update(1.0f, world.context);
        assert(expired == 1);
        assert(hits == 0);
        assert(!p->isActive());
        assert(world.pool.stats("arrow")->inactive == 4);
    }
    {
        // Reset restores the idle state, is idempotent and drops subscribers.
        World world;
        world.pool.registerArchetype(archetype("arrow"));
        const Entity target = world.spawn({0.0f, 0.0f, 50.0f});
        Projectile* p = world.pool.get("arrow", {1.0f, 2.0f, 3.0f}, {1.0f, 0.0f, 0.0f});
        ProjectileLaunch launch = launchAt(target, 9.0f, 2.0f);
        launch.payload.slowAmount = 0.3f;
        launch.payload.slowDuration = 1.0f;
        p->initialize(launch, world.directory);
        p->onHit.connect([](Projectile&, float) {});
        p->onExpired.connect([](Projectile&) {});
        world.pool.update(0.1f, world.context);

        p->reset();
        p->reset();
        assert(p->state() == EProjectileState::Idle);
        assert(!p->target().valid());
        assert(p->position() == Vec3{});
        assert(p->forward() == Vec3::forward());
        assert(p->damage() == 0.0f);
        assert(p->aoeRadius() == 0.0f);
        assert(p->elapsed() == 0.0f);
        assert(!p->payload().hasSlow());
        assert(p->onHit.empty());
        assert(p->onExpired.empty());
    }
    {
        // A reused projectile carries nothing over from its previous flight.
        World world;
        world.pool.registerArchetype(archetype("arrow", 20.0f));
        const Entity target = world.spawn({0.0f, 0.0f, 3.0f});
        Projectile* first = world.pool.get("arrow", {}, Vec3::forward());
        int staleHits = 0;
        first->onHit.connect([&staleHits](Projectile&, float) { ++staleHits; });
        first->initialize(launchAt(target, 5.0f, 1.0f), world.directory);
        fly(world, 0.5f);
        assert(staleHits == 1);

        Projectile* second = world.pool.get("arrow", {}, Vec3::forward());
        assert(second == first);
        assert(second->aoeRadius() == 0.0f);
        assert(second->onHit.empty());
        second->initialize(launchAt(target, 5.0f), world.directory);
        fly(world, 0.5f);
        assert(staleHits == 1);
        assert(world.targets[0].hits == 2);
    }
    {
        // Untracked projectiles keep their launch heading.
        World world;
        ProjectileArchetype straight = archetype("bolt", 10.0f);
        straight.trackTarget = false;
        world.pool.registerArchetype(straight);
        const Entity target = world.spawn({0.0f, 0.0f, 5.0f});
        Projectile* p = world.pool.get("bolt", {}, Vec3::forward());
        p->initialize(launchAt(target, 1.0f), world.directory);

        world.targets[0].position = {4.0f, 0.0f, 5.0f};
        world.pool.update(0.1f, world.context);
        assert(p->forward() == Vec3::forward());
        fly(world, 1.0f);
        assert(world.targets[0].hits == 0);
    }
    {
        // Unowned projectiles reset themselves when they finish.
        World world;
        const Entity target = world.spawn({0.0f, 0.0f, 1.0f});
        Projectile loose(archetype("loose", 10.0f));
        loose.setActive(true);
        loose.setPose({}, Vec3::forward());
        loose.initialize(launchAt(target, 3.0f), world.directory);
        for (int i = 0; i < 10 && loose.isActive(); ++i) loose.update(0.05f, world.context);
        assert(!loose.isActive());
        assert(world.targets[0].damageTaken == 3.0f);
        assert(loose.state() == EProjectileState::Idle);
    }
    return 0;
}

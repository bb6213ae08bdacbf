#include "SandboxApp.h"

#include <algorithm>
#include <string>
#include <utility>

#include "../engine/core/FrameInput.h"
#include "../engine/core/Logger.h"

namespace Sandbox {

using Bulwark::Vec2;
using Bulwark::Vec3;

namespace {
constexpr double kWaveInterval = 6.0;
constexpr int kEnemiesPerWave = 12;
constexpr float kPixelsPerUnit = 20.0f;
constexpr float kMaxTimeScale = 8.0f;
}  // namespace

SandboxApp::SandboxApp(Defense::CombatData data, double headlessSeconds)
    : data_(std::move(data)),
      headlessSeconds_(headlessSeconds),
      enemies_([]() { return std::make_unique<Defense::Enemy>(); }, "Enemy") {
    enemies_.setHooks(nullptr, [](Defense::Enemy& e) { e.resetEnemy(); });
}

bool SandboxApp::onInitialize(Bulwark::Application& app) {
    app_ = &app;
    if (data_.towers.empty() || data_.enemies.empty()) {
        Bulwark::logError("[Sandbox] data needs at least one tower and one enemy");
        return false;
    }
    const std::size_t problems = Defense::CombatDataLoader::validate(data_);
    if (problems > 0) {
        Bulwark::logWarn("[Sandbox] " + std::to_string(problems) + " configuration problem(s); fallbacks apply");
    }

    simulation_ = std::make_unique<Defense::CombatSimulation>(data_.settings);
    for (const auto& archetype : data_.projectiles) {
        simulation_->registerProjectile(archetype);
    }

    // Zig-zag lane on the ground plane.
    path_ = {{0.0f, 0.0f, 5.0f},  {20.0f, 0.0f, 5.0f},  {20.0f, 0.0f, 15.0f},
             {40.0f, 0.0f, 15.0f}, {40.0f, 0.0f, 25.0f}, {60.0f, 0.0f, 25.0f}};
    enemies_.prewarm(static_cast<std::size_t>(kEnemiesPerWave) * 2);
    placeTowers();
    spawnWave();
    return true;
}

void SandboxApp::placeTowers() {
    const Vec3 spots[] = {{10.0f, 0.0f, 9.0f},  {24.0f, 0.0f, 10.0f}, {30.0f, 0.0f, 19.0f},
                          {44.0f, 0.0f, 20.0f}, {50.0f, 0.0f, 29.0f}, {16.0f, 0.0f, 1.0f}};
    std::size_t i = 0;
    for (const auto& spot : spots) {
        const auto& stats = data_.towers[i++ % data_.towers.size()];
        const auto unit = simulation_->addUnit(stats, spot);
        simulation_->attack(unit)->onAttack.connect(
            [this](Bulwark::ECS::Entity, Bulwark::ECS::Entity) { ++attacks_; });
        Bulwark::logInfo("[Sandbox] placed " + stats.name + " (" + std::string(Defense::toString(stats.priority)) + ")");
    }
}

void SandboxApp::spawnWave() {
    ++wave_;
    for (int i = 0; i < kEnemiesPerWave; ++i) {
        spawnEnemy(data_.enemies[static_cast<std::size_t>(i) % data_.enemies.size()]);
    }
    Bulwark::logInfo("[Sandbox] wave " + std::to_string(wave_) + " spawned");
}

void SandboxApp::spawnEnemy(const Defense::EnemyDefinition& definition) {
    Defense::Enemy* enemy = enemies_.get();
    if (!enemy) {
        return;
    }
    // Stagger spawns behind the lane start so they enter one by one.
    std::vector<Vec3> path = path_;
    const float stagger = static_cast<float>(enemies_.activeCount() % kEnemiesPerWave) * 1.5f;
    path.front().x -= stagger;
    enemy->spawn(definition, std::move(path));

    const auto entity = simulation_->addTarget(*enemy, enemy, {definition.radius, definition.category()});
    enemy->setEntity(entity);
    enemy->onDeath.connect([this](Defense::Enemy& e) {
        ++kills_;
        retiring_.push_back(&e);
    });
    enemy->onReachedEnd.connect([this](Defense::Enemy& e) {
        ++leaks_;
        retiring_.push_back(&e);
    });
}

void SandboxApp::retireEnemies() {
    for (Defense::Enemy* e : retiring_) {
        simulation_->removeTarget(e->entity());
        enemies_.release(*e);
    }
    retiring_.clear();
}

void SandboxApp::cyclePriority() {
    for (auto unit : simulation_->units()) {
        auto* targeting = simulation_->targeting(unit);
        const int next = (static_cast<int>(targeting->priority()) + 1) % 5;
        targeting->setPriority(static_cast<Defense::ETargetPriority>(next));
    }
    const auto& units = simulation_->units();
    if (!units.empty()) {
        Bulwark::logInfo("[Sandbox] priority now " +
                         std::string(Defense::toString(simulation_->targeting(units.front())->priority())));
    }
}

void SandboxApp::onUpdate(const Bulwark::TimeStep& step, const Bulwark::FrameInput& input) {
    if (input.togglePause) paused_ = !paused_;
    if (input.spawnWave) spawnWave();
    if (input.cyclePriority) cyclePriority();
    if (input.speedUp) timeScale_ = std::min(kMaxTimeScale, timeScale_ * 2.0f);
    if (input.slowDown) timeScale_ = std::max(0.25f, timeScale_ * 0.5f);

    if (!paused_) {
        const float dt = step.dt() * timeScale_;
        simulatedSeconds_ += dt;
        waveTimer_ += dt;
        if (waveTimer_ >= kWaveInterval) {
            waveTimer_ = 0.0;
            spawnWave();
        }

        scratch_.clear();
        enemies_.forEachActive([this](Defense::Enemy& e) { scratch_.push_back(&e); });
        for (Defense::Enemy* e : scratch_) {
            e->update(dt);
        }
        simulation_->tick(dt);
        retireEnemies();
    }

    monitor_.frame(step.deltaSeconds, enemies_.activeCount(), simulation_->projectiles().totalActive());
    render();

    if (headlessSeconds_ > 0.0 && simulatedSeconds_ >= headlessSeconds_) {
        app_->requestQuit("headless run complete");
    }
}

Vec2 SandboxApp::toScreen(const Vec3& world) const {
    return Vec2{40.0f + world.x * kPixelsPerUnit, 40.0f + world.z * kPixelsPerUnit};
}

void SandboxApp::render() {
    auto& r = app_->renderer();
    r.clear(Bulwark::Palette::Background);

    for (std::size_t i = 1; i < path_.size(); ++i) {
        r.drawLine(toScreen(path_[i - 1]), toScreen(path_[i]), Bulwark::Palette::Path);
    }

    for (auto unit : simulation_->units()) {
        const auto* tf = simulation_->transform(unit);
        const auto* stats = simulation_->unit(unit);
        const Vec2 c = toScreen(tf->position);
        r.drawCircle(c, stats->stats.range * kPixelsPerUnit, Bulwark::Palette::Range, 48);
        r.drawFilledRect(c - Vec2{8.0f, 8.0f}, Vec2{16.0f, 16.0f}, Bulwark::Palette::Tower);
        r.drawLine(c, c + Vec2{tf->forward.x, tf->forward.z} * 14.0f, Bulwark::Palette::Tower);
    }

    enemies_.forEachActive([&](Defense::Enemy& e) {
        const Vec2 c = toScreen(e.position());
        const auto color = e.slowAmount() > 0.0f ? Bulwark::Palette::SlowedEnemy : Bulwark::Palette::Enemy;
        r.drawFilledRect(c - Vec2{6.0f, 6.0f}, Vec2{12.0f, 12.0f}, color);
        r.drawFilledRect(c - Vec2{8.0f, 11.0f}, Vec2{16.0f, 3.0f}, Bulwark::Palette::HealthBack);
        r.drawFilledRect(c - Vec2{8.0f, 11.0f}, Vec2{16.0f * e.healthPercent(), 3.0f}, Bulwark::Palette::HealthFill);
    });

    simulation_->projectiles().forEachActive([&](Defense::Projectile& p) {
        r.drawFilledRect(toScreen(p.position()) - Vec2{2.0f, 2.0f}, Vec2{4.0f, 4.0f}, Bulwark::Palette::Projectile);
    });
}

void SandboxApp::onShutdown() {
    Bulwark::logInfo("[Sandbox] " + std::to_string(wave_) + " waves, " + std::to_string(attacks_) + " attacks, " +
                     std::to_string(kills_) + " kills, " + std::to_string(leaks_) + " leaks");
    if (simulation_) {
        simulation_->projectiles().returnAll();
    }
    enemies_.releaseAll();
}

}  // namespace Sandbox

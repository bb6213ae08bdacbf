// Debug viewer: places configured towers along a fixed lane and streams pooled enemies through it.
#pragma once

#include <memory>
#include <vector>

#include "../defense/CombatDataLoader.h"
#include "../defense/CombatSimulation.h"
#include "../defense/Enemy.h"
#include "../engine/core/Application.h"
#include "../engine/core/ApplicationListener.h"
#include "../engine/pool/Pool.h"
#include "PerformanceMonitor.h"

namespace Sandbox {

class SandboxApp final : public Bulwark::ApplicationListener {
public:
    // headlessSeconds > 0 quits after that much simulated time.
    SandboxApp(Defense::CombatData data, double headlessSeconds);

    bool onInitialize(Bulwark::Application& app) override;
    void onUpdate(const Bulwark::TimeStep& step, const Bulwark::FrameInput& input) override;
    void onShutdown() override;

private:
    void placeTowers();
    void spawnWave();
    void spawnEnemy(const Defense::EnemyDefinition& definition);
    void retireEnemies();
    void cyclePriority();
    void render();
    Bulwark::Vec2 toScreen(const Bulwark::Vec3& world) const;

    Defense::CombatData data_;
    double headlessSeconds_;
    Bulwark::Application* app_{nullptr};
    std::unique_ptr<Defense::CombatSimulation> simulation_;
    Bulwark::Pool<Defense::Enemy> enemies_;
    std::vector<Bulwark::Vec3> path_;
    std::vector<Defense::Enemy*> retiring_;
    std::vector<Defense::Enemy*> scratch_;
    PerformanceMonitor monitor_;

    bool paused_{false};
    float timeScale_{1.0f};
    double simulatedSeconds_{0.0};
    double waveTimer_{0.0};
    int wave_{0};
    std::size_t kills_{0};
    std::size_t leaks_{0};
    std::size_t attacks_{0};
};

}  // namespace Sandbox

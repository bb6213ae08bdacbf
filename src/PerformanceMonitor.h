// Rolling frame-rate and population report for the sandbox.
#pragma once

#include <cstddef>

namespace Sandbox {

class PerformanceMonitor {
public:
    explicit PerformanceMonitor(double targetFps = 60.0, double reportInterval = 1.0)
        : targetFps_(targetFps), reportInterval_(reportInterval) {}

    // Logs once per report interval; warns below 80% of the target rate.
    void frame(double deltaSeconds, std::size_t activeEnemies, std::size_t activeProjectiles);

    double lastFps() const { return lastFps_; }
    double worstFps() const { return worstFps_; }
    std::size_t reports() const { return reports_; }

private:
    double targetFps_;
    double reportInterval_;
    double accumulated_{0.0};
    std::size_t frames_{0};
    std::size_t reports_{0};
    double lastFps_{0.0};
    double worstFps_{0.0};
};

}  // namespace Sandbox

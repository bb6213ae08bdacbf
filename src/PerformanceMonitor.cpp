#include "PerformanceMonitor.h"

#include <algorithm>
#include <sstream>

#include "../engine/core/Logger.h"

namespace Sandbox {

void PerformanceMonitor::frame(double deltaSeconds, std::size_t activeEnemies, std::size_t activeProjectiles) {
    accumulated_ += deltaSeconds;
    ++frames_;
    if (accumulated_ < reportInterval_) {
        return;
    }

    lastFps_ = static_cast<double>(frames_) / accumulated_;
    worstFps_ = reports_ == 0 ? lastFps_ : std::min(worstFps_, lastFps_);
    ++reports_;

    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << "[Perf] " << lastFps_ << " fps, " << activeEnemies << " enemies, " << activeProjectiles
        << " projectiles";
    if (lastFps_ < targetFps_ * 0.8) {
        Bulwark::logWarn(oss.str() + " (below 80% of target)");
    } else {
        Bulwark::logInfo(oss.str());
    }

    accumulated_ = 0.0;
    frames_ = 0;
}

}  // namespace Sandbox

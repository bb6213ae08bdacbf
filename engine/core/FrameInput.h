// Per-frame debug controls gathered by the window backend.
#pragma once

namespace Bulwark {

struct FrameInput {
    bool togglePause{false};
    bool spawnWave{false};
    bool cyclePriority{false};
    bool speedUp{false};
    bool slowDown{false};

    void nextFrame() { *this = FrameInput{}; }
};

}  // namespace Bulwark

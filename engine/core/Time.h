// Time structures used by the simulation tick and the sandbox loop.
#pragma once

#include <cstdint>

namespace Bulwark {

// Variable-length step; movement and cooldowns integrate deltaSeconds directly,
// so replays are only exact when the caller feeds identical deltas.
struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};
    std::uint64_t frame{0};

    float dt() const { return static_cast<float>(deltaSeconds); }

    void advance(double delta) {
        deltaSeconds = delta;
        elapsedSeconds += delta;
        ++frame;
    }
};

}  // namespace Bulwark

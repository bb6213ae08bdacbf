// Sphere hit volume plus the category bits spatial queries filter on.
#pragma once

#include <cstdint>

namespace Bulwark::ECS {

using CategoryMask = std::uint32_t;

namespace Category {
constexpr CategoryMask None = 0;
constexpr CategoryMask Ground = 1u << 0;
constexpr CategoryMask Air = 1u << 1;
constexpr CategoryMask Enemy = Ground | Air;
constexpr CategoryMask All = ~0u;
}  // namespace Category

struct Collider {
    float radius{0.5f};
    CategoryMask category{Category::Ground};
};

}  // namespace Bulwark::ECS

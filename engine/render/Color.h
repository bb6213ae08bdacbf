// RGBA color plus the palette the debug view draws with.
#pragma once

namespace Bulwark {

struct Color {
    unsigned char r{0};
    unsigned char g{0};
    unsigned char b{0};
    unsigned char a{255};
};

namespace Palette {
constexpr Color Background{18, 20, 26, 255};
constexpr Color Path{60, 64, 76, 255};
constexpr Color Tower{80, 160, 255, 255};
constexpr Color Range{80, 160, 255, 40};
constexpr Color Enemy{230, 80, 70, 255};
constexpr Color SlowedEnemy{120, 200, 255, 255};
constexpr Color Projectile{255, 220, 90, 255};
constexpr Color HealthBack{40, 40, 40, 255};
constexpr Color HealthFill{90, 220, 110, 255};
}  // namespace Palette

}  // namespace Bulwark

#include "RenderDevice.h"

#include <cmath>

namespace Bulwark {

void RenderDevice::drawCircle(const Vec2& center, float radius, const Color& color, int segments) {
    if (segments < 3 || radius <= 0.0f) {
        return;
    }
    const float step = 6.28318530718f / static_cast<float>(segments);
    Vec2 prev{center.x + radius, center.y};
    for (int i = 1; i <= segments; ++i) {
        const float a = step * static_cast<float>(i);
        const Vec2 next{center.x + radius * std::cos(a), center.y + radius * std::sin(a)};
        drawLine(prev, next, color);
        prev = next;
    }
}

}  // namespace Bulwark

// Minimal immediate-mode 2D render device.
#pragma once

#include <memory>

#include "../math/Vec2.h"
#include "Color.h"

namespace Bulwark {

class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    virtual void clear(const Color& color) = 0;
    virtual void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) = 0;
    virtual void drawLine(const Vec2& from, const Vec2& to, const Color& color) = 0;
    virtual void present() = 0;

    // Outline approximated with line segments.
    void drawCircle(const Vec2& center, float radius, const Color& color, int segments = 24);
};

using RenderDevicePtr = std::unique_ptr<RenderDevice>;

}  // namespace Bulwark

// No-op renderer used by NullWindow for headless runs.
#pragma once

#include "RenderDevice.h"

namespace Bulwark {

class NullRenderDevice final : public RenderDevice {
public:
    void clear(const Color& /*color*/) override {}
    void drawFilledRect(const Vec2& /*topLeft*/, const Vec2& /*size*/, const Color& /*color*/) override {}
    void drawLine(const Vec2& /*from*/, const Vec2& /*to*/, const Color& /*color*/) override {}
    void present() override {}
};

}  // namespace Bulwark

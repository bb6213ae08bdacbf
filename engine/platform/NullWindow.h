// Headless window: no events, stays open until the application quits.
#pragma once

#include "Window.h"

namespace Bulwark {

class NullWindow final : public Window {
public:
    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, FrameInput& input) override;
    bool isOpen() const override { return isOpen_; }

private:
    bool isOpen_{false};
};

}  // namespace Bulwark

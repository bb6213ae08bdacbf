// Core application loop orchestrator.
#pragma once

#include <memory>
#include <string>

#include "../platform/Window.h"
#include "../render/RenderDevice.h"
#include "ApplicationListener.h"
#include "FrameInput.h"
#include "Time.h"

namespace Bulwark {

class Application {
public:
    Application(ApplicationListener& listener, WindowPtr window, WindowConfig config = {});
    ~Application();

    bool initialize();
    void run();
    void requestQuit(const std::string& reason);
    bool running() const { return running_; }

    Window& window() { return *window_; }
    RenderDevice& renderer() { return *renderDevice_; }
    const WindowConfig& config() const { return config_; }

private:
    ApplicationListener& listener_;
    WindowPtr window_;
    WindowConfig config_;
    bool running_{false};
    bool initialized_{false};
    TimeStep timeStep_{};
    FrameInput input_{};
    RenderDevicePtr renderDevice_;
};

}  // namespace Bulwark

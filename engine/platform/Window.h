// Abstract window interface; implementations live beside it.
#pragma once

#include <memory>
#include <string>

namespace Bulwark {

struct WindowConfig {
    int width{1280};
    int height{720};
    std::string title{"Bulwark"};
    bool vsync{true};
    // Sleep to hold 60 FPS; headless benchmarks turn this off.
    bool paceFrames{true};
};

class Application;
class RenderDevice;
struct FrameInput;

class Window {
public:
    virtual ~Window() = default;

    virtual bool initialize(const WindowConfig& config) = 0;
    virtual void pollEvents(Application& app, FrameInput& input) = 0;
    virtual std::unique_ptr<RenderDevice> createRenderDevice() = 0;
    virtual bool isOpen() const = 0;
};

using WindowPtr = std::unique_ptr<Window>;

}  // namespace Bulwark

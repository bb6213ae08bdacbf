// Application lifecycle interface implemented by the sandbox.
#pragma once

namespace Bulwark {

class Application;
struct TimeStep;
struct FrameInput;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    virtual bool onInitialize(Application& app) = 0;
    virtual void onUpdate(const TimeStep& step, const FrameInput& input) = 0;
    virtual void onShutdown() = 0;
};

}  // namespace Bulwark

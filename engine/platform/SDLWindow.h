// SDL2-backed window implementation.
#pragma once

#include <SDL.h>

#include "Window.h"

namespace Bulwark {

class SDLWindow final : public Window {
public:
    SDLWindow();
    ~SDLWindow() override;

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, FrameInput& input) override;
    bool isOpen() const override { return isOpen_; }

private:
    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    bool isOpen_{false};
};

}  // namespace Bulwark

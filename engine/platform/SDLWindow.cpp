#include "SDLWindow.h"

#include <SDL.h>

#include "../core/Application.h"
#include "../core/FrameInput.h"
#include "../core/Logger.h"
#include "SDLRenderDevice.h"

namespace Bulwark {

SDLWindow::SDLWindow() = default;

SDLWindow::~SDLWindow() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
    }
    if (window_) {
        SDL_DestroyWindow(window_);
    }
    SDL_Quit();
}

bool SDLWindow::initialize(const WindowConfig& config) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }

    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, config.width,
                               config.height, SDL_WINDOW_SHOWN);
    if (!window_) {
        logError(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }

    const auto rendererFlags = config.vsync ? SDL_RENDERER_PRESENTVSYNC : 0;
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | rendererFlags);
    if (!renderer_) {
        logError(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }

    isOpen_ = true;
    logInfo("SDLWindow initialized.");
    return true;
}

std::unique_ptr<RenderDevice> SDLWindow::createRenderDevice() {
    if (!renderer_) {
        return nullptr;
    }
    return std::make_unique<SDLRenderDevice>(renderer_);
}

void SDLWindow::pollEvents(Application& app, FrameInput& input) {
    SDL_Event evt;
    while (SDL_PollEvent(&evt)) {
        switch (evt.type) {
            case SDL_QUIT:
                isOpen_ = false;
                app.requestQuit("Window close requested.");
                break;
            case SDL_KEYDOWN:
                if (evt.key.repeat != 0) break;
                switch (evt.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        isOpen_ = false;
                        app.requestQuit("Escape pressed.");
                        break;
                    case SDLK_SPACE:
                        input.togglePause = true;
                        break;
                    case SDLK_w:
                        input.spawnWave = true;
                        break;
                    case SDLK_p:
                        input.cyclePriority = true;
                        break;
                    case SDLK_EQUALS:
                    case SDLK_KP_PLUS:
                        input.speedUp = true;
                        break;
                    case SDLK_MINUS:
                    case SDLK_KP_MINUS:
                        input.slowDown = true;
                        break;
                    default:
                        break;
                }
                break;
            default:
                break;
        }
    }
}

}  // namespace Bulwark

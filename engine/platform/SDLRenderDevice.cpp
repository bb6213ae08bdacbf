#include "SDLRenderDevice.h"

namespace Bulwark {

SDLRenderDevice::SDLRenderDevice(SDL_Renderer* renderer) : renderer_(renderer) {}

void SDLRenderDevice::setColor(const Color& color) {
    SDL_SetRenderDrawBlendMode(renderer_, color.a < 255 ? SDL_BLENDMODE_BLEND : SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
}

void SDLRenderDevice::clear(const Color& color) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderClear(renderer_);
}

void SDLRenderDevice::drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) {
    SDL_Rect rect{};
    rect.x = static_cast<int>(topLeft.x);
    rect.y = static_cast<int>(topLeft.y);
    rect.w = static_cast<int>(size.x);
    rect.h = static_cast<int>(size.y);
    setColor(color);
    SDL_RenderFillRect(renderer_, &rect);
}

void SDLRenderDevice::drawLine(const Vec2& from, const Vec2& to, const Color& color) {
    setColor(color);
    SDL_RenderDrawLine(renderer_, static_cast<int>(from.x), static_cast<int>(from.y), static_cast<int>(to.x),
                       static_cast<int>(to.y));
}

void SDLRenderDevice::present() { SDL_RenderPresent(renderer_); }

}  // namespace Bulwark

#include "NullWindow.h"

#include <string>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../render/NullRenderDevice.h"

namespace Bulwark {

bool NullWindow::initialize(const WindowConfig& config) {
    isOpen_ = true;
    logInfo("NullWindow active; running headless (" + config.title + ")");
    return true;
}

std::unique_ptr<RenderDevice> NullWindow::createRenderDevice() { return std::make_unique<NullRenderDevice>(); }

void NullWindow::pollEvents(Application& app, FrameInput& /*input*/) {
    if (!app.running()) {
        isOpen_ = false;
    }
}

}  // namespace Bulwark

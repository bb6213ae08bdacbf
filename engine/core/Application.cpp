#include "Application.h"

#include <chrono>
#include <thread>

#include "Logger.h"

namespace Bulwark {

Application::Application(ApplicationListener& listener, WindowPtr window, WindowConfig config)
    : listener_(listener), window_(std::move(window)), config_(std::move(config)) {}

Application::~Application() {
    if (initialized_) {
        listener_.onShutdown();
    }
}

bool Application::initialize() {
    if (!window_) {
        logError("Application requires a Window instance.");
        return false;
    }

    if (!window_->initialize(config_)) {
        logError("Failed to initialize window.");
        return false;
    }

    renderDevice_ = window_->createRenderDevice();
    if (!renderDevice_) {
        logError("Failed to create render device.");
        return false;
    }

    initialized_ = true;
    running_ = listener_.onInitialize(*this);
    return running_;
}

void Application::run() {
    using clock = std::chrono::steady_clock;
    constexpr double targetDelta = 1.0 / 60.0;

    auto last = clock::now();
    while (running_ && window_->isOpen()) {
        const auto frameStart = clock::now();
        std::chrono::duration<double> dt = frameStart - last;
        last = frameStart;

        timeStep_.advance(dt.count());

        window_->pollEvents(*this, input_);
        listener_.onUpdate(timeStep_, input_);
        input_.nextFrame();
        renderDevice_->present();

        if (config_.paceFrames) {
            const std::chrono::duration<double> spent = clock::now() - frameStart;
            if (spent.count() < targetDelta) {
                std::this_thread::sleep_for(std::chrono::duration<double>(targetDelta - spent.count()));
            }
        }
    }

    logInfo("Application loop exited.");
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Bulwark

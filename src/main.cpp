#include <cstdlib>
#include <memory>
#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../defense/CombatDataLoader.h"
#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/platform/NullWindow.h"
#include "../engine/platform/SDLWindow.h"
#include "SandboxApp.h"

// Usage: bulwark_sandbox [data.json] [--headless seconds] [--verbose]
int main(int argc, char** argv) {
    SDL_SetMainReady();

    std::string dataPath = "data/combat.json";
    double headlessSeconds = 0.0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--headless" && i + 1 < argc) {
            headlessSeconds = std::atof(argv[++i]);
        } else if (arg == "--verbose") {
            Bulwark::Logger::setMinimumLevel(Bulwark::LogLevel::Debug);
        } else {
            dataPath = arg;
        }
    }

    auto data = Defense::CombatDataLoader::loadFromFile(dataPath);
    if (!data) {
        return 1;
    }

    Sandbox::SandboxApp sandbox(std::move(*data), headlessSeconds);
    Bulwark::WindowConfig config{};
    config.title = "Bulwark Combat Sandbox";

    Bulwark::WindowPtr window;
    if (headlessSeconds > 0.0) {
        config.paceFrames = false;
        window = std::make_unique<Bulwark::NullWindow>();
    } else {
        window = std::make_unique<Bulwark::SDLWindow>();
    }

    Bulwark::Application app(sandbox, std::move(window), config);
    if (!app.initialize()) {
        return 1;
    }

    app.run();
    return 0;
}

// Three squares in one layer. Space toggles fullscreen, Escape quits.
//
//   fullscreen [config.json]

#include "draw2d/Graphics.h"
#include "draw2d/config/GraphicsConfig.h"
#include "draw2d/log/Log.h"
#include "draw2d/window/SdlWindow.h"

#include <SDL3/SDL.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cstdlib>

using namespace draw2d;

namespace {

Batch square(float size, TextureHandle texture) {
    auto vertex = [](float x, float y, float u, float v) {
        return Vertex2d{{x, y}, {u, v}, {1.0f, 1.0f, 1.0f, 1.0f}};
    };

    Batch batch;
    batch.texture = texture;
    batch.vertices = {
        vertex(-size, size, 0.0f, 0.0f),
        vertex(size, size, 1.0f, 0.0f),
        vertex(size, -size, 1.0f, 1.0f),
        vertex(-size, size, 0.0f, 0.0f),
        vertex(size, -size, 1.0f, 1.0f),
        vertex(-size, -size, 0.0f, 1.0f),
    };
    return batch;
}

// One unit per screen coordinate, origin at the window center.
glm::mat4 screenProjection(const SdlWindow& window) {
    auto [width, height] = window.size();
    const float halfWidth = static_cast<float>(width) / 2.0f;
    const float halfHeight = static_cast<float>(height) / 2.0f;
    return glm::ortho(-halfWidth, halfWidth, halfHeight, -halfHeight, -1.0f, 1.0f);
}

} // namespace

int main(int argc, char* argv[]) {
    log::install(log::resolvePriority(std::getenv("DRAW2D_LOG"), "info"));

    GraphicsConfig config;
    if (argc > 1) {
        auto loaded = GraphicsConfig::load(argv[1]);
        if (!loaded) return EXIT_FAILURE;
        config = *loaded;
        log::install(log::resolvePriority(std::getenv("DRAW2D_LOG"), config.logLevel));
    }

    SdlWindow window;
    if (!window.init(config.window.title, config.window.width, config.window.height,
                     config.window.fullscreen)) {
        return EXIT_FAILURE;
    }

    auto graphics = Graphics::create(window.handle(), config);
    if (!graphics) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create graphics");
        return EXIT_FAILURE;
    }

    TextureHandle texture;
    if (auto loaded = graphics->addTexture("assets/example.png")) {
        texture = *loaded;
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Using the white texture instead of assets/example.png");
    }

    LayerHandle world = graphics->addLayerToBottom();
    Layer* layer = graphics->getLayer(world);
    layer->setProjection(screenProjection(window));
    layer->pushBatch(square(200.0f, texture));
    layer->pushBatch(square(128.0f, TextureHandle()));
    layer->pushBatch(square(40.0f, texture));

    while (!window.shouldClose()) {
        window.pollEvents([&](const SDL_Event& event) {
            switch (event.type) {
                case SDL_EVENT_KEY_DOWN:
                    if (event.key.key == SDLK_ESCAPE) window.requestClose();
                    break;
                case SDL_EVENT_KEY_UP:
                    if (event.key.key == SDLK_SPACE) window.toggleFullscreen();
                    break;
                case SDL_EVENT_WINDOW_RESIZED:
                    graphics->getLayer(world)->setProjection(screenProjection(window));
                    break;
                default:
                    break;
            }
        });

        if (!graphics->render()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Rendering failed");
            return EXIT_FAILURE;
        }
    }

    return EXIT_SUCCESS;
}

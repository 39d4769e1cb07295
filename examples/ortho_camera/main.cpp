// Three layered squares viewed through an OrthoCamera.
// Arrow keys or WASD move the camera, the mouse wheel zooms, Escape quits.
//
//   ortho_camera [config.json]

#include "draw2d/Graphics.h"
#include "draw2d/camera/CameraControls.h"
#include "draw2d/camera/OrthoCamera.h"
#include "draw2d/config/GraphicsConfig.h"
#include "draw2d/log/Log.h"
#include "draw2d/window/SdlWindow.h"

#include <SDL3/SDL.h>
#include <cstdlib>

using namespace draw2d;

namespace {

Batch square(float size, float alpha, TextureHandle texture) {
    auto vertex = [alpha](float x, float y, float u, float v) {
        return Vertex2d{{x, y}, {u, v}, {1.0f, 1.0f, 1.0f, alpha}};
    };

    Batch batch;
    batch.texture = texture;
    batch.vertices = {
        vertex(-size, size, 0.0f, 0.0f),   // top left
        vertex(size, size, 1.0f, 0.0f),    // top right
        vertex(size, -size, 1.0f, 1.0f),   // bottom right
        vertex(-size, size, 0.0f, 0.0f),   // top left
        vertex(size, -size, 1.0f, 1.0f),   // bottom right
        vertex(-size, -size, 0.0f, 1.0f),  // bottom left
    };
    return batch;
}

} // namespace

int main(int argc, char* argv[]) {
    log::install(log::resolvePriority(std::getenv("DRAW2D_LOG"), "info"));
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION,
        "Adjust the log level by setting DRAW2D_LOG (trace, debug, info, warn, error)");

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

    auto [width, height] = window.size();
    OrthoCamera camera = OrthoCamera::withViewport(static_cast<float>(height),
                                                   static_cast<float>(width) / static_cast<float>(height));
    graphics->setProjection(camera.asMatrix());

    TextureHandle texture;
    if (auto loaded = graphics->addTexture("assets/example.png")) {
        texture = *loaded;
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Using the white texture instead of assets/example.png");
    }

    // background
    LayerHandle background = graphics->addLayerToBottom();
    graphics->getLayer(background)->pushBatch(square(200.0f, 1.0f, texture));

    // foreground
    LayerHandle foreground = graphics->addLayerToTop();
    graphics->getLayer(foreground)->pushBatch(square(128.0f, 0.5f, TextureHandle()));

    // (even more) foreground
    LayerHandle front = graphics->addLayerToTop();
    graphics->getLayer(front)->pushBatch(square(40.0f, 0.4f, texture));

    while (!window.shouldClose()) {
        window.pollEvents([&](const SDL_Event& event) {
            if (event.type == SDL_EVENT_KEY_DOWN && event.key.key == SDLK_ESCAPE) {
                window.requestClose();
            }
            if (defaultCameraControls(camera, event)) {
                graphics->setProjection(camera.asMatrix());
            }
        });

        if (!graphics->render()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Rendering failed");
            return EXIT_FAILURE;
        }
    }

    return EXIT_SUCCESS;
}

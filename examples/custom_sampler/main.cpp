// The same image drawn twice: on the left with the default repeating sampler,
// on the right with a clamp-to-border sampler. UVs run from -1 to 1 so the
// address modes are visible. Escape quits.
//
//   custom_sampler [config.json] [image]

#include "draw2d/Graphics.h"
#include "draw2d/config/GraphicsConfig.h"
#include "draw2d/log/Log.h"
#include "draw2d/vulkan/SamplerBuilder.h"
#include "draw2d/window/SdlWindow.h"

#include <SDL3/SDL.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cstdlib>
#include <string>

using namespace draw2d;

namespace {

Batch square(float centerX, float size, TextureHandle texture) {
    auto vertex = [centerX](float x, float y, float u, float v) {
        return Vertex2d{{centerX + x, y}, {u, v}, {1.0f, 1.0f, 1.0f, 1.0f}};
    };

    Batch batch;
    batch.texture = texture;
    batch.vertices = {
        vertex(-size, size, -1.0f, -1.0f),
        vertex(size, size, 1.0f, -1.0f),
        vertex(size, -size, 1.0f, 1.0f),
        vertex(-size, size, -1.0f, -1.0f),
        vertex(size, -size, 1.0f, 1.0f),
        vertex(-size, -size, -1.0f, 1.0f),
    };
    return batch;
}

// Screen-space projection with the origin at the window center and y up.
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
    const std::string imagePath = argc > 2 ? argv[2] : "assets/example.png";

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

    TextureHandle repeating;
    TextureHandle bordered;
    auto original = graphics->addTexture(imagePath);
    auto copy = graphics->addTextureCopy(imagePath);
    if (original && copy) {
        repeating = *original;
        bordered = *copy;

        auto sampler = graphics->addSampler(SamplerBuilder()
            .linear()
            .border(vk::BorderColor::eFloatOpaqueBlack)
            .mipmap());
        if (!sampler || !graphics->bindSamplerToTexture(*sampler, bordered)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to set up the border sampler");
            return EXIT_FAILURE;
        }
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Using the white texture instead of %s", imagePath.c_str());
    }

    LayerHandle world = graphics->addLayerToBottom();
    graphics->getLayer(world)->setProjection(screenProjection(window));
    graphics->getLayer(world)->pushBatch(square(-220.0f, 200.0f, repeating));
    graphics->getLayer(world)->pushBatch(square(220.0f, 200.0f, bordered));

    while (!window.shouldClose()) {
        window.pollEvents([&](const SDL_Event& event) {
            switch (event.type) {
                case SDL_EVENT_KEY_DOWN:
                    if (event.key.key == SDLK_ESCAPE) window.requestClose();
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

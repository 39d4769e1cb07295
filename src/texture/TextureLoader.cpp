#include "draw2d/texture/TextureLoader.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <SDL3/SDL_log.h>
#include <cstring>

namespace draw2d {
namespace TextureLoader {

std::optional<ImageData> loadRgba(const std::string& path) {
    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load(path.c_str(), &width, &height, &channels, STBI_rgb_alpha);

    if (!pixels) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to load texture %s: %s", path.c_str(), stbi_failure_reason());
        return std::nullopt;
    }

    ImageData image;
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.rgba.resize(static_cast<size_t>(width) * height * 4);
    std::memcpy(image.rgba.data(), pixels, image.rgba.size());
    stbi_image_free(pixels);

    return image;
}

} // namespace TextureLoader
} // namespace draw2d

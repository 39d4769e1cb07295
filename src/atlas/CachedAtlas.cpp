#include "draw2d/atlas/CachedAtlas.h"

#include <SDL3/SDL_log.h>

namespace draw2d {

std::optional<TextureHandle> CachedAtlas::addTexture(const std::filesystem::path& path) {
    std::error_code error;
    const std::filesystem::path canonical = std::filesystem::canonical(path, error);
    if (error) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Unable to resolve texture path %s: %s", path.string().c_str(), error.message().c_str());
        return std::nullopt;
    }

    auto cached = cache_.find(canonical);
    if (cached != cache_.end()) {
        return cached->second;
    }

    auto handle = atlas_->addTexture(canonical);
    if (!handle) {
        return std::nullopt;
    }
    cache_.emplace(canonical, *handle);
    return handle;
}

} // namespace draw2d

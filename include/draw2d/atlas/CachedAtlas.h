#pragma once

#include "draw2d/atlas/TextureAtlas.h"

#include <map>
#include <memory>

namespace draw2d {

/**
 * Decorates an atlas so each image file is only loaded once.
 *
 * Paths are canonicalized before lookup, so different spellings of the same
 * file share a handle. Missing files fail without reaching the atlas.
 */
class CachedAtlas : public TextureAtlas {
public:
    explicit CachedAtlas(std::unique_ptr<TextureAtlas> atlas) : atlas_(std::move(atlas)) {}

    AtlasVersion version() const override { return atlas_->version(); }

    std::vector<vk::DescriptorImageInfo> buildDescriptorImageInfos() const override {
        return atlas_->buildDescriptorImageInfos();
    }

    std::optional<SamplerHandle> addSampler(vk::raii::Sampler sampler) override {
        return atlas_->addSampler(std::move(sampler));
    }

    bool bindSamplerToTexture(SamplerHandle sampler, TextureHandle texture) override {
        return atlas_->bindSamplerToTexture(sampler, texture);
    }

    std::optional<TextureHandle> addTexture(const std::filesystem::path& path) override;

    // Always takes a new slot. The result is not cached.
    std::optional<TextureHandle> addTextureUncached(const std::filesystem::path& path) {
        return atlas_->addTexture(path);
    }

    size_t cachedTextureCount() const { return cache_.size(); }

private:
    std::unique_ptr<TextureAtlas> atlas_;
    std::map<std::filesystem::path, TextureHandle> cache_;
};

} // namespace draw2d

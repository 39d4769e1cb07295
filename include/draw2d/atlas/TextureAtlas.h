#pragma once

#include "draw2d/atlas/AtlasVersion.h"
#include "draw2d/atlas/TextureHandle.h"

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <filesystem>
#include <optional>
#include <vector>

namespace draw2d {

/**
 * A fixed array of MAX_SUPPORTED_TEXTURES texture slots, each bound with a
 * sampler, that the fragment shader indexes with TextureHandle::index().
 */
class TextureAtlas {
public:
    virtual ~TextureAtlas() = default;

    // Changes every time the descriptor contents change.
    virtual AtlasVersion version() const = 0;

    // Exactly MAX_SUPPORTED_TEXTURES entries, empty slots included.
    virtual std::vector<vk::DescriptorImageInfo> buildDescriptorImageInfos() const = 0;

    // The atlas takes ownership of the sampler.
    virtual std::optional<SamplerHandle> addSampler(vk::raii::Sampler sampler) = 0;

    // Fails when either handle does not refer to something in the atlas.
    virtual bool bindSamplerToTexture(SamplerHandle sampler, TextureHandle texture) = 0;

    virtual std::optional<TextureHandle> addTexture(const std::filesystem::path& path) = 0;
};

} // namespace draw2d

#pragma once

#include "draw2d/atlas/TextureAtlas.h"
#include "draw2d/texture/TextureImage.h"

#include <array>
#include <memory>
#include <vector>

namespace draw2d {

class VulkanContext;

/**
 * TextureAtlas backed by device-local images.
 *
 * Slot 0 is a 1x1 white texture and sampler 0 is a linear/repeat sampler,
 * so untextured geometry can use the default handles.
 */
class GpuAtlas : public TextureAtlas {
public:
    static std::unique_ptr<GpuAtlas> create(VulkanContext& context);

    ~GpuAtlas() override = default;

    GpuAtlas(const GpuAtlas&) = delete;
    GpuAtlas& operator=(const GpuAtlas&) = delete;

    AtlasVersion version() const override { return version_; }
    std::vector<vk::DescriptorImageInfo> buildDescriptorImageInfos() const override;
    std::optional<SamplerHandle> addSampler(vk::raii::Sampler sampler) override;
    bool bindSamplerToTexture(SamplerHandle sampler, TextureHandle texture) override;
    std::optional<TextureHandle> addTexture(const std::filesystem::path& path) override;

private:
    struct Slot {
        std::unique_ptr<TextureImage> image;
        SamplerHandle sampler;
    };

    explicit GpuAtlas(VulkanContext& context) : context_(context) {}

    bool init();
    std::optional<uint32_t> firstFreeSlot() const;

    VulkanContext& context_;
    AtlasVersion version_ = AtlasVersion::newOutOfDate().increment();
    std::vector<vk::raii::Sampler> samplers_;
    std::array<Slot, MAX_SUPPORTED_TEXTURES> slots_;
};

} // namespace draw2d

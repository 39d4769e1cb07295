#include "draw2d/atlas/GpuAtlas.h"
#include "draw2d/texture/TextureLoader.h"
#include "draw2d/vulkan/SamplerBuilder.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>

namespace draw2d {

std::unique_ptr<GpuAtlas> GpuAtlas::create(VulkanContext& context) {
    std::unique_ptr<GpuAtlas> atlas(new GpuAtlas(context));
    if (!atlas->init()) {
        return nullptr;
    }
    return atlas;
}

bool GpuAtlas::init() {
    auto defaultSampler = SamplerBuilder().linear().repeat().mipmap().build(context_.device());
    if (!defaultSampler) {
        return false;
    }
    context_.nameObject(**defaultSampler, "atlas default sampler");
    samplers_.push_back(std::move(*defaultSampler));

    slots_[0].image = TextureImage::createSolidColor(context_, 255, 255, 255, 255, "atlas white texture");
    if (!slots_[0].image) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create the default white texture");
        return false;
    }
    return true;
}

std::optional<uint32_t> GpuAtlas::firstFreeSlot() const {
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i].image) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<vk::DescriptorImageInfo> GpuAtlas::buildDescriptorImageInfos() const {
    const vk::ImageView defaultView = slots_[0].image->view();

    std::vector<vk::DescriptorImageInfo> infos;
    infos.reserve(slots_.size());
    for (const auto& slot : slots_) {
        const vk::ImageView view = slot.image ? slot.image->view() : defaultView;
        const SamplerHandle sampler = slot.image ? slot.sampler : SamplerHandle();
        infos.push_back(vk::DescriptorImageInfo{}
            .setSampler(*samplers_[sampler.index()])
            .setImageView(view)
            .setImageLayout(vk::ImageLayout::eShaderReadOnlyOptimal));
    }
    return infos;
}

std::optional<SamplerHandle> GpuAtlas::addSampler(vk::raii::Sampler sampler) {
    samplers_.push_back(std::move(sampler));
    return SamplerHandle(static_cast<uint32_t>(samplers_.size() - 1));
}

bool GpuAtlas::bindSamplerToTexture(SamplerHandle sampler, TextureHandle texture) {
    if (sampler.index() >= samplers_.size()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown sampler handle %u", sampler.index());
        return false;
    }
    if (texture.index() >= slots_.size() || !slots_[texture.index()].image) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Cannot bind a sampler to empty texture slot %u", texture.index());
        return false;
    }
    slots_[texture.index()].sampler = sampler;
    version_ = version_.increment();
    return true;
}

std::optional<TextureHandle> GpuAtlas::addTexture(const std::filesystem::path& path) {
    auto slot = firstFreeSlot();
    if (!slot) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "No texture slots left (max %u), cannot add %s",
            MAX_SUPPORTED_TEXTURES, path.string().c_str());
        return std::nullopt;
    }

    auto image = TextureLoader::loadRgba(path.string());
    if (!image) {
        return std::nullopt;
    }

    auto texture = TextureImage::create(context_,
        MipChain::build(image->rgba.data(), image->width, image->height),
        path.filename().string());
    if (!texture) {
        return std::nullopt;
    }

    slots_[*slot].image = std::move(texture);
    slots_[*slot].sampler = SamplerHandle();
    version_ = version_.increment();
    return TextureHandle(*slot);
}

} // namespace draw2d

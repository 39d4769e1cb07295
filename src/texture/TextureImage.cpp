#include "draw2d/texture/TextureImage.h"
#include "draw2d/vulkan/CpuBuffer.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>
#include <vector>

namespace draw2d {

namespace {

constexpr vk::Format TEXTURE_FORMAT = vk::Format::eR8G8B8A8Srgb;

vk::ImageSubresourceRange allLevels(uint32_t mipLevels) {
    return vk::ImageSubresourceRange{}
        .setAspectMask(vk::ImageAspectFlagBits::eColor)
        .setBaseMipLevel(0)
        .setLevelCount(mipLevels)
        .setBaseArrayLayer(0)
        .setLayerCount(1);
}

} // namespace

std::unique_ptr<TextureImage> TextureImage::create(VulkanContext& context,
                                                   const MipChain& mips,
                                                   const std::string& name) {
    std::unique_ptr<TextureImage> texture(new TextureImage(context));
    if (!texture->upload(mips, name)) {
        return nullptr;
    }
    return texture;
}

std::unique_ptr<TextureImage> TextureImage::createSolidColor(VulkanContext& context,
                                                             uint8_t r, uint8_t g, uint8_t b, uint8_t a,
                                                             const std::string& name) {
    const uint8_t pixel[4] = {r, g, b, a};
    return create(context, MipChain::build(pixel, 1, 1), name);
}

TextureImage::~TextureImage() {
    view_.reset();
    image_.reset();
    if (!allocation_.isNull() && !context_.freeMemory(allocation_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to free texture memory");
    }
}

bool TextureImage::upload(const MipChain& mips, const std::string& name) {
    const MipLevel& base = mips.levels().front();
    width_ = base.width;
    height_ = base.height;
    mipLevels_ = mips.levelCount();

    try {
        image_.emplace(context_.device(), vk::ImageCreateInfo{}
            .setImageType(vk::ImageType::e2D)
            .setFormat(TEXTURE_FORMAT)
            .setExtent(vk::Extent3D{width_, height_, 1})
            .setMipLevels(mipLevels_)
            .setArrayLayers(1)
            .setSamples(vk::SampleCountFlagBits::e1)
            .setTiling(vk::ImageTiling::eOptimal)
            .setUsage(vk::ImageUsageFlagBits::eTransferDst | vk::ImageUsageFlagBits::eSampled)
            .setSharingMode(vk::SharingMode::eExclusive)
            .setInitialLayout(vk::ImageLayout::eUndefined));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create image for %s: %s", name.c_str(), e.what());
        return false;
    }

    auto allocation = context_.allocateMemory(image_->getMemoryRequirements(),
                                              vk::MemoryPropertyFlagBits::eDeviceLocal);
    if (!allocation) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to allocate image memory for %s", name.c_str());
        return false;
    }
    allocation_ = *allocation;

    try {
        image_->bindMemory(allocation_.memory, allocation_.offset);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to bind image memory for %s: %s", name.c_str(), e.what());
        return false;
    }
    context_.nameObject(image(), name);

    // Stage every mip level at once
    CpuBuffer staging(context_, vk::BufferUsageFlagBits::eTransferSrc, name + " staging");
    if (!staging.write(mips.data().data(), mips.data().size())) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to fill staging buffer for %s", name.c_str());
        return false;
    }

    std::vector<vk::BufferImageCopy> regions;
    regions.reserve(mipLevels_);
    for (uint32_t i = 0; i < mipLevels_; ++i) {
        const MipLevel& level = mips.levels()[i];
        regions.push_back(vk::BufferImageCopy{}
            .setBufferOffset(level.offset)
            .setBufferRowLength(0)
            .setBufferImageHeight(0)
            .setImageSubresource(vk::ImageSubresourceLayers{}
                .setAspectMask(vk::ImageAspectFlagBits::eColor)
                .setMipLevel(i)
                .setBaseArrayLayer(0)
                .setLayerCount(1))
            .setImageOffset(vk::Offset3D{0, 0, 0})
            .setImageExtent(vk::Extent3D{level.width, level.height, 1}));
    }

    const vk::Image target = image();
    const vk::Buffer source = staging.buffer();
    const bool submitted = context_.submitAndWaitIdle([&](vk::CommandBuffer cmd) {
        auto toTransfer = vk::ImageMemoryBarrier{}
            .setSrcAccessMask({})
            .setDstAccessMask(vk::AccessFlagBits::eTransferWrite)
            .setOldLayout(vk::ImageLayout::eUndefined)
            .setNewLayout(vk::ImageLayout::eTransferDstOptimal)
            .setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
            .setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
            .setImage(target)
            .setSubresourceRange(allLevels(mipLevels_));
        cmd.pipelineBarrier(
            vk::PipelineStageFlagBits::eTopOfPipe,
            vk::PipelineStageFlagBits::eTransfer,
            {}, {}, {}, toTransfer);

        cmd.copyBufferToImage(source, target, vk::ImageLayout::eTransferDstOptimal, regions);

        auto toShaderRead = vk::ImageMemoryBarrier{}
            .setSrcAccessMask(vk::AccessFlagBits::eTransferWrite)
            .setDstAccessMask(vk::AccessFlagBits::eShaderRead)
            .setOldLayout(vk::ImageLayout::eTransferDstOptimal)
            .setNewLayout(vk::ImageLayout::eShaderReadOnlyOptimal)
            .setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
            .setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
            .setImage(target)
            .setSubresourceRange(allLevels(mipLevels_));
        cmd.pipelineBarrier(
            vk::PipelineStageFlagBits::eTransfer,
            vk::PipelineStageFlagBits::eFragmentShader,
            {}, {}, {}, toShaderRead);
    });
    if (!submitted) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to upload texture %s", name.c_str());
        return false;
    }

    try {
        view_.emplace(context_.device(), vk::ImageViewCreateInfo{}
            .setImage(target)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(TEXTURE_FORMAT)
            .setSubresourceRange(allLevels(mipLevels_)));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create image view for %s: %s", name.c_str(), e.what());
        return false;
    }
    context_.nameObject(view(), name + " view");

    SDL_Log("Loaded texture with %u mip levels: %s (%ux%u)", mipLevels_, name.c_str(), width_, height_);
    return true;
}

} // namespace draw2d

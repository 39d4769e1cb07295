#pragma once

#include "draw2d/alloc/Allocation.h"
#include "draw2d/texture/MipChain.h"

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <memory>
#include <optional>
#include <string>

namespace draw2d {

class VulkanContext;

// Device-local sRGB texture with a full mip chain, ready for sampling.
class TextureImage {
public:
    static std::unique_ptr<TextureImage> create(VulkanContext& context,
                                                const MipChain& mips,
                                                const std::string& name);

    static std::unique_ptr<TextureImage> createSolidColor(VulkanContext& context,
                                                          uint8_t r, uint8_t g, uint8_t b, uint8_t a,
                                                          const std::string& name);

    ~TextureImage();

    TextureImage(const TextureImage&) = delete;
    TextureImage& operator=(const TextureImage&) = delete;

    vk::Image image() const { return **image_; }
    vk::ImageView view() const { return **view_; }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    uint32_t mipLevels() const { return mipLevels_; }

private:
    explicit TextureImage(VulkanContext& context) : context_(context) {}

    bool upload(const MipChain& mips, const std::string& name);

    VulkanContext& context_;
    std::optional<vk::raii::Image> image_;
    std::optional<vk::raii::ImageView> view_;
    alloc::Allocation allocation_;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    uint32_t mipLevels_ = 0;
};

} // namespace draw2d

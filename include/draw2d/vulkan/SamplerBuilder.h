#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <SDL3/SDL_log.h>
#include <optional>

namespace draw2d {

// ============================================================================
// Sampler Builder - Fluent API for creating samplers
// ============================================================================

class SamplerBuilder {
public:
    SamplerBuilder() = default;

    SamplerBuilder& nearest() {
        info_.setMagFilter(vk::Filter::eNearest)
             .setMinFilter(vk::Filter::eNearest)
             .setMipmapMode(vk::SamplerMipmapMode::eNearest);
        return *this;
    }

    SamplerBuilder& linear() {
        info_.setMagFilter(vk::Filter::eLinear)
             .setMinFilter(vk::Filter::eLinear)
             .setMipmapMode(vk::SamplerMipmapMode::eLinear);
        return *this;
    }

    SamplerBuilder& clamp() {
        info_.setAddressModeU(vk::SamplerAddressMode::eClampToEdge)
             .setAddressModeV(vk::SamplerAddressMode::eClampToEdge)
             .setAddressModeW(vk::SamplerAddressMode::eClampToEdge);
        return *this;
    }

    SamplerBuilder& repeat() {
        info_.setAddressModeU(vk::SamplerAddressMode::eRepeat)
             .setAddressModeV(vk::SamplerAddressMode::eRepeat)
             .setAddressModeW(vk::SamplerAddressMode::eRepeat);
        return *this;
    }

    SamplerBuilder& border(vk::BorderColor color = vk::BorderColor::eFloatTransparentBlack) {
        info_.setAddressModeU(vk::SamplerAddressMode::eClampToBorder)
             .setAddressModeV(vk::SamplerAddressMode::eClampToBorder)
             .setAddressModeW(vk::SamplerAddressMode::eClampToBorder)
             .setBorderColor(color);
        return *this;
    }

    SamplerBuilder& noMip() {
        info_.setMinLod(0.0f).setMaxLod(0.0f);
        return *this;
    }

    SamplerBuilder& mipmap(float maxLod = VK_LOD_CLAMP_NONE) {
        info_.setMinLod(0.0f).setMaxLod(maxLod);
        return *this;
    }

    const vk::SamplerCreateInfo& createInfo() const { return info_; }

    std::optional<vk::raii::Sampler> build(const vk::raii::Device& device) const {
        try {
            return vk::raii::Sampler(device, info_);
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create sampler: %s", e.what());
            return std::nullopt;
        }
    }

private:
    vk::SamplerCreateInfo info_{};
};

} // namespace draw2d

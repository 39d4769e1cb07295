#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>

namespace draw2d {

class VulkanContext;

struct FrameSync {
    std::optional<vk::raii::Semaphore> imageAvailable;
    std::optional<vk::raii::Semaphore> renderFinished;
    // Reset right before each submit, signaled when that submission completes.
    std::optional<vk::raii::Fence> graphicsFinished;

    bool create(VulkanContext& context, uint32_t frameIndex);
};

} // namespace draw2d

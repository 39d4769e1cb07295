#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <vector>

namespace draw2d {

class VulkanContext;

/**
 * Transient command pool that is reset wholesale once per frame.
 *
 * Command buffers are recycled after reset() instead of being freed.
 */
class TransientCommandPool {
public:
    explicit TransientCommandPool(VulkanContext& context) : context_(context) {}

    TransientCommandPool(const TransientCommandPool&) = delete;
    TransientCommandPool& operator=(const TransientCommandPool&) = delete;

    bool create(const char* name);

    bool reset();

    // Primary command buffer, valid until the next reset().
    std::optional<vk::CommandBuffer> requestCommandBuffer();

private:
    VulkanContext& context_;
    std::optional<vk::raii::CommandPool> pool_;
    std::vector<vk::raii::CommandBuffer> buffers_;
    size_t nextBuffer_ = 0;
};

} // namespace draw2d

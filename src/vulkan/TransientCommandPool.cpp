#include "draw2d/vulkan/TransientCommandPool.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>

namespace draw2d {

bool TransientCommandPool::create(const char* name) {
    try {
        pool_.emplace(context_.device(), vk::CommandPoolCreateInfo{}
            .setFlags(vk::CommandPoolCreateFlagBits::eTransient)
            .setQueueFamilyIndex(context_.graphicsQueueFamily()));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create command pool %s: %s", name, e.what());
        return false;
    }
    context_.nameObject(**pool_, name);
    return true;
}

bool TransientCommandPool::reset() {
    try {
        pool_->reset();
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to reset command pool: %s", e.what());
        return false;
    }
    nextBuffer_ = 0;
    return true;
}

std::optional<vk::CommandBuffer> TransientCommandPool::requestCommandBuffer() {
    if (nextBuffer_ < buffers_.size()) {
        return *buffers_[nextBuffer_++];
    }

    try {
        vk::raii::CommandBuffers allocated(context_.device(), vk::CommandBufferAllocateInfo{}
            .setCommandPool(**pool_)
            .setLevel(vk::CommandBufferLevel::ePrimary)
            .setCommandBufferCount(1));
        buffers_.push_back(std::move(allocated[0]));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to allocate command buffer: %s", e.what());
        return std::nullopt;
    }
    nextBuffer_ = buffers_.size();
    return *buffers_.back();
}

} // namespace draw2d

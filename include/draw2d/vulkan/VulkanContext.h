#pragma once

#include "draw2d/alloc/DeviceAllocator.h"
#include "draw2d/alloc/StandardAllocator.h"

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vk_mem_alloc.h>
#include <VkBootstrap.h>
#include <SDL3/SDL.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace draw2d {

struct VulkanContextSettings {
    std::string applicationName = "draw2d";
    bool enableValidation = true;
    alloc::StandardAllocatorSettings allocator;
};

/**
 * VulkanContext owns the device-level Vulkan state:
 * - Instance, debug messenger and window surface
 * - Physical device selection and logical device
 * - Graphics and present queues
 * - VMA allocator and the device memory allocator stack
 * - A command pool for blocking one-shot submissions
 */
class VulkanContext {
public:
    VulkanContext() = default;
    ~VulkanContext();

    // Non-copyable
    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;

    bool init(SDL_Window* window, const VulkanContextSettings& settings);
    void shutdown();

    void waitIdle();

    const vk::raii::Device& device() const { return *raiiDevice_; }
    vk::PhysicalDevice physicalDevice() const { return physicalDevice_; }
    vk::Instance instance() const { return instance_; }
    VkSurfaceKHR surface() const { return surface_; }
    vk::Queue graphicsQueue() const { return graphicsQueue_; }
    vk::Queue presentQueue() const { return presentQueue_; }
    uint32_t graphicsQueueFamily() const;
    VmaAllocator vma() const { return vma_; }
    const vkb::Device& vkbDevice() const { return vkbDevice_; }
    SDL_Window* window() const { return window_; }

    std::optional<uint32_t> findMemoryTypeIndex(uint32_t memoryTypeBits,
                                                vk::MemoryPropertyFlags properties) const;

    // Allocate through the allocator stack. Thread safe.
    std::optional<alloc::Allocation> allocateMemory(const vk::MemoryRequirements& requirements,
                                                    vk::MemoryPropertyFlags properties);
    bool freeMemory(const alloc::Allocation& allocation);

    // Host pointer to the first byte of the allocation. Memory must be host visible.
    void* mapMemory(const alloc::Allocation& allocation);
    void unmapMemory(const alloc::Allocation& allocation);

    // Attach a debug name to a handle. Does nothing without debug utils.
    void nameObject(vk::ObjectType type, uint64_t handle, const std::string& name) const;

    template <typename Handle>
    void nameObject(const Handle& handle, const std::string& name) const {
        using CType = typename Handle::CType;
        nameObject(Handle::objectType,
                   reinterpret_cast<uint64_t>(static_cast<CType>(handle)), name);
    }

    // Record commands into a one-shot buffer, submit and block until the
    // graphics queue is idle.
    bool submitAndWaitIdle(const std::function<void(vk::CommandBuffer)>& record);

private:
    bool createInstance(const VulkanContextSettings& settings);
    bool createSurface();
    bool selectPhysicalDevice();
    bool createLogicalDevice();
    bool createAllocator(const VulkanContextSettings& settings);
    bool createUploadPool();

    SDL_Window* window_ = nullptr;

    vkb::Instance vkbInstance_;
    vkb::PhysicalDevice vkbPhysicalDevice_;
    vkb::Device vkbDevice_;

    VkInstance instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    VkQueue graphicsQueue_ = VK_NULL_HANDLE;
    VkQueue presentQueue_ = VK_NULL_HANDLE;
    bool debugUtils_ = false;

    VmaAllocator vma_ = VK_NULL_HANDLE;
    VkPhysicalDeviceMemoryProperties memoryProperties_{};
    VkDeviceSize bufferImageGranularity_ = 1;

    std::mutex allocatorMutex_;
    std::unique_ptr<alloc::DeviceAllocator> deviceAllocator_;

    // vulkan-hpp RAII wrappers (take ownership of the vkb-created handles)
    vk::raii::Context raiiContext_;
    std::unique_ptr<vk::raii::Instance> raiiInstance_;
    std::unique_ptr<vk::raii::PhysicalDevice> raiiPhysicalDevice_;
    std::unique_ptr<vk::raii::Device> raiiDevice_;
    std::optional<vk::raii::CommandPool> uploadPool_;
};

} // namespace draw2d

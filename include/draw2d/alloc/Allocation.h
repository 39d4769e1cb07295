#pragma once

#include <vulkan/vulkan.h>
#include <vk_mem_alloc.h>
#include <cstdint>

namespace draw2d {
namespace alloc {

struct AllocationRequest {
    VkDeviceSize size = 0;
    VkDeviceSize alignment = 1;
    uint32_t memoryTypeIndex = 0;
};

/**
 * A range of device memory handed out by a DeviceAllocator.
 *
 * `backing` is the VMA allocation that owns `memory`. It starts at
 * `backingOffset` inside `memory`, which is what mapping needs to find the
 * host pointer for `offset`.
 */
struct Allocation {
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkDeviceSize offset = 0;
    VkDeviceSize byteSize = 0;
    uint32_t memoryTypeIndex = 0;

    VmaAllocation backing = VK_NULL_HANDLE;
    VkDeviceSize backingOffset = 0;

    static Allocation null() { return Allocation{}; }
    bool isNull() const { return memory == VK_NULL_HANDLE; }
};

} // namespace alloc
} // namespace draw2d

#pragma once

#include "draw2d/alloc/DeviceAllocator.h"
#include "draw2d/alloc/MemUnit.h"

#include <vk_mem_alloc.h>
#include <memory>

namespace draw2d {
namespace alloc {

struct StandardAllocatorSettings {
    VkDeviceSize blockSize = toBytes(MemUnit::MiB, 64);
    VkDeviceSize pageSize = 256;
    VkDeviceSize largeThreshold = toBytes(MemUnit::MiB, 16);
    bool report = true;
    // Debug only: force every allocation to a non-zero offset.
    bool forceOffsets = false;
};

/**
 * Build the allocator stack used by the renderer:
 *
 *   Metrics
 *     TypeIndex (one per memory type)
 *       SizeSelector
 *         < largeThreshold : Page(Pool(shared passthrough))
 *         otherwise        : Page(shared passthrough)
 */
std::unique_ptr<DeviceAllocator> buildStandardAllocator(
    const VkPhysicalDeviceMemoryProperties& memoryProperties,
    VmaAllocator vma,
    const StandardAllocatorSettings& settings);

} // namespace alloc
} // namespace draw2d

#include "draw2d/alloc/PassthroughAllocator.h"

#include <SDL3/SDL_log.h>

namespace draw2d {
namespace alloc {

std::optional<Allocation> PassthroughAllocator::allocate(const AllocationRequest& request) {
    if (request.size == 0) {
        return Allocation::null();
    }

    VkMemoryRequirements requirements{};
    requirements.size = request.size;
    requirements.alignment = request.alignment;
    requirements.memoryTypeBits = 1u << request.memoryTypeIndex;

    VmaAllocationCreateInfo createInfo{};
    createInfo.flags = VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;
    createInfo.memoryTypeBits = requirements.memoryTypeBits;

    VmaAllocation vmaAllocation = VK_NULL_HANDLE;
    VmaAllocationInfo info{};
    VkResult result = vmaAllocateMemory(vma_, &requirements, &createInfo, &vmaAllocation, &info);
    if (result != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "PassthroughAllocator: failed to allocate %llu bytes of memory type %u (VkResult %d)",
            static_cast<unsigned long long>(request.size), request.memoryTypeIndex, result);
        return std::nullopt;
    }

    Allocation allocation;
    allocation.memory = info.deviceMemory;
    allocation.offset = info.offset;
    allocation.byteSize = request.size;
    allocation.memoryTypeIndex = request.memoryTypeIndex;
    allocation.backing = vmaAllocation;
    allocation.backingOffset = info.offset;
    return allocation;
}

bool PassthroughAllocator::free(const Allocation& allocation) {
    if (allocation.isNull()) {
        return true;
    }
    if (allocation.backing == VK_NULL_HANDLE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "PassthroughAllocator: allocation has no backing VMA allocation");
        return false;
    }
    vmaFreeMemory(vma_, allocation.backing);
    return true;
}

bool PassthroughAllocator::managedByMe(const Allocation& allocation) const {
    return allocation.backing != VK_NULL_HANDLE;
}

} // namespace alloc
} // namespace draw2d

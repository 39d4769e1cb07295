#include "draw2d/alloc/TypeIndexAllocator.h"

#include <SDL3/SDL_log.h>

namespace draw2d {
namespace alloc {

TypeIndexAllocator::TypeIndexAllocator(const VkPhysicalDeviceMemoryProperties& properties,
                                       const Factory& factory) {
    allocators_.reserve(properties.memoryTypeCount);
    for (uint32_t i = 0; i < properties.memoryTypeCount; ++i) {
        allocators_.push_back(factory(i, properties.memoryTypes[i]));
    }
}

DeviceAllocator* TypeIndexAllocator::forType(uint32_t memoryTypeIndex) const {
    if (memoryTypeIndex >= allocators_.size()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "TypeIndexAllocator: unknown memory type index %u", memoryTypeIndex);
        return nullptr;
    }
    return allocators_[memoryTypeIndex].get();
}

std::optional<Allocation> TypeIndexAllocator::allocate(const AllocationRequest& request) {
    DeviceAllocator* allocator = forType(request.memoryTypeIndex);
    if (!allocator) {
        return std::nullopt;
    }
    return allocator->allocate(request);
}

bool TypeIndexAllocator::free(const Allocation& allocation) {
    if (allocation.isNull()) {
        return true;
    }
    DeviceAllocator* allocator = forType(allocation.memoryTypeIndex);
    return allocator && allocator->free(allocation);
}

bool TypeIndexAllocator::managedByMe(const Allocation& allocation) const {
    if (allocation.memoryTypeIndex >= allocators_.size()) {
        return false;
    }
    return allocators_[allocation.memoryTypeIndex]->managedByMe(allocation);
}

} // namespace alloc
} // namespace draw2d

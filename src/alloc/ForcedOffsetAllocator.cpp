#include "draw2d/alloc/ForcedOffsetAllocator.h"

namespace draw2d {
namespace alloc {

ForcedOffsetAllocator::ForcedOffsetAllocator(std::unique_ptr<DeviceAllocator> allocator,
                                             VkDeviceSize alignment)
    : allocator_(std::move(allocator))
    , alignment_(alignment) {}

std::optional<Allocation> ForcedOffsetAllocator::allocate(const AllocationRequest& request) {
    AllocationRequest expanded = request;
    expanded.size = request.size + padding();

    auto allocation = allocator_->allocate(expanded);
    if (!allocation) {
        return std::nullopt;
    }
    allocation->offset += padding();
    allocation->byteSize = request.size;
    return allocation;
}

bool ForcedOffsetAllocator::free(const Allocation& allocation) {
    if (allocation.isNull()) {
        return true;
    }
    Allocation adjusted = allocation;
    adjusted.offset -= padding();
    adjusted.byteSize += padding();
    return allocator_->free(adjusted);
}

bool ForcedOffsetAllocator::managedByMe(const Allocation& allocation) const {
    return allocator_->managedByMe(allocation);
}

} // namespace alloc
} // namespace draw2d

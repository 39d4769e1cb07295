#include "draw2d/alloc/PageAllocator.h"

namespace draw2d {
namespace alloc {

PageAllocator::PageAllocator(std::unique_ptr<DeviceAllocator> allocator, VkDeviceSize pageSize)
    : allocator_(std::move(allocator))
    , pageSize_(pageSize == 0 ? 1 : pageSize) {}

VkDeviceSize PageAllocator::roundUpToPage(VkDeviceSize size) const {
    const VkDeviceSize pages = (size + pageSize_ - 1) / pageSize_;
    return pages * pageSize_;
}

std::optional<Allocation> PageAllocator::allocate(const AllocationRequest& request) {
    AllocationRequest paged = request;
    paged.size = roundUpToPage(request.size);

    auto allocation = allocator_->allocate(paged);
    if (!allocation) {
        return std::nullopt;
    }
    allocation->byteSize = request.size;
    return allocation;
}

bool PageAllocator::free(const Allocation& allocation) {
    if (allocation.isNull()) {
        return true;
    }
    Allocation paged = allocation;
    paged.byteSize = roundUpToPage(allocation.byteSize);
    return allocator_->free(paged);
}

bool PageAllocator::managedByMe(const Allocation& allocation) const {
    return allocator_->managedByMe(allocation);
}

} // namespace alloc
} // namespace draw2d

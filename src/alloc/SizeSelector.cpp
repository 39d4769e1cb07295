#include "draw2d/alloc/SizeSelector.h"

namespace draw2d {
namespace alloc {

SizeSelector::SizeSelector(std::unique_ptr<DeviceAllocator> small,
                           VkDeviceSize threshold,
                           std::unique_ptr<DeviceAllocator> large)
    : small_(std::move(small))
    , threshold_(threshold)
    , large_(std::move(large)) {}

DeviceAllocator& SizeSelector::select(VkDeviceSize size) const {
    if (size < threshold_) {
        return *small_;
    }
    return *large_;
}

std::optional<Allocation> SizeSelector::allocate(const AllocationRequest& request) {
    return select(request.size).allocate(request);
}

bool SizeSelector::free(const Allocation& allocation) {
    if (allocation.isNull()) {
        return true;
    }
    return select(allocation.byteSize).free(allocation);
}

bool SizeSelector::managedByMe(const Allocation& allocation) const {
    return select(allocation.byteSize).managedByMe(allocation);
}

} // namespace alloc
} // namespace draw2d

#pragma once

#include "draw2d/alloc/DeviceAllocator.h"

#include <memory>

namespace draw2d {
namespace alloc {

// Routes requests below `threshold` to the small allocator and the rest to the large one.
class SizeSelector : public DeviceAllocator {
public:
    SizeSelector(std::unique_ptr<DeviceAllocator> small,
                 VkDeviceSize threshold,
                 std::unique_ptr<DeviceAllocator> large);

    std::optional<Allocation> allocate(const AllocationRequest& request) override;
    bool free(const Allocation& allocation) override;
    bool managedByMe(const Allocation& allocation) const override;

private:
    DeviceAllocator& select(VkDeviceSize size) const;

    std::unique_ptr<DeviceAllocator> small_;
    VkDeviceSize threshold_;
    std::unique_ptr<DeviceAllocator> large_;
};

} // namespace alloc
} // namespace draw2d

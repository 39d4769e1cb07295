#pragma once

#include "draw2d/alloc/DeviceAllocator.h"

#include <memory>

namespace draw2d {
namespace alloc {

/**
 * Debugging aid: pads every request so the returned offset is never zero.
 *
 * The child is asked for `size + alignment * 100` bytes and the allocation
 * handed back starts at `alignment * 100`. Code that ignores
 * Allocation::offset breaks immediately under this allocator.
 */
class ForcedOffsetAllocator : public DeviceAllocator {
public:
    ForcedOffsetAllocator(std::unique_ptr<DeviceAllocator> allocator, VkDeviceSize alignment);

    std::optional<Allocation> allocate(const AllocationRequest& request) override;
    bool free(const Allocation& allocation) override;
    bool managedByMe(const Allocation& allocation) const override;

private:
    VkDeviceSize padding() const { return alignment_ * 100; }

    std::unique_ptr<DeviceAllocator> allocator_;
    VkDeviceSize alignment_;
};

} // namespace alloc
} // namespace draw2d

#pragma once

#include "draw2d/alloc/DeviceAllocator.h"

#include <memory>

namespace draw2d {
namespace alloc {

/**
 * Rounds every request up to a whole number of pages before forwarding it.
 *
 * The caller still sees the size it asked for. The size is rounded again on
 * free so the child receives the same size it handed out.
 */
class PageAllocator : public DeviceAllocator {
public:
    PageAllocator(std::unique_ptr<DeviceAllocator> allocator, VkDeviceSize pageSize);

    std::optional<Allocation> allocate(const AllocationRequest& request) override;
    bool free(const Allocation& allocation) override;
    bool managedByMe(const Allocation& allocation) const override;

    VkDeviceSize roundUpToPage(VkDeviceSize size) const;
    VkDeviceSize pageSize() const { return pageSize_; }

private:
    std::unique_ptr<DeviceAllocator> allocator_;
    VkDeviceSize pageSize_;
};

} // namespace alloc
} // namespace draw2d

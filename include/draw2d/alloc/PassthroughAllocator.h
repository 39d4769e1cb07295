#pragma once

#include "draw2d/alloc/DeviceAllocator.h"

#include <vk_mem_alloc.h>

namespace draw2d {
namespace alloc {

// Every request becomes its own dedicated VMA block.
class PassthroughAllocator : public DeviceAllocator {
public:
    explicit PassthroughAllocator(VmaAllocator vma) : vma_(vma) {}

    PassthroughAllocator(const PassthroughAllocator&) = delete;
    PassthroughAllocator& operator=(const PassthroughAllocator&) = delete;

    std::optional<Allocation> allocate(const AllocationRequest& request) override;
    bool free(const Allocation& allocation) override;
    bool managedByMe(const Allocation& allocation) const override;

private:
    VmaAllocator vma_ = VK_NULL_HANDLE;
};

} // namespace alloc
} // namespace draw2d

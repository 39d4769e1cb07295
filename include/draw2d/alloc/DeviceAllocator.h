#pragma once

#include "draw2d/alloc/Allocation.h"

#include <optional>

namespace draw2d {
namespace alloc {

/**
 * Interface for everything that hands out device memory.
 *
 * Allocators compose: most implementations decorate or route to a child
 * allocator, and only PassthroughAllocator talks to the driver.
 */
class DeviceAllocator {
public:
    virtual ~DeviceAllocator() = default;

    virtual std::optional<Allocation> allocate(const AllocationRequest& request) = 0;

    // Returns false (and logs) when the allocation was not valid for this allocator.
    virtual bool free(const Allocation& allocation) = 0;

    virtual bool managedByMe(const Allocation& allocation) const = 0;
};

} // namespace alloc
} // namespace draw2d

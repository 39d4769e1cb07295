#pragma once

#include "draw2d/alloc/DeviceAllocator.h"

#include <memory>

namespace draw2d {
namespace alloc {

// Lets several allocator stacks share one child.
class SharedRefAllocator : public DeviceAllocator {
public:
    explicit SharedRefAllocator(std::shared_ptr<DeviceAllocator> allocator)
        : allocator_(std::move(allocator)) {}

    std::optional<Allocation> allocate(const AllocationRequest& request) override {
        return allocator_->allocate(request);
    }

    bool free(const Allocation& allocation) override {
        return allocator_->free(allocation);
    }

    bool managedByMe(const Allocation& allocation) const override {
        return allocator_->managedByMe(allocation);
    }

private:
    std::shared_ptr<DeviceAllocator> allocator_;
};

} // namespace alloc
} // namespace draw2d

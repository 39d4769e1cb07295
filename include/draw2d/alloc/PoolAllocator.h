#pragma once

#include "draw2d/alloc/DeviceAllocator.h"
#include "draw2d/alloc/Suballocator.h"

#include <memory>
#include <vector>

namespace draw2d {
namespace alloc {

/**
 * Carves requests out of fixed-size blocks taken from a child allocator.
 *
 * A block goes back to the child as soon as its last allocation is freed.
 * Requests bigger than a block are refused, so pair this with a
 * SizeSelector that sends large requests elsewhere.
 */
class PoolAllocator : public DeviceAllocator {
public:
    PoolAllocator(std::unique_ptr<DeviceAllocator> allocator, VkDeviceSize blockSize);
    ~PoolAllocator() override;

    PoolAllocator(const PoolAllocator&) = delete;
    PoolAllocator& operator=(const PoolAllocator&) = delete;

    std::optional<Allocation> allocate(const AllocationRequest& request) override;
    bool free(const Allocation& allocation) override;
    bool managedByMe(const Allocation& allocation) const override;

    size_t blockCount() const { return blocks_.size(); }
    VkDeviceSize blockSize() const { return blockSize_; }

private:
    struct Block {
        Allocation allocation;
        Suballocator suballocator;
    };

    Allocation toAllocation(const Block& block, const Region& region) const;

    std::unique_ptr<DeviceAllocator> allocator_;
    VkDeviceSize blockSize_;
    std::vector<Block> blocks_;
};

} // namespace alloc
} // namespace draw2d

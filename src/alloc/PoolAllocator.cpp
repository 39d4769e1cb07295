#include "draw2d/alloc/PoolAllocator.h"

#include <SDL3/SDL_log.h>

namespace draw2d {
namespace alloc {

PoolAllocator::PoolAllocator(std::unique_ptr<DeviceAllocator> allocator, VkDeviceSize blockSize)
    : allocator_(std::move(allocator))
    , blockSize_(blockSize) {}

PoolAllocator::~PoolAllocator() {
    for (const auto& block : blocks_) {
        if (!block.suballocator.isEmpty()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "PoolAllocator: releasing block of memory type %u with live allocations",
                block.allocation.memoryTypeIndex);
        }
        if (!allocator_->free(block.allocation)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PoolAllocator: failed to release block");
        }
    }
}

Allocation PoolAllocator::toAllocation(const Block& block, const Region& region) const {
    Allocation allocation = block.allocation;
    allocation.offset = region.offset;
    allocation.byteSize = region.size;
    return allocation;
}

std::optional<Allocation> PoolAllocator::allocate(const AllocationRequest& request) {
    if (request.size > blockSize_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "PoolAllocator: request of %llu bytes exceeds the block size of %llu bytes",
            static_cast<unsigned long long>(request.size),
            static_cast<unsigned long long>(blockSize_));
        return std::nullopt;
    }
    if (request.size == 0) {
        return Allocation::null();
    }

    for (auto& block : blocks_) {
        if (auto region = block.suballocator.allocate(request.size, request.alignment)) {
            return toAllocation(block, *region);
        }
    }

    AllocationRequest blockRequest;
    blockRequest.size = blockSize_;
    blockRequest.alignment = request.alignment;
    blockRequest.memoryTypeIndex = request.memoryTypeIndex;

    auto blockAllocation = allocator_->allocate(blockRequest);
    if (!blockAllocation) {
        return std::nullopt;
    }

    Block block{*blockAllocation, Suballocator(Region(blockAllocation->offset, blockSize_))};
    auto region = block.suballocator.allocate(request.size, request.alignment);
    if (!region) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "PoolAllocator: fresh block cannot satisfy request of %llu bytes",
            static_cast<unsigned long long>(request.size));
        if (!allocator_->free(*blockAllocation)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PoolAllocator: failed to release block");
        }
        return std::nullopt;
    }

    blocks_.push_back(std::move(block));
    return toAllocation(blocks_.back(), *region);
}

bool PoolAllocator::free(const Allocation& allocation) {
    if (allocation.isNull()) {
        return true;
    }

    for (auto it = blocks_.begin(); it != blocks_.end(); ++it) {
        if (it->allocation.memory != allocation.memory) {
            continue;
        }
        if (!it->suballocator.free(Region(allocation.offset, allocation.byteSize))) {
            return false;
        }
        if (it->suballocator.isEmpty()) {
            const Allocation blockAllocation = it->allocation;
            blocks_.erase(it);
            return allocator_->free(blockAllocation);
        }
        return true;
    }

    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
        "PoolAllocator: this pool did not allocate that memory (offset %llu, %llu bytes)",
        static_cast<unsigned long long>(allocation.offset),
        static_cast<unsigned long long>(allocation.byteSize));
    return false;
}

bool PoolAllocator::managedByMe(const Allocation& allocation) const {
    for (const auto& block : blocks_) {
        if (block.allocation.memory == allocation.memory) {
            return true;
        }
    }
    return false;
}

} // namespace alloc
} // namespace draw2d

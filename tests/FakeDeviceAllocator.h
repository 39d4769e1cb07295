#pragma once

#include "draw2d/alloc/DeviceAllocator.h"

#include <cstdint>
#include <map>

// Leaf allocator for tests. Hands out made-up VkDeviceMemory handles, one per
// allocation, and remembers what is still live.
class FakeDeviceAllocator : public draw2d::alloc::DeviceAllocator {
public:
    std::optional<draw2d::alloc::Allocation> allocate(
            const draw2d::alloc::AllocationRequest& request) override {
        if (failNext) {
            failNext = false;
            return std::nullopt;
        }
        draw2d::alloc::Allocation allocation;
        allocation.memory = reinterpret_cast<VkDeviceMemory>(static_cast<uintptr_t>(nextHandle++));
        allocation.offset = 0;
        allocation.byteSize = request.size;
        allocation.memoryTypeIndex = request.memoryTypeIndex;
        live[allocation.memory] = allocation;
        lastRequest = request;
        allocateCalls++;
        return allocation;
    }

    bool free(const draw2d::alloc::Allocation& allocation) override {
        if (allocation.isNull()) return true;
        auto it = live.find(allocation.memory);
        if (it == live.end() ||
            it->second.byteSize != allocation.byteSize ||
            it->second.offset != allocation.offset) {
            return false;
        }
        live.erase(it);
        freeCalls++;
        return true;
    }

    bool managedByMe(const draw2d::alloc::Allocation& allocation) const override {
        return live.count(allocation.memory) != 0;
    }

    std::map<VkDeviceMemory, draw2d::alloc::Allocation> live;
    draw2d::alloc::AllocationRequest lastRequest;
    uint64_t nextHandle = 1;
    int allocateCalls = 0;
    int freeCalls = 0;
    bool failNext = false;
};

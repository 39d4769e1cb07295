#pragma once

#include <cstdint>

namespace draw2d {
namespace alloc {

struct Metrics {
    uint32_t totalAllocations = 0;
    uint32_t maxConcurrentAllocations = 0;
    uint32_t currentAllocations = 0;
    uint64_t meanAllocationByteSize = 0;
    uint64_t biggestAllocation = 0;
    uint64_t smallestAllocation = UINT64_MAX;

    void measureAllocation(uint64_t byteSize) {
        currentAllocations++;

        // Running weighted average
        meanAllocationByteSize =
            (meanAllocationByteSize * totalAllocations + byteSize) / (totalAllocations + 1);
        totalAllocations++;

        if (currentAllocations > maxConcurrentAllocations) {
            maxConcurrentAllocations = currentAllocations;
        }
        if (byteSize > biggestAllocation) {
            biggestAllocation = byteSize;
        }
        if (byteSize < smallestAllocation) {
            smallestAllocation = byteSize;
        }
    }

    void measureFree() {
        if (currentAllocations > 0) {
            currentAllocations--;
        }
    }
};

} // namespace alloc
} // namespace draw2d

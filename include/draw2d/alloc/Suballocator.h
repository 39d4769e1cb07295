#pragma once

#include "draw2d/alloc/Region.h"

#include <optional>
#include <vector>

namespace draw2d {
namespace alloc {

/**
 * First-fit free list over a single block of memory.
 *
 * Free regions are kept sorted by offset and are merged with their
 * neighbours whenever a region is returned, so a fully freed block is
 * always one region again.
 */
class Suballocator {
public:
    explicit Suballocator(Region block);

    std::optional<Region> allocate(VkDeviceSize size, VkDeviceSize alignment = 1);

    // Fails on double frees and on regions that overlap free space.
    bool free(const Region& region);

    bool isEmpty() const;

    const Region& block() const { return block_; }
    const std::vector<Region>& freeRegions() const { return freeRegions_; }

private:
    Region block_;
    std::vector<Region> freeRegions_;
};

} // namespace alloc
} // namespace draw2d

#pragma once

#include <vulkan/vulkan.h>
#include <optional>

namespace draw2d {
namespace alloc {

// A contiguous range of a memory block.
struct Region {
    VkDeviceSize offset = 0;
    VkDeviceSize size = 0;

    Region() = default;
    Region(VkDeviceSize offset, VkDeviceSize size) : offset(offset), size(size) {}

    VkDeviceSize end() const { return offset + size; }

    bool isContiguous(const Region& other) const {
        return end() == other.offset || other.end() == offset;
    }

    bool overlaps(const Region& other) const {
        return offset < other.end() && other.offset < end();
    }

    // Combine two touching regions. Non-contiguous regions cannot be merged.
    std::optional<Region> merge(const Region& other) const;

    // Split `size` bytes off the front. Returns the taken part and leaves the
    // remainder in this region.
    std::optional<Region> takeSubregion(VkDeviceSize size);

    bool operator==(const Region& other) const {
        return offset == other.offset && size == other.size;
    }
    bool operator!=(const Region& other) const { return !(*this == other); }
};

} // namespace alloc
} // namespace draw2d

#include "draw2d/alloc/Region.h"

#include <algorithm>

namespace draw2d {
namespace alloc {

std::optional<Region> Region::merge(const Region& other) const {
    if (!isContiguous(other)) {
        return std::nullopt;
    }
    const VkDeviceSize start = std::min(offset, other.offset);
    return Region(start, size + other.size);
}

std::optional<Region> Region::takeSubregion(VkDeviceSize takeSize) {
    if (takeSize > size) {
        return std::nullopt;
    }
    Region taken(offset, takeSize);
    offset += takeSize;
    size -= takeSize;
    return taken;
}

} // namespace alloc
} // namespace draw2d

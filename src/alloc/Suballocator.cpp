#include "draw2d/alloc/Suballocator.h"

#include <SDL3/SDL_log.h>
#include <algorithm>

namespace draw2d {
namespace alloc {

namespace {

VkDeviceSize alignUp(VkDeviceSize value, VkDeviceSize alignment) {
    if (alignment <= 1) {
        return value;
    }
    return ((value + alignment - 1) / alignment) * alignment;
}

} // namespace

Suballocator::Suballocator(Region block) : block_(block) {
    freeRegions_.push_back(block);
}

std::optional<Region> Suballocator::allocate(VkDeviceSize size, VkDeviceSize alignment) {
    if (size == 0) {
        return std::nullopt;
    }

    for (size_t i = 0; i < freeRegions_.size(); ++i) {
        Region& candidate = freeRegions_[i];
        const VkDeviceSize alignedStart = alignUp(candidate.offset, alignment);
        const VkDeviceSize padding = alignedStart - candidate.offset;
        if (padding + size > candidate.size) {
            continue;
        }

        if (padding == 0 && candidate.size == size) {
            Region taken = candidate;
            freeRegions_.erase(freeRegions_.begin() + static_cast<std::ptrdiff_t>(i));
            return taken;
        }

        if (padding == 0) {
            return candidate.takeSubregion(size);
        }

        // Leave the padding in front as its own free region
        Region front(candidate.offset, padding);
        Region rest(alignedStart, candidate.size - padding);
        std::optional<Region> taken = rest.takeSubregion(size);
        candidate = front;
        if (rest.size > 0) {
            freeRegions_.insert(freeRegions_.begin() + static_cast<std::ptrdiff_t>(i + 1), rest);
        }
        return taken;
    }

    return std::nullopt;
}

bool Suballocator::free(const Region& region) {
    if (region.size == 0) {
        return true;
    }
    if (region.offset < block_.offset || region.end() > block_.end()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Suballocator: region [%llu, %llu) is outside of the block",
            static_cast<unsigned long long>(region.offset),
            static_cast<unsigned long long>(region.end()));
        return false;
    }

    // First free region that starts after the one being returned
    auto next = std::upper_bound(freeRegions_.begin(), freeRegions_.end(), region,
        [](const Region& a, const Region& b) { return a.offset < b.offset; });

    const bool hasNext = next != freeRegions_.end();
    const bool hasPrev = next != freeRegions_.begin();
    auto prev = hasPrev ? std::prev(next) : freeRegions_.end();

    if ((hasNext && next->overlaps(region)) || (hasPrev && prev->overlaps(region))) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Suballocator: double free or overlapping free of region [%llu, %llu)",
            static_cast<unsigned long long>(region.offset),
            static_cast<unsigned long long>(region.end()));
        return false;
    }

    const bool mergeFront = hasPrev && prev->end() == region.offset;
    const bool mergeBack = hasNext && region.end() == next->offset;

    if (mergeFront && mergeBack) {
        prev->size += region.size + next->size;
        freeRegions_.erase(next);
    } else if (mergeFront) {
        prev->size += region.size;
    } else if (mergeBack) {
        next->offset = region.offset;
        next->size += region.size;
    } else {
        freeRegions_.insert(next, region);
    }
    return true;
}

bool Suballocator::isEmpty() const {
    return freeRegions_.size() == 1 && freeRegions_.front() == block_;
}

} // namespace alloc
} // namespace draw2d

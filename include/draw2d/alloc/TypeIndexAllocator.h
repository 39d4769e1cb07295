#pragma once

#include "draw2d/alloc/DeviceAllocator.h"

#include <functional>
#include <memory>
#include <vector>

namespace draw2d {
namespace alloc {

/**
 * Keeps a separate allocator for every memory type the device exposes.
 *
 * Requests are routed by AllocationRequest::memoryTypeIndex.
 */
class TypeIndexAllocator : public DeviceAllocator {
public:
    using Factory = std::function<std::unique_ptr<DeviceAllocator>(
        uint32_t memoryTypeIndex, const VkMemoryType& memoryType)>;

    TypeIndexAllocator(const VkPhysicalDeviceMemoryProperties& properties,
                       const Factory& factory);

    std::optional<Allocation> allocate(const AllocationRequest& request) override;
    bool free(const Allocation& allocation) override;
    bool managedByMe(const Allocation& allocation) const override;

    size_t typeCount() const { return allocators_.size(); }

private:
    DeviceAllocator* forType(uint32_t memoryTypeIndex) const;

    std::vector<std::unique_ptr<DeviceAllocator>> allocators_;
};

} // namespace alloc
} // namespace draw2d

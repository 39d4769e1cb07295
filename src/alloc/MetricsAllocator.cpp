#include "draw2d/alloc/MetricsAllocator.h"

namespace draw2d {
namespace alloc {

MetricsAllocator::MetricsAllocator(std::string name,
                                   std::unique_ptr<MetricsReport> report,
                                   std::unique_ptr<DeviceAllocator> allocator)
    : name_(std::move(name))
    , report_(std::move(report))
    , allocator_(std::move(allocator)) {}

MetricsAllocator::~MetricsAllocator() {
    if (report_) {
        report_->render(name_, total_, byType_);
    }
}

std::optional<Allocation> MetricsAllocator::allocate(const AllocationRequest& request) {
    auto allocation = allocator_->allocate(request);
    if (allocation && !allocation->isNull()) {
        total_.measureAllocation(allocation->byteSize);
        byType_[allocation->memoryTypeIndex].measureAllocation(allocation->byteSize);
    }
    return allocation;
}

bool MetricsAllocator::free(const Allocation& allocation) {
    if (allocation.isNull()) {
        return true;
    }
    if (!allocator_->free(allocation)) {
        return false;
    }
    total_.measureFree();
    byType_[allocation.memoryTypeIndex].measureFree();
    return true;
}

bool MetricsAllocator::managedByMe(const Allocation& allocation) const {
    return allocator_->managedByMe(allocation);
}

} // namespace alloc
} // namespace draw2d

#pragma once

#include "draw2d/alloc/DeviceAllocator.h"
#include "draw2d/alloc/Metrics.h"
#include "draw2d/alloc/MetricsReport.h"

#include <map>
#include <memory>
#include <string>

namespace draw2d {
namespace alloc {

/**
 * Decorates an allocator with usage metrics.
 *
 * Totals and per-memory-type metrics are collected for every successful
 * allocate and free. The report renders when the allocator is destroyed,
 * which makes leaked allocations visible at shutdown.
 */
class MetricsAllocator : public DeviceAllocator {
public:
    MetricsAllocator(std::string name,
                     std::unique_ptr<MetricsReport> report,
                     std::unique_ptr<DeviceAllocator> allocator);
    ~MetricsAllocator() override;

    MetricsAllocator(const MetricsAllocator&) = delete;
    MetricsAllocator& operator=(const MetricsAllocator&) = delete;

    std::optional<Allocation> allocate(const AllocationRequest& request) override;
    bool free(const Allocation& allocation) override;
    bool managedByMe(const Allocation& allocation) const override;

    const Metrics& total() const { return total_; }
    const std::map<uint32_t, Metrics>& metricsByType() const { return byType_; }

private:
    std::string name_;
    std::unique_ptr<MetricsReport> report_;
    std::unique_ptr<DeviceAllocator> allocator_;
    Metrics total_;
    std::map<uint32_t, Metrics> byType_;
};

} // namespace alloc
} // namespace draw2d

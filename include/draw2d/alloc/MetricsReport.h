#pragma once

#include "draw2d/alloc/Metrics.h"

#include <map>
#include <string>

namespace draw2d {
namespace alloc {

class MetricsReport {
public:
    virtual ~MetricsReport() = default;

    virtual void render(const std::string& name,
                        const Metrics& total,
                        const std::map<uint32_t, Metrics>& metricsByType) const = 0;
};

/**
 * Logs a markdown summary of allocator usage:
 *
 *   # Device Allocator - Memory Report Totals
 *
 *     |                Metric Name | Value        |
 *     | -------------------------- | ------------ |
 *     | max concurrent allocations | 6            |
 *     ...
 *
 * followed by one table per memory type index.
 */
class ConsoleMarkdownReport : public MetricsReport {
public:
    void render(const std::string& name,
                const Metrics& total,
                const std::map<uint32_t, Metrics>& metricsByType) const override;

    static std::string buildReport(const std::string& name,
                                   const Metrics& total,
                                   const std::map<uint32_t, Metrics>& metricsByType);

    static std::string formatMetricsTable(const Metrics& metrics);

    // At most three decimals in the largest 1024-based unit, e.g. "33.433 KiB".
    static std::string prettyPrintBytes(uint64_t byteSize);
};

} // namespace alloc
} // namespace draw2d

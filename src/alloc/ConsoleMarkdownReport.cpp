#include "draw2d/alloc/MetricsReport.h"

#include <SDL3/SDL_log.h>
#include <cstdio>
#include <sstream>

namespace draw2d {
namespace alloc {

namespace {

constexpr const char* UNITS[] = {"B", "KiB", "MiB", "GiB"};
constexpr size_t UNIT_COUNT = sizeof(UNITS) / sizeof(UNITS[0]);

size_t orderOfMagnitude(uint64_t byteSize) {
    size_t order = 0;
    double remaining = static_cast<double>(byteSize);
    while (remaining >= 1024.0 && order + 1 < UNIT_COUNT) {
        remaining /= 1024.0;
        order++;
    }
    return order;
}

std::string padRight(const std::string& value, size_t width) {
    if (value.size() >= width) {
        return value;
    }
    return value + std::string(width - value.size(), ' ');
}

void row(std::ostringstream& out, const char* label, const std::string& value) {
    out << "  | " << label << " | " << padRight(value, 12) << " |\n";
}

} // namespace

std::string ConsoleMarkdownReport::prettyPrintBytes(uint64_t byteSize) {
    const size_t order = orderOfMagnitude(byteSize);
    double divisor = 1.0;
    for (size_t i = 0; i < order; ++i) {
        divisor *= 1024.0;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.3f", static_cast<double>(byteSize) / divisor);

    // Drop trailing zeros so 256.000 prints as 256
    std::string number(buffer);
    while (!number.empty() && number.back() == '0') {
        number.pop_back();
    }
    if (!number.empty() && number.back() == '.') {
        number.pop_back();
    }

    return number + " " + UNITS[order];
}

std::string ConsoleMarkdownReport::formatMetricsTable(const Metrics& metrics) {
    std::ostringstream out;
    row(out, "               Metric Name", "Value");
    row(out, "--------------------------", "------------");
    row(out, "max concurrent allocations", std::to_string(metrics.maxConcurrentAllocations));
    row(out, "    total allocation count", std::to_string(metrics.totalAllocations));
    row(out, "   leaked allocation count", std::to_string(metrics.currentAllocations));
    row(out, "      mean allocation size", prettyPrintBytes(metrics.meanAllocationByteSize));
    row(out, "        biggest allocation", prettyPrintBytes(metrics.biggestAllocation));
    row(out, "       smallest allocation",
        metrics.totalAllocations == 0 ? std::string("n/a") : prettyPrintBytes(metrics.smallestAllocation));
    return out.str();
}

std::string ConsoleMarkdownReport::buildReport(const std::string& name,
                                               const Metrics& total,
                                               const std::map<uint32_t, Metrics>& metricsByType) {
    std::ostringstream out;
    out << "\n# " << name << " - Memory Report Totals\n\n";
    out << formatMetricsTable(total);
    out << "\n## Metrics By Memory Type Index\n";
    for (const auto& [typeIndex, metrics] : metricsByType) {
        out << "\n### Memory Type " << typeIndex << "\n\n";
        out << formatMetricsTable(metrics);
    }
    return out.str();
}

void ConsoleMarkdownReport::render(const std::string& name,
                                   const Metrics& total,
                                   const std::map<uint32_t, Metrics>& metricsByType) const {
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "%s",
        buildReport(name, total, metricsByType).c_str());
}

} // namespace alloc
} // namespace draw2d

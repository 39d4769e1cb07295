#include "draw2d/alloc/StandardAllocator.h"
#include "draw2d/alloc/ForcedOffsetAllocator.h"
#include "draw2d/alloc/MetricsAllocator.h"
#include "draw2d/alloc/MetricsReport.h"
#include "draw2d/alloc/PageAllocator.h"
#include "draw2d/alloc/PassthroughAllocator.h"
#include "draw2d/alloc/PoolAllocator.h"
#include "draw2d/alloc/SharedRefAllocator.h"
#include "draw2d/alloc/SizeSelector.h"
#include "draw2d/alloc/TypeIndexAllocator.h"

namespace draw2d {
namespace alloc {

namespace {

// Reports nothing. Used when the shutdown report is turned off.
class SilentReport : public MetricsReport {
public:
    void render(const std::string&, const Metrics&, const std::map<uint32_t, Metrics>&) const override {}
};

} // namespace

std::unique_ptr<DeviceAllocator> buildStandardAllocator(
        const VkPhysicalDeviceMemoryProperties& memoryProperties,
        VmaAllocator vma,
        const StandardAllocatorSettings& settings) {
    std::shared_ptr<DeviceAllocator> device = std::make_shared<PassthroughAllocator>(vma);
    if (settings.forceOffsets) {
        device = std::make_shared<ForcedOffsetAllocator>(
            std::make_unique<PassthroughAllocator>(vma), settings.pageSize);
    }

    auto perType = std::make_unique<TypeIndexAllocator>(memoryProperties,
        [&](uint32_t, const VkMemoryType&) -> std::unique_ptr<DeviceAllocator> {
            auto pool = std::make_unique<PageAllocator>(
                std::make_unique<PoolAllocator>(
                    std::make_unique<SharedRefAllocator>(device), settings.blockSize),
                settings.pageSize);
            auto dedicated = std::make_unique<PageAllocator>(
                std::make_unique<SharedRefAllocator>(device), settings.pageSize);
            return std::make_unique<SizeSelector>(
                std::move(pool), settings.largeThreshold, std::move(dedicated));
        });

    std::unique_ptr<MetricsReport> report;
    if (settings.report) {
        report = std::make_unique<ConsoleMarkdownReport>();
    } else {
        report = std::make_unique<SilentReport>();
    }

    return std::make_unique<MetricsAllocator>("Device Allocator", std::move(report), std::move(perType));
}

} // namespace alloc
} // namespace draw2d

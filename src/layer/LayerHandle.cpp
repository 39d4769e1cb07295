#include "draw2d/layer/LayerHandle.h"

#include <atomic>

namespace draw2d {

LayerHandle LayerHandle::next() {
    static std::atomic<int64_t> counter{1};
    return LayerHandle(counter.fetch_add(1, std::memory_order_relaxed));
}

} // namespace draw2d

#include "draw2d/layer/Layer.h"

namespace draw2d {

size_t Layer::vertexCount() const {
    size_t count = 0;
    for (const auto& batch : batches_) {
        count += batch.vertices.size();
    }
    return count;
}

} // namespace draw2d

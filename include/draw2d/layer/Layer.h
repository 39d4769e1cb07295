#pragma once

#include "draw2d/layer/Batch.h"

#include <glm/glm.hpp>
#include <vector>

namespace draw2d {

class Layer {
public:
    Layer() = default;

    void clear() { batches_.clear(); }

    void setProjection(const glm::mat4& projection) { projection_ = projection; }
    const glm::mat4& projection() const { return projection_; }

    void pushBatch(Batch batch) { batches_.push_back(std::move(batch)); }

    template <typename Range>
    void pushBatches(Range&& batches) {
        for (auto&& batch : batches) {
            batches_.push_back(batch);
        }
    }

    const std::vector<Batch>& batches() const { return batches_; }

    size_t vertexCount() const;

private:
    glm::mat4 projection_{1.0f};
    std::vector<Batch> batches_;
};

} // namespace draw2d

#include "draw2d/layer/LayerStack.h"

namespace draw2d {

LayerHandle LayerStack::addLayerToTop() {
    LayerHandle handle = LayerHandle::next();
    layers_.emplace(handle, Layer());
    renderOrder_.push_back(handle);
    return handle;
}

LayerHandle LayerStack::addLayerToBottom() {
    LayerHandle handle = LayerHandle::next();
    layers_.emplace(handle, Layer());
    renderOrder_.insert(renderOrder_.begin(), handle);
    return handle;
}

Layer* LayerStack::getLayer(const LayerHandle& handle) {
    auto it = layers_.find(handle);
    return it == layers_.end() ? nullptr : &it->second;
}

const Layer* LayerStack::getLayer(const LayerHandle& handle) const {
    auto it = layers_.find(handle);
    return it == layers_.end() ? nullptr : &it->second;
}

std::vector<const Layer*> LayerStack::layers() const {
    std::vector<const Layer*> ordered;
    ordered.reserve(renderOrder_.size());
    for (const auto& handle : renderOrder_) {
        ordered.push_back(&layers_.at(handle));
    }
    return ordered;
}

std::vector<const std::vector<Vertex2d>*> LayerStack::vertices() const {
    std::vector<const std::vector<Vertex2d>*> slices;
    for (const Layer* layer : layers()) {
        for (const auto& batch : layer->batches()) {
            slices.push_back(&batch.vertices);
        }
    }
    return slices;
}

size_t LayerStack::vertexCount() const {
    size_t count = 0;
    for (const auto& [handle, layer] : layers_) {
        count += layer.vertexCount();
    }
    return count;
}

} // namespace draw2d

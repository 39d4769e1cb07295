#pragma once

#include "draw2d/layer/Layer.h"
#include "draw2d/layer/LayerHandle.h"

#include <unordered_map>
#include <vector>

namespace draw2d {

/**
 * Owns every layer and the order they are rendered in.
 *
 * Layers later in the order are drawn over earlier ones.
 */
class LayerStack {
public:
    LayerHandle addLayerToTop();
    LayerHandle addLayerToBottom();

    // nullptr for unknown handles.
    Layer* getLayer(const LayerHandle& handle);
    const Layer* getLayer(const LayerHandle& handle) const;

    std::vector<const Layer*> layers() const;

    // Every batch's vertices, layer by layer, in render order.
    std::vector<const std::vector<Vertex2d>*> vertices() const;

    size_t vertexCount() const;

    size_t layerCount() const { return renderOrder_.size(); }

private:
    std::unordered_map<LayerHandle, Layer> layers_;
    std::vector<LayerHandle> renderOrder_;
};

} // namespace draw2d

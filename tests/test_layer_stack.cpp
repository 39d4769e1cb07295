#include <doctest/doctest.h>
#include <glm/gtc/matrix_transform.hpp>
#include <unordered_set>

#include "draw2d/layer/LayerStack.h"

using namespace draw2d;

static Batch batchOf(size_t vertexCount, uint32_t texture = 0) {
    Batch batch;
    batch.texture = TextureHandle(texture);
    batch.vertices.resize(vertexCount);
    return batch;
}

TEST_SUITE("LayerHandle") {
    TEST_CASE("every handle is unique") {
        std::unordered_set<LayerHandle> seen;
        for (int i = 0; i < 100; ++i) {
            CHECK(seen.insert(LayerHandle::next()).second);
        }
    }

    TEST_CASE("handles compare equal only to themselves") {
        LayerHandle a = LayerHandle::next();
        LayerHandle b = LayerHandle::next();
        LayerHandle copy = a;
        CHECK(a == copy);
        CHECK(a != b);
    }
}

TEST_SUITE("Layer") {
    TEST_CASE("projection defaults to identity") {
        Layer layer;
        CHECK(layer.projection() == glm::mat4(1.0f));

        glm::mat4 ortho = glm::ortho(-1.0f, 1.0f, -1.0f, 1.0f);
        layer.setProjection(ortho);
        CHECK(layer.projection() == ortho);
    }

    TEST_CASE("batches keep their order and clear empties them") {
        Layer layer;
        layer.pushBatch(batchOf(3, 1));
        std::vector<Batch> more = {batchOf(6, 2), batchOf(9, 3)};
        layer.pushBatches(more);

        REQUIRE(layer.batches().size() == 3);
        CHECK(layer.batches()[0].texture.index() == 1);
        CHECK(layer.batches()[2].texture.index() == 3);
        CHECK(layer.vertexCount() == 18);

        layer.clear();
        CHECK(layer.batches().empty());
        CHECK(layer.vertexCount() == 0);
    }
}

TEST_SUITE("LayerStack") {
    TEST_CASE("empty stack") {
        LayerStack stack;
        CHECK(stack.layerCount() == 0);
        CHECK(stack.layers().empty());
        CHECK(stack.vertices().empty());
        CHECK(stack.vertexCount() == 0);
    }

    TEST_CASE("unknown handles return null") {
        LayerStack stack;
        stack.addLayerToTop();
        CHECK(stack.getLayer(LayerHandle::next()) == nullptr);
    }

    TEST_CASE("top layers render last, bottom layers first") {
        LayerStack stack;
        LayerHandle middle = stack.addLayerToTop();
        LayerHandle top = stack.addLayerToTop();
        LayerHandle bottom = stack.addLayerToBottom();

        auto layers = stack.layers();
        REQUIRE(layers.size() == 3);
        CHECK(layers[0] == stack.getLayer(bottom));
        CHECK(layers[1] == stack.getLayer(middle));
        CHECK(layers[2] == stack.getLayer(top));
    }

    TEST_CASE("vertices are ordered by layer then batch") {
        LayerStack stack;
        LayerHandle top = stack.addLayerToTop();
        LayerHandle bottom = stack.addLayerToBottom();

        stack.getLayer(top)->pushBatch(batchOf(3));
        stack.getLayer(bottom)->pushBatch(batchOf(6));
        stack.getLayer(bottom)->pushBatch(batchOf(9));

        auto slices = stack.vertices();
        REQUIRE(slices.size() == 3);
        CHECK(slices[0]->size() == 6);
        CHECK(slices[1]->size() == 9);
        CHECK(slices[2]->size() == 3);
        CHECK(stack.vertexCount() == 18);
    }

    TEST_CASE("layers are edited in place") {
        LayerStack stack;
        LayerHandle handle = stack.addLayerToTop();
        stack.getLayer(handle)->pushBatch(batchOf(6));

        const LayerStack& constStack = stack;
        REQUIRE(constStack.getLayer(handle) != nullptr);
        CHECK(constStack.getLayer(handle)->vertexCount() == 6);
    }
}

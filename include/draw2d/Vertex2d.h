#pragma once

#include <vulkan/vulkan.hpp>
#include <array>
#include <cstddef>

namespace draw2d {

struct Vertex2d {
    float pos[2] = {0.0f, 0.0f};
    float uv[2] = {0.0f, 0.0f};
    float rgba[4] = {1.0f, 1.0f, 1.0f, 1.0f};

    static vk::VertexInputBindingDescription bindingDescription() {
        return vk::VertexInputBindingDescription{}
            .setBinding(0)
            .setStride(sizeof(Vertex2d))
            .setInputRate(vk::VertexInputRate::eVertex);
    }

    static std::array<vk::VertexInputAttributeDescription, 3> attributeDescriptions() {
        return {
            vk::VertexInputAttributeDescription{}
                .setLocation(0).setBinding(0)
                .setFormat(vk::Format::eR32G32Sfloat)
                .setOffset(offsetof(Vertex2d, pos)),
            vk::VertexInputAttributeDescription{}
                .setLocation(1).setBinding(0)
                .setFormat(vk::Format::eR32G32Sfloat)
                .setOffset(offsetof(Vertex2d, uv)),
            vk::VertexInputAttributeDescription{}
                .setLocation(2).setBinding(0)
                .setFormat(vk::Format::eR32G32B32A32Sfloat)
                .setOffset(offsetof(Vertex2d, rgba)),
        };
    }
};

} // namespace draw2d

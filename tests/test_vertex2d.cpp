#include <doctest/doctest.h>

#include "draw2d/Vertex2d.h"
#include "draw2d/pipeline/PushConstants.h"

#include <cstddef>

using namespace draw2d;

TEST_SUITE("Vertex2d") {
    TEST_CASE("defaults to opaque white at the origin") {
        Vertex2d v;
        CHECK(v.pos[0] == 0.0f);
        CHECK(v.uv[1] == 0.0f);
        CHECK(v.rgba[0] == 1.0f);
        CHECK(v.rgba[3] == 1.0f);
    }

    TEST_CASE("tightly packed floats") {
        CHECK(sizeof(Vertex2d) == 8 * sizeof(float));
    }

    TEST_CASE("binding description") {
        auto binding = Vertex2d::bindingDescription();
        CHECK(binding.binding == 0);
        CHECK(binding.stride == sizeof(Vertex2d));
        CHECK(binding.inputRate == vk::VertexInputRate::eVertex);
    }

    TEST_CASE("attributes match the shader locations") {
        auto attributes = Vertex2d::attributeDescriptions();
        REQUIRE(attributes.size() == 3);

        CHECK(attributes[0].location == 0);
        CHECK(attributes[0].format == vk::Format::eR32G32Sfloat);
        CHECK(attributes[0].offset == 0);

        CHECK(attributes[1].location == 1);
        CHECK(attributes[1].format == vk::Format::eR32G32Sfloat);
        CHECK(attributes[1].offset == 2 * sizeof(float));

        CHECK(attributes[2].location == 2);
        CHECK(attributes[2].format == vk::Format::eR32G32B32A32Sfloat);
        CHECK(attributes[2].offset == 4 * sizeof(float));
    }
}

TEST_SUITE("PushConstants") {
    // Both fragment programs and the vertex program declare
    // { mat4 projection; uint textureIndex; }
    TEST_CASE("texture index follows the projection matrix") {
        CHECK(offsetof(PushConstants, projection) == 0);
        CHECK(offsetof(PushConstants, textureIndex) == 64);
        CHECK(sizeof(PushConstants) >= 68);
    }

    TEST_CASE("defaults draw with the white texture and no extra transform") {
        PushConstants push;
        CHECK(push.textureIndex == 0);
        CHECK(push.projection == glm::mat4(1.0f));
    }
}

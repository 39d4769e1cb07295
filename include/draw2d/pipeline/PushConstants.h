#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace draw2d {

// Matches the push_constant block in draw2d.vert / draw2d.frag.
struct PushConstants {
    glm::mat4 projection{1.0f};
    uint32_t textureIndex = 0;
};

static_assert(sizeof(PushConstants) <= 128, "push constants must fit the guaranteed minimum");

} // namespace draw2d

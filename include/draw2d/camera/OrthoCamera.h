#pragma once

#include "draw2d/geometry/Rect.h"

#include <glm/glm.hpp>

namespace draw2d {

/**
 * Orthographic camera for a y-up 2D world.
 *
 * The viewport is described by its height in world units and an aspect
 * ratio. The projection flips y so world +y is up on screen in Vulkan clip
 * space.
 */
class OrthoCamera {
public:
    OrthoCamera() = default;
    OrthoCamera(float viewportWidth, float viewportHeight, glm::vec2 worldPosition = glm::vec2(0.0f));

    static OrthoCamera withViewport(float viewportHeight, float aspectRatio);

    glm::mat4 projection() const;
    glm::mat4 view() const;
    glm::mat4 asMatrix() const;

    Rect<float> bounds() const;

    void setWorldPosition(const glm::vec2& position) { worldPosition_ = position; }
    const glm::vec2& worldPosition() const { return worldPosition_; }

    // Keeps the viewport height, recomputes the width.
    void setAspectRatio(float aspectRatio);
    float aspectRatio() const { return viewportWidth_ / viewportHeight_; }

    // Keeps the aspect ratio.
    void setViewportHeight(float height);
    float viewportHeight() const { return viewportHeight_; }
    float viewportWidth() const { return viewportWidth_; }

    // Normalized device coordinates to a world-space direction.
    glm::vec2 unprojectVec(const glm::vec2& ndc) const;

    // Normalized device coordinates to a world-space position.
    glm::vec2 unprojectPoint(const glm::vec2& ndc) const;

private:
    float viewportWidth_ = 2.0f;
    float viewportHeight_ = 2.0f;
    glm::vec2 worldPosition_{0.0f};
};

} // namespace draw2d

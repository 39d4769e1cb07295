#include "draw2d/camera/OrthoCamera.h"

#include <glm/gtc/matrix_transform.hpp>

namespace draw2d {

OrthoCamera::OrthoCamera(float viewportWidth, float viewportHeight, glm::vec2 worldPosition)
    : viewportWidth_(viewportWidth)
    , viewportHeight_(viewportHeight)
    , worldPosition_(worldPosition) {}

OrthoCamera OrthoCamera::withViewport(float viewportHeight, float aspectRatio) {
    return OrthoCamera(viewportHeight * aspectRatio, viewportHeight);
}

glm::mat4 OrthoCamera::projection() const {
    // ortho(-w/2, w/2, bottom = h/2, top = -h/2, near = 1, far = -1).
    // Depth passes through unchanged.
    glm::mat4 result(1.0f);
    result[0][0] = 2.0f / viewportWidth_;
    result[1][1] = -2.0f / viewportHeight_;
    return result;
}

glm::mat4 OrthoCamera::view() const {
    return glm::translate(glm::mat4(1.0f), glm::vec3(-worldPosition_, 0.0f));
}

glm::mat4 OrthoCamera::asMatrix() const {
    return projection() * view();
}

Rect<float> OrthoCamera::bounds() const {
    const float halfWidth = viewportWidth_ / 2.0f;
    const float halfHeight = viewportHeight_ / 2.0f;
    return Rect<float>(
        -halfWidth + worldPosition_.x,
        halfWidth + worldPosition_.x,
        -halfHeight + worldPosition_.y,
        halfHeight + worldPosition_.y);
}

void OrthoCamera::setAspectRatio(float aspectRatio) {
    viewportWidth_ = viewportHeight_ * aspectRatio;
}

void OrthoCamera::setViewportHeight(float height) {
    const float aspect = aspectRatio();
    viewportHeight_ = height;
    viewportWidth_ = height * aspect;
}

glm::vec2 OrthoCamera::unprojectVec(const glm::vec2& ndc) const {
    return glm::vec2(ndc.x * viewportWidth_ / 2.0f, -ndc.y * viewportHeight_ / 2.0f);
}

glm::vec2 OrthoCamera::unprojectPoint(const glm::vec2& ndc) const {
    return unprojectVec(ndc) + worldPosition_;
}

} // namespace draw2d

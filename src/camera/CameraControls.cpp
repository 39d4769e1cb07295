#include "draw2d/camera/CameraControls.h"

namespace draw2d {

namespace {

constexpr float PAN_FRACTION = 0.1f;
constexpr float ZOOM_OUT = 1.1f;
constexpr float ZOOM_IN = 0.9f;

bool handleKeyRelease(OrthoCamera& camera, SDL_Keycode key) {
    glm::vec2 step(0.0f);
    switch (key) {
        case SDLK_LEFT:
        case SDLK_A:
            step.x = -PAN_FRACTION * camera.viewportWidth();
            break;
        case SDLK_RIGHT:
        case SDLK_D:
            step.x = PAN_FRACTION * camera.viewportWidth();
            break;
        case SDLK_UP:
        case SDLK_W:
            step.y = PAN_FRACTION * camera.viewportHeight();
            break;
        case SDLK_DOWN:
        case SDLK_S:
            step.y = -PAN_FRACTION * camera.viewportHeight();
            break;
        default:
            return false;
    }
    camera.setWorldPosition(camera.worldPosition() + step);
    return true;
}

} // namespace

bool defaultCameraControls(OrthoCamera& camera, const SDL_Event& event) {
    switch (event.type) {
        case SDL_EVENT_KEY_UP:
            return handleKeyRelease(camera, event.key.key);

        case SDL_EVENT_WINDOW_RESIZED:
        case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            if (event.window.data1 <= 0 || event.window.data2 <= 0) {
                return false;
            }
            camera.setAspectRatio(static_cast<float>(event.window.data1) /
                                  static_cast<float>(event.window.data2));
            return true;

        case SDL_EVENT_MOUSE_WHEEL:
            if (event.wheel.y < 0.0f) {
                camera.setViewportHeight(camera.viewportHeight() * ZOOM_OUT);
                return true;
            }
            if (event.wheel.y > 0.0f) {
                camera.setViewportHeight(camera.viewportHeight() * ZOOM_IN);
                return true;
            }
            return false;

        default:
            return false;
    }
}

} // namespace draw2d

#pragma once

#include "draw2d/camera/OrthoCamera.h"

#include <SDL3/SDL_events.h>

namespace draw2d {

// Arrow/WASD keys pan, the mouse wheel zooms and window resizes update the
// aspect ratio. Returns true when the camera changed.
bool defaultCameraControls(OrthoCamera& camera, const SDL_Event& event);

} // namespace draw2d

#include <doctest/doctest.h>
#include <SDL3/SDL.h>

#include "draw2d/camera/CameraControls.h"

using namespace draw2d;

static SDL_Event keyUp(SDL_Keycode key) {
    SDL_Event event{};
    event.type = SDL_EVENT_KEY_UP;
    event.key.key = key;
    return event;
}

TEST_SUITE("CameraControls") {
    TEST_CASE("arrow keys pan by a tenth of the viewport") {
        OrthoCamera camera = OrthoCamera::withViewport(10.0f, 2.0f);

        CHECK(defaultCameraControls(camera, keyUp(SDLK_RIGHT)));
        CHECK(camera.worldPosition().x == doctest::Approx(2.0f));

        CHECK(defaultCameraControls(camera, keyUp(SDLK_UP)));
        CHECK(camera.worldPosition().y == doctest::Approx(1.0f));

        CHECK(defaultCameraControls(camera, keyUp(SDLK_A)));
        CHECK(defaultCameraControls(camera, keyUp(SDLK_S)));
        CHECK(camera.worldPosition().x == doctest::Approx(0.0f));
        CHECK(camera.worldPosition().y == doctest::Approx(0.0f));
    }

    TEST_CASE("key presses are ignored, only releases move") {
        OrthoCamera camera;
        SDL_Event event = keyUp(SDLK_LEFT);
        event.type = SDL_EVENT_KEY_DOWN;
        CHECK_FALSE(defaultCameraControls(camera, event));
        CHECK(camera.worldPosition().x == doctest::Approx(0.0f));
    }

    TEST_CASE("unbound keys do nothing") {
        OrthoCamera camera;
        CHECK_FALSE(defaultCameraControls(camera, keyUp(SDLK_Q)));
    }

    TEST_CASE("resize updates the aspect ratio") {
        OrthoCamera camera = OrthoCamera::withViewport(768.0f, 1.0f);
        SDL_Event event{};
        event.type = SDL_EVENT_WINDOW_RESIZED;
        event.window.data1 = 1366;
        event.window.data2 = 768;

        CHECK(defaultCameraControls(camera, event));
        CHECK(camera.viewportHeight() == doctest::Approx(768.0f));
        CHECK(camera.viewportWidth() == doctest::Approx(1366.0f));
    }

    TEST_CASE("zero sized resize is ignored") {
        OrthoCamera camera;
        SDL_Event event{};
        event.type = SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED;
        event.window.data1 = 0;
        event.window.data2 = 0;
        CHECK_FALSE(defaultCameraControls(camera, event));
    }

    TEST_CASE("scrolling zooms") {
        OrthoCamera camera = OrthoCamera::withViewport(10.0f, 1.0f);
        SDL_Event event{};
        event.type = SDL_EVENT_MOUSE_WHEEL;

        event.wheel.y = -1.0f;
        CHECK(defaultCameraControls(camera, event));
        CHECK(camera.viewportHeight() == doctest::Approx(11.0f));

        event.wheel.y = 1.0f;
        CHECK(defaultCameraControls(camera, event));
        CHECK(camera.viewportHeight() == doctest::Approx(9.9f));
        CHECK(camera.aspectRatio() == doctest::Approx(1.0f));
    }
}

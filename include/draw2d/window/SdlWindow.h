#pragma once

#include <SDL3/SDL.h>
#include <functional>
#include <string>
#include <utility>

namespace draw2d {

/**
 * SDL video subsystem plus one resizable Vulkan window.
 *
 * SDL is initialised by init() and shut down by the destructor, so only one
 * SdlWindow should exist at a time.
 */
class SdlWindow {
public:
    using EventHandler = std::function<void(const SDL_Event&)>;

    SdlWindow() = default;
    ~SdlWindow();

    SdlWindow(const SdlWindow&) = delete;
    SdlWindow& operator=(const SdlWindow&) = delete;

    // A fullscreen window covers the desktop of its display. width and height
    // are then the size restored when leaving fullscreen.
    bool init(const std::string& title, int width, int height, bool fullscreen = false);

    // Drain the event queue. Quit and close requests set shouldClose().
    void pollEvents(const EventHandler& handler);

    bool shouldClose() const { return shouldClose_; }
    void requestClose() { shouldClose_ = true; }

    bool isFullscreen() const;
    bool setFullscreen(bool fullscreen);
    bool toggleFullscreen() { return setFullscreen(!isFullscreen()); }

    // Logical size in screen coordinates.
    std::pair<int, int> size() const;

    SDL_Window* handle() const { return window_; }

private:
    SDL_Window* window_ = nullptr;
    bool sdlInitialized_ = false;
    bool shouldClose_ = false;
};

} // namespace draw2d

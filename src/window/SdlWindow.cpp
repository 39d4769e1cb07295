#include "draw2d/window/SdlWindow.h"

namespace draw2d {

SdlWindow::~SdlWindow() {
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    if (sdlInitialized_) {
        SDL_Quit();
    }
}

bool SdlWindow::init(const std::string& title, int width, int height, bool fullscreen) {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to initialize SDL: %s", SDL_GetError());
        return false;
    }
    sdlInitialized_ = true;

    SDL_WindowFlags flags = SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE;
    if (fullscreen) {
        flags |= SDL_WINDOW_FULLSCREEN;
    }
    window_ = SDL_CreateWindow(title.c_str(), width, height, flags);
    if (!window_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create window: %s", SDL_GetError());
        return false;
    }

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Created %dx%d%s window '%s'",
                width, height, fullscreen ? " fullscreen" : "", title.c_str());
    return true;
}

bool SdlWindow::isFullscreen() const {
    return window_ && (SDL_GetWindowFlags(window_) & SDL_WINDOW_FULLSCREEN) != 0;
}

bool SdlWindow::setFullscreen(bool fullscreen) {
    if (!window_) {
        return false;
    }
    if (!SDL_SetWindowFullscreen(window_, fullscreen)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to %s fullscreen: %s",
                     fullscreen ? "enter" : "leave", SDL_GetError());
        return false;
    }
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Window is now %s", fullscreen ? "fullscreen" : "windowed");
    return true;
}

void SdlWindow::pollEvents(const EventHandler& handler) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                shouldClose_ = true;
                break;
            default:
                break;
        }
        if (handler) {
            handler(event);
        }
    }
}

std::pair<int, int> SdlWindow::size() const {
    int width = 0;
    int height = 0;
    if (window_ && !SDL_GetWindowSize(window_, &width, &height)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to query window size: %s", SDL_GetError());
    }
    return {width, height};
}

} // namespace draw2d

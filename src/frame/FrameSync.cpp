#include "draw2d/frame/FrameSync.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>
#include <string>

namespace draw2d {

bool FrameSync::create(VulkanContext& context, uint32_t frameIndex) {
    try {
        imageAvailable.emplace(context.device(), vk::SemaphoreCreateInfo{});
        renderFinished.emplace(context.device(), vk::SemaphoreCreateInfo{});
        graphicsFinished.emplace(context.device(), vk::FenceCreateInfo{});
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to create sync objects for frame %u: %s", frameIndex, e.what());
        return false;
    }

    const std::string suffix = " (frame " + std::to_string(frameIndex) + ")";
    context.nameObject(**imageAvailable, "image available" + suffix);
    context.nameObject(**renderFinished, "render finished" + suffix);
    context.nameObject(**graphicsFinished, "graphics finished" + suffix);
    return true;
}

} // namespace draw2d

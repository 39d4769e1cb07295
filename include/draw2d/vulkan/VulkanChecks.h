#pragma once

#include <vulkan/vulkan.h>
#include <SDL3/SDL_log.h>

// Log and bail out of a bool-returning function when a raw Vulkan call fails.
#define DRAW2D_VK_CHECK(result) \
    do { \
        VkResult res_ = (result); \
        if (res_ != VK_SUCCESS) { \
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, \
                "Vulkan error %d at %s:%d", res_, __FILE__, __LINE__); \
            return false; \
        } \
    } while(0)

#include "draw2d/frame/Frame.h"
#include "draw2d/vulkan/Swapchain.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>
#include <cstdint>
#include <string>

namespace draw2d {

Frame::Frame(VulkanContext& context, uint32_t index)
    : context_(context)
    , index_(index)
    , descriptor_(context)
    , vertexBuffer_(context, vk::BufferUsageFlagBits::eVertexBuffer,
                    "vertex buffer " + std::to_string(index))
    , commandPool_(context) {}

bool Frame::create(vk::DescriptorSetLayout layout, const Swapchain& swapchain) {
    if (!sync_.create(context_, index_)) return false;
    if (!descriptor_.create(layout, index_)) return false;

    const std::string poolName = "frame command pool " + std::to_string(index_);
    if (!commandPool_.create(poolName.c_str())) return false;

    const vk::ImageView attachment = swapchain.imageView(index_);
    try {
        framebuffer_.emplace(context_.device(), vk::FramebufferCreateInfo{}
            .setRenderPass(swapchain.renderPass())
            .setAttachments(attachment)
            .setWidth(swapchain.extent().width)
            .setHeight(swapchain.extent().height)
            .setLayers(1));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to create framebuffer for frame %u: %s", index_, e.what());
        return false;
    }
    context_.nameObject(framebuffer(), "framebuffer " + std::to_string(index_));
    return true;
}

bool Frame::beginFrame() {
    if (lifecycle_.awaitsFence()) {
        const vk::Fence fence = **sync_.graphicsFinished;
        try {
            const vk::Result result = context_.device().waitForFences(fence, VK_TRUE, UINT64_MAX);
            if (result != vk::Result::eSuccess) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                    "Waiting for frame %u failed: %s", index_, vk::to_string(result).c_str());
                return false;
            }
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to wait for frame %u: %s", index_, e.what());
            return false;
        }
    }
    if (!lifecycle_.begin()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Frame %u was begun again without being submitted or abandoned", index_);
        return false;
    }
    if (!commandPool_.reset()) {
        lifecycle_.abandon();
        return false;
    }
    return true;
}

std::optional<vk::CommandBuffer> Frame::beginCommands() {
    auto commandBuffer = commandPool_.requestCommandBuffer();
    if (!commandBuffer) {
        return std::nullopt;
    }
    try {
        commandBuffer->begin(vk::CommandBufferBeginInfo{}
            .setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to begin command buffer: %s", e.what());
        return std::nullopt;
    }
    return commandBuffer;
}

bool Frame::finishFrame(vk::CommandBuffer commandBuffer) {
    if (!lifecycle_.canSubmit()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Frame %u is not recording", index_);
        return false;
    }

    const vk::Semaphore waitSemaphore = **sync_.imageAvailable;
    const vk::Semaphore signalSemaphore = **sync_.renderFinished;
    const vk::PipelineStageFlags waitStage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    const vk::Fence fence = **sync_.graphicsFinished;

    try {
        commandBuffer.end();
        context_.device().resetFences(fence);
        context_.graphicsQueue().submit(vk::SubmitInfo{}
            .setWaitSemaphores(waitSemaphore)
            .setWaitDstStageMask(waitStage)
            .setCommandBuffers(commandBuffer)
            .setSignalSemaphores(signalSemaphore),
            fence);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to submit frame %u: %s", index_, e.what());
        lifecycle_.abandon();
        return false;
    }
    lifecycle_.submitted();
    return true;
}

} // namespace draw2d

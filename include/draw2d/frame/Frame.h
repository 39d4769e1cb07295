#pragma once

#include "draw2d/frame/FrameDescriptor.h"
#include "draw2d/frame/FrameLifecycle.h"
#include "draw2d/frame/FrameSync.h"
#include "draw2d/vulkan/CpuBuffer.h"
#include "draw2d/vulkan/TransientCommandPool.h"

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>

namespace draw2d {

class Swapchain;
class VulkanContext;

/**
 * Everything needed to record and submit one swapchain image's worth of
 * rendering. There is one Frame per swapchain image, so nothing here is
 * shared between frames in flight.
 */
class Frame {
public:
    Frame(VulkanContext& context, uint32_t index);

    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

    bool create(vk::DescriptorSetLayout layout, const Swapchain& swapchain);

    // Wait until the GPU is done with this frame's previous submission, then
    // recycle its command buffers.
    bool beginFrame();

    // Primary command buffer already in the recording state.
    std::optional<vk::CommandBuffer> beginCommands();

    // End recording and submit. The submission waits for the image to be
    // acquired and signals renderFinished. The fence is reset right before
    // the submit.
    bool finishFrame(vk::CommandBuffer commandBuffer);

    // Give up on a recording that will not be submitted.
    void abandon() { lifecycle_.abandon(); }

    FramePhase phase() const { return lifecycle_.phase(); }

    uint32_t index() const { return index_; }
    FrameSync& sync() { return sync_; }
    FrameDescriptor& descriptor() { return descriptor_; }
    CpuBuffer& vertexBuffer() { return vertexBuffer_; }
    vk::Framebuffer framebuffer() const { return **framebuffer_; }

private:
    VulkanContext& context_;
    uint32_t index_;
    FrameSync sync_;
    FrameDescriptor descriptor_;
    CpuBuffer vertexBuffer_;
    TransientCommandPool commandPool_;
    std::optional<vk::raii::Framebuffer> framebuffer_;
    FrameLifecycle lifecycle_;
};

} // namespace draw2d

#pragma once

#include "draw2d/frame/Frame.h"
#include "draw2d/vulkan/Swapchain.h"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace draw2d {

class VulkanContext;

enum class SwapchainState {
    Ok,
    NeedsRebuild
};

/**
 * Pairs swapchain images with their Frame resources.
 *
 * Usage:
 *   auto [state, frame] = frames.acquireFrame();
 *   if (state == SwapchainState::NeedsRebuild) { frames.rebuildSwapchain(); return; }
 *   ... record into frame ...
 *   frames.returnFrame(*frame, commandBuffer);
 */
class FrameContext {
public:
    explicit FrameContext(VulkanContext& context);
    ~FrameContext();

    FrameContext(const FrameContext&) = delete;
    FrameContext& operator=(const FrameContext&) = delete;

    bool create(bool vsync);

    std::pair<SwapchainState, Frame*> acquireFrame();

    // Submit the frame's commands and present its image.
    bool returnFrame(Frame& frame, vk::CommandBuffer commandBuffer);

    // Drop an acquired frame whose recording failed. The acquired image and
    // semaphore are only recovered by a rebuild, so one is requested.
    void abandonFrame(Frame& frame);

    // Waits for the device to idle, then recreates the swapchain and frames.
    bool rebuildSwapchain();

    SwapchainState swapchainState() const { return state_; }
    const Swapchain& swapchain() const { return swapchain_; }
    vk::DescriptorSetLayout descriptorSetLayout() const { return **descriptorSetLayout_; }

private:
    bool createFrames();

    VulkanContext& context_;
    Swapchain swapchain_;
    std::optional<vk::raii::DescriptorSetLayout> descriptorSetLayout_;
    std::vector<std::unique_ptr<Frame>> frames_;

    // Spare semaphore for the next acquire. Swapped into the acquired
    // frame once that frame's previous submission has finished.
    std::optional<vk::raii::Semaphore> acquireSemaphore_;

    SwapchainState state_ = SwapchainState::Ok;
    uint32_t currentImage_ = 0;
};

} // namespace draw2d

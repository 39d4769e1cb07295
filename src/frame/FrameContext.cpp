#include "draw2d/frame/FrameContext.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>
#include <cstdint>
#include <utility>

namespace draw2d {

FrameContext::FrameContext(VulkanContext& context)
    : context_(context)
    , swapchain_(context) {}

FrameContext::~FrameContext() {
    // Nothing can be released while the GPU may still use it
    context_.waitIdle();
    frames_.clear();
}

bool FrameContext::create(bool vsync) {
    if (!swapchain_.create(vsync)) return false;

    descriptorSetLayout_ = FrameDescriptor::createLayout(context_.device());
    if (!descriptorSetLayout_) return false;

    try {
        acquireSemaphore_.emplace(context_.device(), vk::SemaphoreCreateInfo{});
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create acquire semaphore: %s", e.what());
        return false;
    }

    return createFrames();
}

bool FrameContext::createFrames() {
    frames_.clear();
    frames_.reserve(swapchain_.imageCount());
    for (uint32_t i = 0; i < swapchain_.imageCount(); ++i) {
        auto frame = std::make_unique<Frame>(context_, i);
        if (!frame->create(**descriptorSetLayout_, swapchain_)) {
            return false;
        }
        frames_.push_back(std::move(frame));
    }
    return true;
}

std::pair<SwapchainState, Frame*> FrameContext::acquireFrame() {
    if (state_ == SwapchainState::NeedsRebuild) {
        return {SwapchainState::NeedsRebuild, nullptr};
    }

    vk::Result result = vk::Result::eSuccess;
    uint32_t imageIndex = 0;
    try {
        std::tie(result, imageIndex) = context_.device().acquireNextImage2KHR(
            vk::AcquireNextImageInfoKHR{}
                .setSwapchain(swapchain_.handle())
                .setTimeout(UINT64_MAX)
                .setSemaphore(**acquireSemaphore_)
                .setDeviceMask(1));
    } catch (const vk::OutOfDateKHRError&) {
        result = vk::Result::eErrorOutOfDateKHR;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to acquire swapchain image: %s", e.what());
        state_ = SwapchainState::NeedsRebuild;
        return {SwapchainState::NeedsRebuild, nullptr};
    }

    if (result == vk::Result::eErrorOutOfDateKHR || result == vk::Result::eSuboptimalKHR) {
        state_ = SwapchainState::NeedsRebuild;
        // A suboptimal acquire still signals the semaphore. Rebuilding waits
        // for the device to idle, and the semaphore is replaced then.
        return {SwapchainState::NeedsRebuild, nullptr};
    }

    currentImage_ = imageIndex;
    Frame& frame = *frames_[imageIndex];
    if (!frame.beginFrame()) {
        state_ = SwapchainState::NeedsRebuild;
        return {SwapchainState::NeedsRebuild, nullptr};
    }

    // The frame's previous submission has finished, so its semaphore is free
    std::swap(frame.sync().imageAvailable, acquireSemaphore_);
    return {SwapchainState::Ok, &frame};
}

void FrameContext::abandonFrame(Frame& frame) {
    frame.abandon();
    state_ = SwapchainState::NeedsRebuild;
}

bool FrameContext::returnFrame(Frame& frame, vk::CommandBuffer commandBuffer) {
    if (!frame.finishFrame(commandBuffer)) {
        abandonFrame(frame);
        return false;
    }

    const vk::Semaphore renderFinished = **frame.sync().renderFinished;
    const vk::SwapchainKHR swapchain = swapchain_.handle();
    const uint32_t imageIndex = frame.index();

    vk::Result result = vk::Result::eSuccess;
    try {
        result = context_.presentQueue().presentKHR(vk::PresentInfoKHR{}
            .setWaitSemaphores(renderFinished)
            .setSwapchains(swapchain)
            .setImageIndices(imageIndex));
    } catch (const vk::OutOfDateKHRError&) {
        result = vk::Result::eErrorOutOfDateKHR;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to present: %s", e.what());
        return false;
    }

    if (result == vk::Result::eErrorOutOfDateKHR || result == vk::Result::eSuboptimalKHR) {
        state_ = SwapchainState::NeedsRebuild;
    }
    return true;
}

bool FrameContext::rebuildSwapchain() {
    context_.waitIdle();
    frames_.clear();

    // An acquire that reported suboptimal left this semaphore signaled
    try {
        acquireSemaphore_.emplace(context_.device(), vk::SemaphoreCreateInfo{});
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to recreate acquire semaphore: %s", e.what());
        return false;
    }

    if (!swapchain_.rebuild()) return false;
    if (!createFrames()) return false;

    state_ = SwapchainState::Ok;
    return true;
}

} // namespace draw2d

#include "draw2d/vulkan/Swapchain.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>
#include <SDL3/SDL_video.h>

namespace draw2d {

bool Swapchain::create(bool vsync) {
    vsync_ = vsync;
    if (!createSwapchain(VK_NULL_HANDLE)) return false;
    if (!createRenderPass()) return false;
    return true;
}

bool Swapchain::rebuild() {
    VkSwapchainKHR old = swapchain_ ? static_cast<VkSwapchainKHR>(**swapchain_) : VK_NULL_HANDLE;
    const vk::Format previousFormat = format_;

    // Views first, the old swapchain must stay alive until its replacement exists
    imageViews_.clear();
    images_.clear();

    if (!createSwapchain(old)) return false;

    if (format_ != previousFormat) {
        renderPass_.reset();
        if (!createRenderPass()) return false;
    }
    return true;
}

bool Swapchain::createSwapchain(VkSwapchainKHR oldSwapchain) {
    int width = 0;
    int height = 0;
    SDL_GetWindowSizeInPixels(context_.window(), &width, &height);

    vkb::SwapchainBuilder swapchainBuilder{context_.vkbDevice()};
    auto swapRet = swapchainBuilder
        .set_desired_format({VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR})
        .set_desired_present_mode(vsync_ ? VK_PRESENT_MODE_FIFO_KHR : VK_PRESENT_MODE_MAILBOX_KHR)
        .add_fallback_present_mode(VK_PRESENT_MODE_FIFO_KHR)
        .set_desired_extent(static_cast<uint32_t>(width), static_cast<uint32_t>(height))
        .set_old_swapchain(oldSwapchain)
        .build();

    if (!swapRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to create swapchain: %s", swapRet.error().message().c_str());
        return false;
    }

    vkb::Swapchain vkbSwapchain = swapRet.value();
    auto images = vkbSwapchain.get_images();
    auto views = vkbSwapchain.get_image_views();
    if (!images || !views) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to query swapchain images");
        vkb::destroy_swapchain(vkbSwapchain);
        return false;
    }

    // Replaces (and destroys) the old swapchain
    swapchain_.emplace(context_.device(), vkbSwapchain.swapchain);
    for (VkImage image : images.value()) {
        images_.push_back(vk::Image(image));
    }
    for (VkImageView view : views.value()) {
        imageViews_.emplace_back(context_.device(), view);
    }

    format_ = static_cast<vk::Format>(vkbSwapchain.image_format);
    extent_ = vk::Extent2D{vkbSwapchain.extent.width, vkbSwapchain.extent.height};

    context_.nameObject(handle(), "swapchain");
    SDL_Log("Swapchain: %u images at %ux%u", imageCount(), extent_.width, extent_.height);
    return true;
}

bool Swapchain::createRenderPass() {
    auto colorAttachment = vk::AttachmentDescription{}
        .setFormat(format_)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(vk::AttachmentStoreOp::eStore)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(vk::ImageLayout::ePresentSrcKHR);

    auto colorRef = vk::AttachmentReference{}
        .setAttachment(0)
        .setLayout(vk::ImageLayout::eColorAttachmentOptimal);

    auto subpass = vk::SubpassDescription{}
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(colorRef);

    // Wait for the acquire semaphore before writing color
    auto dependency = vk::SubpassDependency{}
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setSrcAccessMask({})
        .setDstStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentWrite);

    try {
        renderPass_.emplace(context_.device(), vk::RenderPassCreateInfo{}
            .setAttachments(colorAttachment)
            .setSubpasses(subpass)
            .setDependencies(dependency));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create render pass: %s", e.what());
        return false;
    }
    context_.nameObject(renderPass(), "draw2d render pass");
    return true;
}

} // namespace draw2d

#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <vector>

namespace draw2d {

class VulkanContext;

/**
 * Swapchain images, their views and the render pass that draws into them.
 *
 * The render pass clears on load and leaves the image ready to present.
 * Framebuffers belong to the frames that use them.
 */
class Swapchain {
public:
    explicit Swapchain(VulkanContext& context) : context_(context) {}

    Swapchain(const Swapchain&) = delete;
    Swapchain& operator=(const Swapchain&) = delete;

    bool create(bool vsync);

    // Recreate for the current window size. The device must be idle.
    bool rebuild();

    vk::SwapchainKHR handle() const { return **swapchain_; }
    vk::Format format() const { return format_; }
    vk::Extent2D extent() const { return extent_; }
    vk::RenderPass renderPass() const { return **renderPass_; }
    uint32_t imageCount() const { return static_cast<uint32_t>(images_.size()); }
    vk::ImageView imageView(uint32_t index) const { return *imageViews_[index]; }

private:
    bool createSwapchain(VkSwapchainKHR oldSwapchain);
    bool createRenderPass();

    VulkanContext& context_;
    bool vsync_ = true;

    std::optional<vk::raii::SwapchainKHR> swapchain_;
    std::vector<vk::Image> images_;
    std::vector<vk::raii::ImageView> imageViews_;
    std::optional<vk::raii::RenderPass> renderPass_;
    vk::Format format_ = vk::Format::eUndefined;
    vk::Extent2D extent_{0, 0};
};

} // namespace draw2d

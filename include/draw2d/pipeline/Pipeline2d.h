#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <string>

namespace draw2d {

class Swapchain;
class VulkanContext;

/**
 * The single graphics pipeline used to draw layers.
 *
 * Triangle lists of Vertex2d, alpha blended, no depth test and no culling.
 * Viewport and scissor are baked in from the swapchain extent, so the
 * pipeline has to be rebuilt whenever the swapchain is.
 *
 * With tinted = false the fragment shader ignores vertex colors.
 */
class Pipeline2d {
public:
    explicit Pipeline2d(VulkanContext& context) : context_(context) {}

    Pipeline2d(const Pipeline2d&) = delete;
    Pipeline2d& operator=(const Pipeline2d&) = delete;

    bool create(const Swapchain& swapchain,
                vk::DescriptorSetLayout descriptorSetLayout,
                const std::string& shaderDirectory,
                bool tinted);

    // Same shaders and layout, new extent and render pass.
    bool rebuild(const Swapchain& swapchain);

    vk::Pipeline pipeline() const { return **pipeline_; }
    vk::PipelineLayout layout() const { return **layout_; }

private:
    bool createPipeline(const Swapchain& swapchain);

    VulkanContext& context_;
    std::string vertexShaderPath_;
    std::string fragmentShaderPath_;

    std::optional<vk::raii::PipelineLayout> layout_;
    std::optional<vk::raii::Pipeline> pipeline_;
};

} // namespace draw2d

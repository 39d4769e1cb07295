#include "draw2d/pipeline/Pipeline2d.h"
#include "draw2d/Vertex2d.h"
#include "draw2d/pipeline/PushConstants.h"
#include "draw2d/vulkan/ShaderLoader.h"
#include "draw2d/vulkan/Swapchain.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>
#include <array>

namespace draw2d {

bool Pipeline2d::create(const Swapchain& swapchain,
                        vk::DescriptorSetLayout descriptorSetLayout,
                        const std::string& shaderDirectory,
                        bool tinted) {
    vertexShaderPath_ = shaderDirectory + "/draw2d.vert.spv";
    fragmentShaderPath_ = shaderDirectory + (tinted ? "/draw2d.frag.spv" : "/draw2d_untinted.frag.spv");

    auto pushConstantRange = vk::PushConstantRange{}
        .setStageFlags(vk::ShaderStageFlagBits::eVertex | vk::ShaderStageFlagBits::eFragment)
        .setOffset(0)
        .setSize(sizeof(PushConstants));

    try {
        layout_.emplace(context_.device(), vk::PipelineLayoutCreateInfo{}
            .setSetLayouts(descriptorSetLayout)
            .setPushConstantRanges(pushConstantRange));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create pipeline layout: %s", e.what());
        return false;
    }
    context_.nameObject(layout(), "draw2d pipeline layout");

    return createPipeline(swapchain);
}

bool Pipeline2d::rebuild(const Swapchain& swapchain) {
    pipeline_.reset();
    return createPipeline(swapchain);
}

bool Pipeline2d::createPipeline(const Swapchain& swapchain) {
    auto vertModule = ShaderLoader::loadShaderModule(context_.device(), vertexShaderPath_);
    auto fragModule = ShaderLoader::loadShaderModule(context_.device(), fragmentShaderPath_);
    if (!vertModule || !fragModule) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to load shader modules: %s, %s",
                     vertexShaderPath_.c_str(), fragmentShaderPath_.c_str());
        return false;
    }

    std::array<vk::PipelineShaderStageCreateInfo, 2> shaderStages = {{
        vk::PipelineShaderStageCreateInfo{}
            .setStage(vk::ShaderStageFlagBits::eVertex)
            .setModule(**vertModule)
            .setPName("main"),
        vk::PipelineShaderStageCreateInfo{}
            .setStage(vk::ShaderStageFlagBits::eFragment)
            .setModule(**fragModule)
            .setPName("main")
    }};

    const auto bindingDescription = Vertex2d::bindingDescription();
    const auto attributeDescriptions = Vertex2d::attributeDescriptions();

    auto vertexInputInfo = vk::PipelineVertexInputStateCreateInfo{}
        .setVertexBindingDescriptions(bindingDescription)
        .setVertexAttributeDescriptions(attributeDescriptions);

    auto inputAssembly = vk::PipelineInputAssemblyStateCreateInfo{}
        .setTopology(vk::PrimitiveTopology::eTriangleList)
        .setPrimitiveRestartEnable(false);

    const vk::Extent2D extent = swapchain.extent();
    auto viewport = vk::Viewport{}
        .setX(0.0f)
        .setY(0.0f)
        .setWidth(static_cast<float>(extent.width))
        .setHeight(static_cast<float>(extent.height))
        .setMinDepth(0.0f)
        .setMaxDepth(1.0f);
    auto scissor = vk::Rect2D{}
        .setOffset({0, 0})
        .setExtent(extent);

    auto viewportState = vk::PipelineViewportStateCreateInfo{}
        .setViewports(viewport)
        .setScissors(scissor);

    auto rasterizer = vk::PipelineRasterizationStateCreateInfo{}
        .setDepthClampEnable(false)
        .setRasterizerDiscardEnable(false)
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise)
        .setDepthBiasEnable(false);

    auto multisampling = vk::PipelineMultisampleStateCreateInfo{}
        .setSampleShadingEnable(false)
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    // Standard alpha blending
    auto colorBlendAttachment = vk::PipelineColorBlendAttachmentState{}
        .setBlendEnable(true)
        .setSrcColorBlendFactor(vk::BlendFactor::eSrcAlpha)
        .setDstColorBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setColorBlendOp(vk::BlendOp::eAdd)
        .setSrcAlphaBlendFactor(vk::BlendFactor::eOne)
        .setDstAlphaBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setAlphaBlendOp(vk::BlendOp::eAdd)
        .setColorWriteMask(vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG |
                           vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA);

    auto colorBlending = vk::PipelineColorBlendStateCreateInfo{}
        .setLogicOpEnable(false)
        .setAttachments(colorBlendAttachment);

    auto pipelineInfo = vk::GraphicsPipelineCreateInfo{}
        .setStages(shaderStages)
        .setPVertexInputState(&vertexInputInfo)
        .setPInputAssemblyState(&inputAssembly)
        .setPViewportState(&viewportState)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPDepthStencilState(nullptr)
        .setPColorBlendState(&colorBlending)
        .setLayout(layout())
        .setRenderPass(swapchain.renderPass())
        .setSubpass(0);

    try {
        pipeline_.emplace(context_.device(), nullptr, pipelineInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create graphics pipeline: %s", e.what());
        return false;
    }
    context_.nameObject(pipeline(), "draw2d pipeline");
    return true;
}

} // namespace draw2d

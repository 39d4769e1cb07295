#include "draw2d/frame/FrameDescriptor.h"
#include "draw2d/atlas/TextureAtlas.h"
#include "draw2d/vulkan/VulkanContext.h"

#include "shaders/bindings.h"

#include <SDL3/SDL_log.h>
#include <array>
#include <string>

namespace draw2d {

static_assert(MAX_SUPPORTED_TEXTURES == DRAW2D_MAX_TEXTURES,
              "shader texture array size must match the atlas");

std::optional<vk::raii::DescriptorSetLayout> FrameDescriptor::createLayout(const vk::raii::Device& device) {
    const std::array<vk::DescriptorSetLayoutBinding, 2> bindings = {
        vk::DescriptorSetLayoutBinding{}
            .setBinding(BINDING_FRAME_UBO)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setDescriptorCount(1)
            .setStageFlags(vk::ShaderStageFlagBits::eVertex),
        vk::DescriptorSetLayoutBinding{}
            .setBinding(BINDING_TEXTURES)
            .setDescriptorType(vk::DescriptorType::eCombinedImageSampler)
            .setDescriptorCount(MAX_SUPPORTED_TEXTURES)
            .setStageFlags(vk::ShaderStageFlagBits::eFragment),
    };

    try {
        return vk::raii::DescriptorSetLayout(device,
            vk::DescriptorSetLayoutCreateInfo{}.setBindings(bindings));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create frame descriptor set layout: %s", e.what());
        return std::nullopt;
    }
}

FrameDescriptor::FrameDescriptor(VulkanContext& context)
    : context_(context)
    , uniformBuffer_(context, vk::BufferUsageFlagBits::eUniformBuffer, "frame uniforms") {}

bool FrameDescriptor::create(vk::DescriptorSetLayout layout, uint32_t frameIndex) {
    const std::array<vk::DescriptorPoolSize, 2> poolSizes = {
        vk::DescriptorPoolSize{}
            .setType(vk::DescriptorType::eUniformBuffer)
            .setDescriptorCount(1),
        vk::DescriptorPoolSize{}
            .setType(vk::DescriptorType::eCombinedImageSampler)
            .setDescriptorCount(MAX_SUPPORTED_TEXTURES),
    };

    try {
        pool_.emplace(context_.device(), vk::DescriptorPoolCreateInfo{}
            .setMaxSets(1)
            .setPoolSizes(poolSizes));
        auto sets = (*context_.device()).allocateDescriptorSets(vk::DescriptorSetAllocateInfo{}
            .setDescriptorPool(**pool_)
            .setSetLayouts(layout));
        set_ = sets.front();
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to create descriptor set for frame %u: %s", frameIndex, e.what());
        return false;
    }
    context_.nameObject(set_, "frame descriptor " + std::to_string(frameIndex));

    // Fixed size, so the buffer handle never changes after this
    if (!uniformBuffer_.reserve(sizeof(FrameUniforms))) {
        return false;
    }
    if (!updateUniforms(FrameUniforms{})) {
        return false;
    }

    auto bufferInfo = vk::DescriptorBufferInfo{}
        .setBuffer(uniformBuffer_.buffer())
        .setOffset(0)
        .setRange(sizeof(FrameUniforms));
    context_.device().updateDescriptorSets(vk::WriteDescriptorSet{}
        .setDstSet(set_)
        .setDstBinding(BINDING_FRAME_UBO)
        .setDstArrayElement(0)
        .setDescriptorType(vk::DescriptorType::eUniformBuffer)
        .setBufferInfo(bufferInfo), {});
    return true;
}

bool FrameDescriptor::updateUniforms(const FrameUniforms& uniforms) {
    return uniformBuffer_.writeValue(uniforms);
}

bool FrameDescriptor::updateAtlas(const TextureAtlas& atlas) {
    const AtlasVersion current = atlas.version();
    if (!current.isOutOfDate(atlasVersion_)) {
        return false;
    }

    const std::vector<vk::DescriptorImageInfo> imageInfos = atlas.buildDescriptorImageInfos();
    context_.device().updateDescriptorSets(vk::WriteDescriptorSet{}
        .setDstSet(set_)
        .setDstBinding(BINDING_TEXTURES)
        .setDstArrayElement(0)
        .setDescriptorType(vk::DescriptorType::eCombinedImageSampler)
        .setImageInfo(imageInfos), {});

    atlasVersion_ = current;
    return true;
}

} // namespace draw2d

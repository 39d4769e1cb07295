#pragma once

#include "draw2d/atlas/AtlasVersion.h"
#include "draw2d/vulkan/CpuBuffer.h"

#include <glm/glm.hpp>
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>

namespace draw2d {

class TextureAtlas;
class VulkanContext;

// Matches the FrameUniforms block in draw2d.vert (std140).
struct FrameUniforms {
    glm::mat4 projection{1.0f};
};

/**
 * Per-frame descriptor set:
 *   binding 0 - FrameUniforms uniform buffer (vertex stage)
 *   binding 1 - MAX_SUPPORTED_TEXTURES combined image samplers (fragment stage)
 *
 * The texture array is only rewritten when the atlas version moves on.
 */
class FrameDescriptor {
public:
    static std::optional<vk::raii::DescriptorSetLayout> createLayout(const vk::raii::Device& device);

    explicit FrameDescriptor(VulkanContext& context);

    FrameDescriptor(const FrameDescriptor&) = delete;
    FrameDescriptor& operator=(const FrameDescriptor&) = delete;

    bool create(vk::DescriptorSetLayout layout, uint32_t frameIndex);

    bool updateUniforms(const FrameUniforms& uniforms);

    // Returns true when the texture array was rewritten.
    bool updateAtlas(const TextureAtlas& atlas);

    vk::DescriptorSet set() const { return set_; }
    const AtlasVersion& atlasVersion() const { return atlasVersion_; }

private:
    VulkanContext& context_;
    std::optional<vk::raii::DescriptorPool> pool_;
    vk::DescriptorSet set_;
    CpuBuffer uniformBuffer_;
    AtlasVersion atlasVersion_ = AtlasVersion::newOutOfDate();
};

} // namespace draw2d

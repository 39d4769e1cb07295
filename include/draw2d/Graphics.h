#pragma once

#include "draw2d/atlas/CachedAtlas.h"
#include "draw2d/config/GraphicsConfig.h"
#include "draw2d/frame/FrameContext.h"
#include "draw2d/layer/LayerStack.h"
#include "draw2d/pipeline/Pipeline2d.h"
#include "draw2d/vulkan/SamplerBuilder.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL.h>
#include <glm/glm.hpp>
#include <array>
#include <filesystem>
#include <memory>
#include <optional>

namespace draw2d {

/**
 * The renderer. Owns the Vulkan device, the swapchain frames, the 2D
 * pipeline, the texture atlas and the layer stack.
 *
 * Usage:
 *   auto graphics = Graphics::create(window.handle(), config);
 *   auto layer = graphics->addLayerToTop();
 *   graphics->getLayer(layer)->pushBatch(batch);
 *   while (running) graphics->render();
 */
class Graphics {
public:
    static std::unique_ptr<Graphics> create(SDL_Window* window, const GraphicsConfig& config);

    ~Graphics();

    Graphics(const Graphics&) = delete;
    Graphics& operator=(const Graphics&) = delete;

    LayerHandle addLayerToTop() { return layers_.addLayerToTop(); }
    LayerHandle addLayerToBottom() { return layers_.addLayerToBottom(); }
    Layer* getLayer(const LayerHandle& handle) { return layers_.getLayer(handle); }

    std::optional<TextureHandle> addTexture(const std::filesystem::path& path);
    // Loads into a new slot even when the file is already in the atlas, so the
    // copy can be bound to its own sampler.
    std::optional<TextureHandle> addTextureCopy(const std::filesystem::path& path);
    std::optional<SamplerHandle> addSampler(const SamplerBuilder& builder);
    bool bindSamplerToTexture(SamplerHandle sampler, TextureHandle texture);

    // Applied to every layer, after the layer's own projection.
    void setProjection(const glm::mat4& projection) { uniforms_.projection = projection; }
    void setClearColor(const std::array<float, 4>& rgba) { clearColor_ = rgba; }

    // Draw every layer into the next swapchain image and present it.
    // Returns false only for unrecoverable errors.
    bool render();

    bool rebuildSwapchain();

    VulkanContext& context() { return *context_; }

private:
    Graphics() = default;

    bool init(SDL_Window* window, const GraphicsConfig& config);
    bool writeFrameData(Frame& frame);
    void drawLayers(vk::CommandBuffer cmd, Frame& frame) const;

    // Declaration order is destruction order in reverse: the context goes last
    std::unique_ptr<VulkanContext> context_;
    std::unique_ptr<FrameContext> frames_;
    std::unique_ptr<Pipeline2d> pipeline_;
    std::unique_ptr<CachedAtlas> atlas_;
    LayerStack layers_;

    FrameUniforms uniforms_;
    std::array<float, 4> clearColor_ = {0.0f, 0.0f, 0.0f, 1.0f};
};

} // namespace draw2d

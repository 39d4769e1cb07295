#include "draw2d/Graphics.h"
#include "draw2d/atlas/GpuAtlas.h"
#include "draw2d/pipeline/PushConstants.h"

#include <SDL3/SDL_log.h>

namespace draw2d {

std::unique_ptr<Graphics> Graphics::create(SDL_Window* window, const GraphicsConfig& config) {
    std::unique_ptr<Graphics> graphics(new Graphics());
    if (!graphics->init(window, config)) {
        return nullptr;
    }
    return graphics;
}

Graphics::~Graphics() {
    if (context_) {
        context_->waitIdle();
    }
    atlas_.reset();
    pipeline_.reset();
    frames_.reset();
}

bool Graphics::init(SDL_Window* window, const GraphicsConfig& config) {
    VulkanContextSettings settings;
    settings.applicationName = config.window.title;
    settings.enableValidation = config.validation;
    settings.allocator = config.allocator.toSettings();

    context_ = std::make_unique<VulkanContext>();
    if (!context_->init(window, settings)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to initialize Vulkan context");
        return false;
    }

    frames_ = std::make_unique<FrameContext>(*context_);
    if (!frames_->create(config.vsync)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create frames");
        return false;
    }

    pipeline_ = std::make_unique<Pipeline2d>(*context_);
    if (!pipeline_->create(frames_->swapchain(), frames_->descriptorSetLayout(),
                           config.shaderDirectory, config.tinted)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create 2d pipeline");
        return false;
    }

    auto gpuAtlas = GpuAtlas::create(*context_);
    if (!gpuAtlas) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create texture atlas");
        return false;
    }
    atlas_ = std::make_unique<CachedAtlas>(std::move(gpuAtlas));

    clearColor_ = config.clearColor;

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Graphics initialized: %ux%u, %u swapchain images",
                frames_->swapchain().extent().width, frames_->swapchain().extent().height,
                frames_->swapchain().imageCount());
    return true;
}

std::optional<TextureHandle> Graphics::addTexture(const std::filesystem::path& path) {
    return atlas_->addTexture(path);
}

std::optional<TextureHandle> Graphics::addTextureCopy(const std::filesystem::path& path) {
    return atlas_->addTextureUncached(path);
}

std::optional<SamplerHandle> Graphics::addSampler(const SamplerBuilder& builder) {
    auto sampler = builder.build(context_->device());
    if (!sampler) {
        return std::nullopt;
    }
    return atlas_->addSampler(std::move(*sampler));
}

bool Graphics::bindSamplerToTexture(SamplerHandle sampler, TextureHandle texture) {
    return atlas_->bindSamplerToTexture(sampler, texture);
}

bool Graphics::rebuildSwapchain() {
    if (!frames_->rebuildSwapchain()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to rebuild swapchain");
        return false;
    }
    if (!pipeline_->rebuild(frames_->swapchain())) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to rebuild pipeline");
        return false;
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Swapchain rebuilt at %ux%u",
                 frames_->swapchain().extent().width, frames_->swapchain().extent().height);
    return true;
}

bool Graphics::render() {
    auto [state, frame] = frames_->acquireFrame();
    if (state == SwapchainState::NeedsRebuild) {
        return rebuildSwapchain();
    }

    auto cmd = frame->beginCommands();
    if (!cmd) {
        frames_->abandonFrame(*frame);
        return false;
    }

    const bool hasVertices = layers_.vertexCount() > 0;
    if (hasVertices && !writeFrameData(*frame)) {
        frames_->abandonFrame(*frame);
        return false;
    }

    vk::ClearValue clearValue;
    clearValue.color = vk::ClearColorValue(clearColor_);

    const vk::Extent2D extent = frames_->swapchain().extent();
    cmd->beginRenderPass(vk::RenderPassBeginInfo{}
        .setRenderPass(frames_->swapchain().renderPass())
        .setFramebuffer(frame->framebuffer())
        .setRenderArea(vk::Rect2D{{0, 0}, extent})
        .setClearValues(clearValue),
        vk::SubpassContents::eInline);

    if (hasVertices) {
        drawLayers(*cmd, *frame);
    }

    cmd->endRenderPass();

    if (!frames_->returnFrame(*frame, *cmd)) {
        return false;
    }
    if (frames_->swapchainState() == SwapchainState::NeedsRebuild) {
        return rebuildSwapchain();
    }
    return true;
}

bool Graphics::writeFrameData(Frame& frame) {
    if (!frame.descriptor().updateUniforms(uniforms_)) {
        return false;
    }
    frame.descriptor().updateAtlas(*atlas_);

    CpuBuffer& vertexBuffer = frame.vertexBuffer();
    if (!vertexBuffer.reserve(layers_.vertexCount() * sizeof(Vertex2d))) {
        return false;
    }

    vk::DeviceSize offset = 0;
    for (const std::vector<Vertex2d>* vertices : layers_.vertices()) {
        const vk::DeviceSize size = vertices->size() * sizeof(Vertex2d);
        if (!vertexBuffer.write(vertices->data(), size, offset)) {
            return false;
        }
        offset += size;
    }
    return true;
}

void Graphics::drawLayers(vk::CommandBuffer cmd, Frame& frame) const {
    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, pipeline_->pipeline());
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, pipeline_->layout(),
                           0, frame.descriptor().set(), {});
    cmd.bindVertexBuffers(0, frame.vertexBuffer().buffer(), vk::DeviceSize{0});

    const vk::ShaderStageFlags stages = vk::ShaderStageFlagBits::eVertex | vk::ShaderStageFlagBits::eFragment;
    uint32_t firstVertex = 0;
    for (const Layer* layer : layers_.layers()) {
        for (const Batch& batch : layer->batches()) {
            const uint32_t count = static_cast<uint32_t>(batch.vertices.size());
            if (count == 0) continue;

            PushConstants push;
            push.projection = layer->projection();
            push.textureIndex = batch.texture.index();
            cmd.pushConstants(pipeline_->layout(), stages, 0, sizeof(PushConstants), &push);
            cmd.draw(count, 1, firstVertex, 0);
            firstVertex += count;
        }
    }
}

} // namespace draw2d

#define VMA_IMPLEMENTATION
#include "draw2d/vulkan/VulkanContext.h"
#include "draw2d/vulkan/VulkanChecks.h"

#include <SDL3/SDL_vulkan.h>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cstdlib>

// Required for dynamic dispatch loader - only define in one .cpp file
VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace draw2d {

namespace {

VKAPI_ATTR VkBool32 VKAPI_CALL debugMessenger(
        VkDebugUtilsMessageSeverityFlagBitsEXT severity,
        VkDebugUtilsMessageTypeFlagsEXT,
        const VkDebugUtilsMessengerCallbackDataEXT* data,
        void*) {
    const char* message = data && data->pMessage ? data->pMessage : "(no message)";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        SDL_LogError(SDL_LOG_CATEGORY_GPU, "%s", message);
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        SDL_LogWarn(SDL_LOG_CATEGORY_GPU, "%s", message);
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) {
        SDL_LogInfo(SDL_LOG_CATEGORY_GPU, "%s", message);
    } else {
        SDL_LogVerbose(SDL_LOG_CATEGORY_GPU, "%s", message);
    }
    return VK_FALSE;
}

} // namespace

VulkanContext::~VulkanContext() {
    shutdown();
}

bool VulkanContext::init(SDL_Window* window, const VulkanContextSettings& settings) {
    window_ = window;

    if (!createInstance(settings)) return false;
    if (!createSurface()) return false;
    if (!selectPhysicalDevice()) return false;
    if (!createLogicalDevice()) return false;
    if (!createAllocator(settings)) return false;
    if (!createUploadPool()) return false;

    return true;
}

void VulkanContext::shutdown() {
    if (device_ != VK_NULL_HANDLE) {
        vk::Device(device_).waitIdle();
    }

    uploadPool_.reset();

    // Renders the allocator report and returns pooled blocks to VMA
    deviceAllocator_.reset();

    if (vma_ != VK_NULL_HANDLE) {
        vmaDestroyAllocator(vma_);
        vma_ = VK_NULL_HANDLE;
    }

    // The RAII wrappers own the handles vkb created, but the instance must
    // outlive the surface and debug messenger, so release and destroy in order.
    if (raiiDevice_) {
        raiiDevice_->release();
        raiiDevice_.reset();
    }
    raiiPhysicalDevice_.reset();
    if (raiiInstance_) {
        raiiInstance_->release();
        raiiInstance_.reset();
    }

    if (device_ != VK_NULL_HANDLE) {
        vk::Device(device_).destroy();
        device_ = VK_NULL_HANDLE;
    }

    if (surface_ != VK_NULL_HANDLE) {
        vk::Instance(instance_).destroySurfaceKHR(surface_);
        surface_ = VK_NULL_HANDLE;
    }

    if (instance_ != VK_NULL_HANDLE) {
        vkb::destroy_debug_utils_messenger(instance_, vkbInstance_.debug_messenger);
        vk::Instance(instance_).destroy();
        instance_ = VK_NULL_HANDLE;
    }
}

bool VulkanContext::createInstance(const VulkanContextSettings& settings) {
#ifdef NDEBUG
    const bool enableValidation = false;
    (void)settings.enableValidation;
#else
    // Can be overridden via environment variable for profiling debug builds
    const bool enableValidation = settings.enableValidation &&
        std::getenv("DISABLE_VULKAN_VALIDATION") == nullptr;
#endif

    if (!enableValidation) {
        SDL_Log("Vulkan validation layers disabled");
    }

    vkb::InstanceBuilder builder;
    builder.set_app_name(settings.applicationName.c_str())
        .set_engine_name("draw2d")
        .request_validation_layers(enableValidation)
        .require_api_version(1, 2, 0);
    if (enableValidation) {
        builder.set_debug_callback(debugMessenger);
    }

    auto instRet = builder.build();
    if (!instRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to create Vulkan instance: %s", instRet.error().message().c_str());
        return false;
    }

    vkbInstance_ = instRet.value();
    instance_ = vkbInstance_.instance;
    debugUtils_ = vkbInstance_.debug_messenger != VK_NULL_HANDLE;

    // Initialize vulkan-hpp dynamic dispatcher with instance-level functions
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vk::Instance(instance_), vkGetInstanceProcAddr);

    raiiInstance_ = std::make_unique<vk::raii::Instance>(raiiContext_, instance_);
    return true;
}

bool VulkanContext::createSurface() {
    if (!SDL_Vulkan_CreateSurface(window_, instance_, nullptr, &surface_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to create Vulkan surface: %s", SDL_GetError());
        return false;
    }
    return true;
}

bool VulkanContext::selectPhysicalDevice() {
    vkb::PhysicalDeviceSelector selector{vkbInstance_};
    auto physRet = selector.set_minimum_version(1, 2)
        .set_surface(surface_)
        .select();

    if (!physRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to select physical device: %s", physRet.error().message().c_str());
        return false;
    }

    vkbPhysicalDevice_ = physRet.value();
    physicalDevice_ = vkbPhysicalDevice_.physical_device;

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(physicalDevice_, &props);
    SDL_Log("Selected physical device: %s (Vulkan %u.%u.%u)",
        props.deviceName,
        VK_API_VERSION_MAJOR(props.apiVersion),
        VK_API_VERSION_MINOR(props.apiVersion),
        VK_API_VERSION_PATCH(props.apiVersion));

    bufferImageGranularity_ = props.limits.bufferImageGranularity;
    vkGetPhysicalDeviceMemoryProperties(physicalDevice_, &memoryProperties_);

    raiiPhysicalDevice_ = std::make_unique<vk::raii::PhysicalDevice>(*raiiInstance_, physicalDevice_);
    return true;
}

bool VulkanContext::createLogicalDevice() {
    vkb::DeviceBuilder deviceBuilder{vkbPhysicalDevice_};
    auto devRet = deviceBuilder.build();
    if (!devRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "Failed to create logical device: %s", devRet.error().message().c_str());
        return false;
    }

    vkbDevice_ = devRet.value();
    device_ = vkbDevice_.device;

    // Initialize vulkan-hpp dynamic dispatcher with device-level functions
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vk::Device(device_));

    raiiDevice_ = std::make_unique<vk::raii::Device>(*raiiPhysicalDevice_, device_);

    auto graphicsQueueRet = vkbDevice_.get_queue(vkb::QueueType::graphics);
    if (!graphicsQueueRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to get graphics queue");
        return false;
    }
    graphicsQueue_ = graphicsQueueRet.value();

    auto presentQueueRet = vkbDevice_.get_queue(vkb::QueueType::present);
    if (!presentQueueRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to get present queue");
        return false;
    }
    presentQueue_ = presentQueueRet.value();

    return true;
}

bool VulkanContext::createAllocator(const VulkanContextSettings& settings) {
    VmaAllocatorCreateInfo allocatorInfo{};
    allocatorInfo.physicalDevice = physicalDevice_;
    allocatorInfo.device = device_;
    allocatorInfo.instance = instance_;
    allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_2;

    DRAW2D_VK_CHECK(vmaCreateAllocator(&allocatorInfo, &vma_));

    deviceAllocator_ = alloc::buildStandardAllocator(memoryProperties_, vma_, settings.allocator);
    return true;
}

bool VulkanContext::createUploadPool() {
    try {
        uploadPool_.emplace(*raiiDevice_, vk::CommandPoolCreateInfo{}
            .setFlags(vk::CommandPoolCreateFlagBits::eTransient |
                      vk::CommandPoolCreateFlagBits::eResetCommandBuffer)
            .setQueueFamilyIndex(graphicsQueueFamily()));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create upload command pool: %s", e.what());
        return false;
    }
    nameObject(vk::CommandPool(**uploadPool_), "upload command pool");
    return true;
}

void VulkanContext::waitIdle() {
    if (device_ != VK_NULL_HANDLE) {
        vk::Device(device_).waitIdle();
    }
}

uint32_t VulkanContext::graphicsQueueFamily() const {
    return vkbDevice_.get_queue_index(vkb::QueueType::graphics).value();
}

std::optional<uint32_t> VulkanContext::findMemoryTypeIndex(uint32_t memoryTypeBits,
                                                           vk::MemoryPropertyFlags properties) const {
    const auto wanted = static_cast<VkMemoryPropertyFlags>(properties);
    for (uint32_t i = 0; i < memoryProperties_.memoryTypeCount; ++i) {
        const bool allowed = (memoryTypeBits & (1u << i)) != 0;
        const bool matches = (memoryProperties_.memoryTypes[i].propertyFlags & wanted) == wanted;
        if (allowed && matches) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<alloc::Allocation> VulkanContext::allocateMemory(const vk::MemoryRequirements& requirements,
                                                               vk::MemoryPropertyFlags properties) {
    auto typeIndex = findMemoryTypeIndex(requirements.memoryTypeBits, properties);
    if (!typeIndex) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "No memory type matches bits 0x%x with properties %s",
            requirements.memoryTypeBits, vk::to_string(properties).c_str());
        return std::nullopt;
    }

    alloc::AllocationRequest request;
    request.size = requirements.size;
    // Buffers and optimal images share pooled blocks
    request.alignment = std::max<VkDeviceSize>(requirements.alignment, bufferImageGranularity_);
    request.memoryTypeIndex = *typeIndex;

    std::lock_guard<std::mutex> lock(allocatorMutex_);
    return deviceAllocator_->allocate(request);
}

bool VulkanContext::freeMemory(const alloc::Allocation& allocation) {
    std::lock_guard<std::mutex> lock(allocatorMutex_);
    return deviceAllocator_->free(allocation);
}

void* VulkanContext::mapMemory(const alloc::Allocation& allocation) {
    if (allocation.isNull() || allocation.backing == VK_NULL_HANDLE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot map a null allocation");
        return nullptr;
    }
    void* data = nullptr;
    if (vmaMapMemory(vma_, allocation.backing, &data) != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to map device memory");
        return nullptr;
    }
    return static_cast<char*>(data) + (allocation.offset - allocation.backingOffset);
}

void VulkanContext::unmapMemory(const alloc::Allocation& allocation) {
    if (allocation.backing != VK_NULL_HANDLE) {
        vmaUnmapMemory(vma_, allocation.backing);
    }
}

void VulkanContext::nameObject(vk::ObjectType type, uint64_t handle, const std::string& name) const {
    if (!debugUtils_ || !raiiDevice_ || !raiiDevice_->getDispatcher()->vkSetDebugUtilsObjectNameEXT) {
        return;
    }
    raiiDevice_->setDebugUtilsObjectNameEXT(vk::DebugUtilsObjectNameInfoEXT{}
        .setObjectType(type)
        .setObjectHandle(handle)
        .setPObjectName(name.c_str()));
}

bool VulkanContext::submitAndWaitIdle(const std::function<void(vk::CommandBuffer)>& record) {
    try {
        vk::raii::CommandBuffers buffers(*raiiDevice_, vk::CommandBufferAllocateInfo{}
            .setCommandPool(**uploadPool_)
            .setLevel(vk::CommandBufferLevel::ePrimary)
            .setCommandBufferCount(1));
        vk::CommandBuffer cmd = *buffers[0];

        cmd.begin(vk::CommandBufferBeginInfo{}
            .setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        record(cmd);
        cmd.end();

        vk::Queue queue(graphicsQueue_);
        queue.submit(vk::SubmitInfo{}.setCommandBuffers(cmd), nullptr);
        queue.waitIdle();
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "One-shot submission failed: %s", e.what());
        return false;
    }
    return true;
}

} // namespace draw2d

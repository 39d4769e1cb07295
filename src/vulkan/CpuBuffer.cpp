#include "draw2d/vulkan/CpuBuffer.h"
#include "draw2d/vulkan/VulkanContext.h"

#include <SDL3/SDL_log.h>
#include <cstring>

namespace draw2d {

CpuBuffer::CpuBuffer(VulkanContext& context, vk::BufferUsageFlags usage, std::string name)
    : context_(context)
    , usage_(usage)
    , name_(std::move(name)) {}

CpuBuffer::~CpuBuffer() {
    destroy();
}

void CpuBuffer::destroy() {
    if (mapped_) {
        context_.unmapMemory(allocation_);
        mapped_ = nullptr;
    }
    buffer_.reset();
    if (!allocation_.isNull()) {
        if (!context_.freeMemory(allocation_)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to free memory for %s", name_.c_str());
        }
        allocation_ = alloc::Allocation::null();
    }
    capacity_ = 0;
}

bool CpuBuffer::reserve(vk::DeviceSize size) {
    if (size <= capacity_) {
        return true;
    }

    vk::DeviceSize newCapacity = capacity_ == 0 ? size : capacity_;
    while (newCapacity < size) {
        newCapacity *= 2;
    }

    destroy();

    try {
        buffer_.emplace(context_.device(), vk::BufferCreateInfo{}
            .setSize(newCapacity)
            .setUsage(usage_)
            .setSharingMode(vk::SharingMode::eExclusive));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create %s: %s", name_.c_str(), e.what());
        return false;
    }

    auto allocation = context_.allocateMemory(buffer_->getMemoryRequirements(),
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent);
    if (!allocation) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to allocate memory for %s", name_.c_str());
        buffer_.reset();
        return false;
    }
    allocation_ = *allocation;

    try {
        buffer_->bindMemory(allocation_.memory, allocation_.offset);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to bind memory for %s: %s", name_.c_str(), e.what());
        destroy();
        return false;
    }

    mapped_ = context_.mapMemory(allocation_);
    if (!mapped_) {
        destroy();
        return false;
    }

    capacity_ = newCapacity;
    context_.nameObject(buffer(), name_);
    return true;
}

bool CpuBuffer::write(const void* data, vk::DeviceSize size, vk::DeviceSize offset) {
    if (size == 0) {
        return true;
    }
    if (!reserve(offset + size)) {
        return false;
    }
    std::memcpy(static_cast<char*>(mapped_) + offset, data, static_cast<size_t>(size));
    return true;
}

} // namespace draw2d

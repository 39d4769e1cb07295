#pragma once

#include "draw2d/alloc/Allocation.h"

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <string>

namespace draw2d {

class VulkanContext;

/**
 * Host-visible, coherent buffer that stays mapped for its whole life.
 *
 * write() grows the buffer (by doubling) when the data does not fit, so the
 * vk::Buffer handle can change between writes.
 */
class CpuBuffer {
public:
    CpuBuffer(VulkanContext& context, vk::BufferUsageFlags usage, std::string name = "cpu buffer");
    ~CpuBuffer();

    CpuBuffer(const CpuBuffer&) = delete;
    CpuBuffer& operator=(const CpuBuffer&) = delete;

    bool write(const void* data, vk::DeviceSize size, vk::DeviceSize offset = 0);

    template <typename T>
    bool writeValue(const T& value) {
        return write(&value, sizeof(T));
    }

    // Make room for at least `size` bytes. Existing contents are discarded when it grows.
    bool reserve(vk::DeviceSize size);

    vk::Buffer buffer() const { return buffer_ ? **buffer_ : vk::Buffer(); }
    vk::DeviceSize capacity() const { return capacity_; }
    void* mapped() const { return mapped_; }

private:
    void destroy();

    VulkanContext& context_;
    vk::BufferUsageFlags usage_;
    std::string name_;

    std::optional<vk::raii::Buffer> buffer_;
    alloc::Allocation allocation_;
    vk::DeviceSize capacity_ = 0;
    void* mapped_ = nullptr;
};

} // namespace draw2d

#pragma once

#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <string>
#include <vector>

namespace draw2d {
namespace ShaderLoader {

std::optional<std::vector<char>> readFile(const std::string& filename);
std::optional<vk::raii::ShaderModule> createShaderModule(const vk::raii::Device& device,
                                                         const std::vector<char>& code);
std::optional<vk::raii::ShaderModule> loadShaderModule(const vk::raii::Device& device,
                                                       const std::string& path);

} // namespace ShaderLoader
} // namespace draw2d

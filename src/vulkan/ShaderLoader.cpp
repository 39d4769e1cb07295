#include "draw2d/vulkan/ShaderLoader.h"

#include <SDL3/SDL_log.h>
#include <fstream>

namespace draw2d {
namespace ShaderLoader {

std::optional<std::vector<char>> readFile(const std::string& filename) {
    std::ifstream file(filename, std::ios::ate | std::ios::binary);

    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to open file: %s", filename.c_str());
        return std::nullopt;
    }

    size_t fileSize = static_cast<size_t>(file.tellg());
    std::vector<char> buffer(fileSize);

    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(fileSize));
    file.close();

    return buffer;
}

std::optional<vk::raii::ShaderModule> createShaderModule(const vk::raii::Device& device,
                                                         const std::vector<char>& code) {
    if (code.empty() || code.size() % 4 != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "SPIR-V code size %zu is not a multiple of 4", code.size());
        return std::nullopt;
    }

    try {
        return vk::raii::ShaderModule(device, vk::ShaderModuleCreateInfo{}
            .setCodeSize(code.size())
            .setPCode(reinterpret_cast<const uint32_t*>(code.data())));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create shader module: %s", e.what());
        return std::nullopt;
    }
}

std::optional<vk::raii::ShaderModule> loadShaderModule(const vk::raii::Device& device,
                                                       const std::string& path) {
    auto code = readFile(path);
    if (!code) {
        return std::nullopt;
    }
    return createShaderModule(device, *code);
}

} // namespace ShaderLoader
} // namespace draw2d

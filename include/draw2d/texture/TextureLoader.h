#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace draw2d {

struct ImageData {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgba;
};

namespace TextureLoader {

// Decode any format stb_image understands into tightly packed RGBA8.
std::optional<ImageData> loadRgba(const std::string& path);

} // namespace TextureLoader
} // namespace draw2d

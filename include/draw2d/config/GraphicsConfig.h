#pragma once

#include "draw2d/alloc/StandardAllocator.h"

#include <nlohmann/json_fwd.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace draw2d {

struct WindowConfig {
    std::string title = "draw2d";
    int width = 1366;
    int height = 768;
    bool fullscreen = false;
};

struct AllocatorConfig {
    uint64_t blockSizeMiB = 64;
    uint64_t pageSize = 256;
    // Requests below this go to the pool, so it may not exceed the block size.
    uint64_t largeThresholdMiB = 16;
    bool report = true;
    bool forceOffsets = false;

    alloc::StandardAllocatorSettings toSettings() const;
};

/**
 * Startup settings for a draw2d application.
 *
 * Every JSON field is optional. Missing fields keep the defaults below.
 */
struct GraphicsConfig {
    WindowConfig window;
    bool vsync = true;
    bool validation = true;
    std::array<float, 4> clearColor = {0.0f, 0.0f, 0.0f, 1.0f};
    std::string logLevel = "info";
    std::string shaderDirectory = "shaders";
    bool tinted = true;
    AllocatorConfig allocator;

    // nullopt when a field has the wrong type or value
    static std::optional<GraphicsConfig> fromJson(const nlohmann::json& json);

    // nullopt when the file is missing or is not valid JSON
    static std::optional<GraphicsConfig> load(const std::string& path);
};

} // namespace draw2d

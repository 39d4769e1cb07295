#include "draw2d/config/GraphicsConfig.h"
#include "draw2d/alloc/MemUnit.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>

using json = nlohmann::json;

namespace draw2d {

namespace {

// Sizes must be JSON unsigned integers. nlohmann would wrap a negative value.
bool readSize(const json& object, const char* key, uint64_t& out) {
    if (!object.contains(key)) {
        return true;
    }
    const auto& value = object[key];
    if (!value.is_number_unsigned()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GraphicsConfig: allocator.%s must be a non-negative integer", key);
        return false;
    }
    out = value.get<uint64_t>();
    return true;
}

} // namespace

alloc::StandardAllocatorSettings AllocatorConfig::toSettings() const {
    alloc::StandardAllocatorSettings settings;
    settings.blockSize = alloc::toBytes(alloc::MemUnit::MiB, blockSizeMiB);
    settings.pageSize = pageSize;
    settings.largeThreshold = alloc::toBytes(alloc::MemUnit::MiB, largeThresholdMiB);
    settings.report = report;
    settings.forceOffsets = forceOffsets;
    return settings;
}

std::optional<GraphicsConfig> GraphicsConfig::fromJson(const json& j) {
    GraphicsConfig config;
    if (!j.is_object()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GraphicsConfig: top level must be an object");
        return std::nullopt;
    }

    try {
        if (j.contains("window")) {
            const auto& w = j["window"];
            config.window.title = w.value("title", config.window.title);
            config.window.width = w.value("width", config.window.width);
            config.window.height = w.value("height", config.window.height);
            config.window.fullscreen = w.value("fullscreen", config.window.fullscreen);
        }

        config.vsync = j.value("vsync", config.vsync);
        config.validation = j.value("validation", config.validation);
        config.logLevel = j.value("log_level", config.logLevel);
        config.shaderDirectory = j.value("shader_directory", config.shaderDirectory);
        config.tinted = j.value("tinted", config.tinted);

        if (j.contains("clear_color")) {
            const auto& color = j["clear_color"];
            if (!color.is_array() || color.size() != 4) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                    "GraphicsConfig: clear_color must be an array of 4 numbers");
                return std::nullopt;
            }
            for (size_t i = 0; i < 4; ++i) {
                config.clearColor[i] = color[i].get<float>();
            }
        }

        if (j.contains("allocator")) {
            const auto& a = j["allocator"];
            if (!a.is_object()) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GraphicsConfig: allocator must be an object");
                return std::nullopt;
            }
            if (!readSize(a, "block_size_mib", config.allocator.blockSizeMiB) ||
                !readSize(a, "page_size", config.allocator.pageSize) ||
                !readSize(a, "large_threshold_mib", config.allocator.largeThresholdMiB)) {
                return std::nullopt;
            }
            config.allocator.report = a.value("report", config.allocator.report);
            config.allocator.forceOffsets = a.value("force_offsets", config.allocator.forceOffsets);
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GraphicsConfig: %s", e.what());
        return std::nullopt;
    }

    if (config.window.width <= 0 || config.window.height <= 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GraphicsConfig: window size must be positive, got %dx%d",
                     config.window.width, config.window.height);
        return std::nullopt;
    }
    if (config.allocator.pageSize == 0 || config.allocator.blockSizeMiB == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GraphicsConfig: allocator sizes must be non-zero");
        return std::nullopt;
    }
    // Pages are rounded up before reaching the pool, so a block must hold whole pages
    if (alloc::toBytes(alloc::MemUnit::MiB, config.allocator.blockSizeMiB) % config.allocator.pageSize != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GraphicsConfig: allocator.block_size_mib must be a multiple of page_size (%llu)",
            static_cast<unsigned long long>(config.allocator.pageSize));
        return std::nullopt;
    }
    if (config.allocator.largeThresholdMiB > config.allocator.blockSizeMiB) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GraphicsConfig: allocator.large_threshold_mib (%llu) exceeds block_size_mib (%llu)",
            static_cast<unsigned long long>(config.allocator.largeThresholdMiB),
            static_cast<unsigned long long>(config.allocator.blockSizeMiB));
        return std::nullopt;
    }

    return config;
}

std::optional<GraphicsConfig> GraphicsConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GraphicsConfig: failed to open %s", path.c_str());
        return std::nullopt;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GraphicsConfig: failed to parse %s: %s",
                     path.c_str(), e.what());
        return std::nullopt;
    }

    auto config = fromJson(j);
    if (config) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Loaded graphics config from %s", path.c_str());
    }
    return config;
}

} // namespace draw2d

#pragma once

#include <cstdint>
#include <functional>

namespace draw2d {

constexpr uint32_t MAX_SUPPORTED_TEXTURES = 64;

// Slot index of a texture in the atlas. The default handle is the built-in white texture.
class TextureHandle {
public:
    constexpr TextureHandle() = default;
    constexpr explicit TextureHandle(uint32_t index) : index_(index) {}

    constexpr uint32_t index() const { return index_; }

    constexpr bool operator==(const TextureHandle& other) const { return index_ == other.index_; }
    constexpr bool operator!=(const TextureHandle& other) const { return index_ != other.index_; }

private:
    uint32_t index_ = 0;
};

// The default handle is the atlas's default sampler.
class SamplerHandle {
public:
    constexpr SamplerHandle() = default;
    constexpr explicit SamplerHandle(uint32_t index) : index_(index) {}

    constexpr uint32_t index() const { return index_; }

    constexpr bool operator==(const SamplerHandle& other) const { return index_ == other.index_; }
    constexpr bool operator!=(const SamplerHandle& other) const { return index_ != other.index_; }

private:
    uint32_t index_ = 0;
};

} // namespace draw2d

#pragma once

#include <cstdint>
#include <vector>

namespace draw2d {

// floor(log2(max(width, height))) + 1
uint32_t mipLevelCount(uint32_t width, uint32_t height);

struct MipLevel {
    uint32_t width = 0;
    uint32_t height = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
};

/**
 * Every mip level of an RGBA8 image, packed back to back.
 *
 * Each level halves the previous one (never below 1 pixel) with a 2x2 box
 * filter. Samples past the edge of odd-sized levels clamp to the last row or
 * column.
 */
class MipChain {
public:
    static MipChain build(const uint8_t* rgba, uint32_t width, uint32_t height);

    const std::vector<uint8_t>& data() const { return data_; }
    const std::vector<MipLevel>& levels() const { return levels_; }
    uint32_t levelCount() const { return static_cast<uint32_t>(levels_.size()); }

    const uint8_t* levelPixels(uint32_t level) const { return data_.data() + levels_[level].offset; }

private:
    std::vector<uint8_t> data_;
    std::vector<MipLevel> levels_;
};

} // namespace draw2d

#include "draw2d/texture/MipChain.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace draw2d {

namespace {

void downsample(const uint8_t* src, uint32_t srcWidth, uint32_t srcHeight,
                uint8_t* dst, uint32_t dstWidth, uint32_t dstHeight) {
    for (uint32_t dy = 0; dy < dstHeight; ++dy) {
        for (uint32_t dx = 0; dx < dstWidth; ++dx) {
            const uint32_t sx = dx * 2;
            const uint32_t sy = dy * 2;

            uint32_t sum[4] = {0, 0, 0, 0};
            for (uint32_t oy = 0; oy < 2; ++oy) {
                for (uint32_t ox = 0; ox < 2; ++ox) {
                    const uint32_t px = std::min(sx + ox, srcWidth - 1);
                    const uint32_t py = std::min(sy + oy, srcHeight - 1);
                    const uint8_t* texel = src + (static_cast<size_t>(py) * srcWidth + px) * 4;
                    for (int c = 0; c < 4; ++c) {
                        sum[c] += texel[c];
                    }
                }
            }

            uint8_t* out = dst + (static_cast<size_t>(dy) * dstWidth + dx) * 4;
            for (int c = 0; c < 4; ++c) {
                out[c] = static_cast<uint8_t>((sum[c] + 2) / 4);
            }
        }
    }
}

} // namespace

uint32_t mipLevelCount(uint32_t width, uint32_t height) {
    const uint32_t largest = std::max(std::max(width, height), 1u);
    return static_cast<uint32_t>(std::floor(std::log2(largest))) + 1;
}

MipChain MipChain::build(const uint8_t* rgba, uint32_t width, uint32_t height) {
    MipChain chain;
    const uint32_t count = mipLevelCount(width, height);

    uint64_t totalSize = 0;
    uint32_t levelWidth = width;
    uint32_t levelHeight = height;
    for (uint32_t i = 0; i < count; ++i) {
        MipLevel level;
        level.width = levelWidth;
        level.height = levelHeight;
        level.offset = totalSize;
        level.size = static_cast<uint64_t>(levelWidth) * levelHeight * 4;
        chain.levels_.push_back(level);

        totalSize += level.size;
        levelWidth = std::max(1u, levelWidth / 2);
        levelHeight = std::max(1u, levelHeight / 2);
    }

    chain.data_.resize(static_cast<size_t>(totalSize));
    std::memcpy(chain.data_.data(), rgba, static_cast<size_t>(chain.levels_[0].size));

    for (uint32_t i = 1; i < count; ++i) {
        const MipLevel& src = chain.levels_[i - 1];
        const MipLevel& dst = chain.levels_[i];
        downsample(chain.data_.data() + src.offset, src.width, src.height,
                   chain.data_.data() + dst.offset, dst.width, dst.height);
    }

    return chain;
}

} // namespace draw2d

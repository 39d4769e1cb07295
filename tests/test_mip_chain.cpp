#include <doctest/doctest.h>
#include <vector>

#include "draw2d/texture/MipChain.h"

using namespace draw2d;

static std::vector<uint8_t> solid(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    std::vector<uint8_t> pixels;
    for (uint32_t i = 0; i < width * height; ++i) {
        pixels.insert(pixels.end(), {r, g, b, a});
    }
    return pixels;
}

TEST_SUITE("MipChain") {
    TEST_CASE("level count") {
        CHECK(mipLevelCount(1, 1) == 1);
        CHECK(mipLevelCount(2, 2) == 2);
        CHECK(mipLevelCount(256, 256) == 9);
        CHECK(mipLevelCount(300, 20) == 9);
        CHECK(mipLevelCount(1, 1024) == 11);
    }

    TEST_CASE("levels halve and never drop below one pixel") {
        auto pixels = solid(8, 2, 0, 0, 0, 255);
        MipChain chain = MipChain::build(pixels.data(), 8, 2);

        REQUIRE(chain.levelCount() == 4);
        CHECK(chain.levels()[1].width == 4);
        CHECK(chain.levels()[1].height == 1);
        CHECK(chain.levels()[2].width == 2);
        CHECK(chain.levels()[2].height == 1);
        CHECK(chain.levels()[3].width == 1);
        CHECK(chain.levels()[3].height == 1);
    }

    TEST_CASE("levels are packed back to back") {
        auto pixels = solid(4, 4, 1, 2, 3, 4);
        MipChain chain = MipChain::build(pixels.data(), 4, 4);

        REQUIRE(chain.levelCount() == 3);
        CHECK(chain.levels()[0].offset == 0);
        CHECK(chain.levels()[0].size == 64);
        CHECK(chain.levels()[1].offset == 64);
        CHECK(chain.levels()[1].size == 16);
        CHECK(chain.levels()[2].offset == 80);
        CHECK(chain.levels()[2].size == 4);
        CHECK(chain.data().size() == 84);
    }

    TEST_CASE("a solid image stays solid") {
        auto pixels = solid(16, 16, 10, 20, 30, 40);
        MipChain chain = MipChain::build(pixels.data(), 16, 16);

        const uint8_t* last = chain.levelPixels(chain.levelCount() - 1);
        CHECK(last[0] == 10);
        CHECK(last[1] == 20);
        CHECK(last[2] == 30);
        CHECK(last[3] == 40);
    }

    TEST_CASE("box filter averages with rounding") {
        // 2x2: black, white / white, white
        std::vector<uint8_t> pixels = {
            0, 0, 0, 0,         255, 255, 255, 255,
            255, 255, 255, 255, 255, 255, 255, 255,
        };
        MipChain chain = MipChain::build(pixels.data(), 2, 2);

        REQUIRE(chain.levelCount() == 2);
        const uint8_t* level1 = chain.levelPixels(1);
        // (0 + 255 * 3 + 2) / 4
        CHECK(level1[0] == 191);
        CHECK(level1[3] == 191);
    }

    TEST_CASE("odd edges clamp to the last column") {
        // 3x1: 0, 100, 200
        std::vector<uint8_t> pixels = {
            0, 0, 0, 255,   100, 100, 100, 255,   200, 200, 200, 255,
        };
        MipChain chain = MipChain::build(pixels.data(), 3, 1);

        REQUIRE(chain.levelCount() == 2);
        REQUIRE(chain.levels()[1].width == 1);
        const uint8_t* level1 = chain.levelPixels(1);
        // Rows clamp too, so each column is counted twice: (0 + 100) * 2 / 4
        CHECK(level1[0] == 50);
        CHECK(level1[3] == 255);
    }

    TEST_CASE("the first level is the source image") {
        std::vector<uint8_t> pixels = {1, 2, 3, 4, 5, 6, 7, 8};
        MipChain chain = MipChain::build(pixels.data(), 2, 1);
        for (size_t i = 0; i < pixels.size(); ++i) {
            CHECK(chain.levelPixels(0)[i] == pixels[i]);
        }
    }
}

#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>

#include "draw2d/atlas/CachedAtlas.h"

using namespace draw2d;
namespace fs = std::filesystem;

namespace {

// Hands out consecutive slots without touching the GPU.
class StubAtlas : public TextureAtlas {
public:
    explicit StubAtlas(int& addTextureCalls) : addTextureCalls_(addTextureCalls) {}

    AtlasVersion version() const override { return version_; }

    std::vector<vk::DescriptorImageInfo> buildDescriptorImageInfos() const override {
        return std::vector<vk::DescriptorImageInfo>(MAX_SUPPORTED_TEXTURES);
    }

    std::optional<SamplerHandle> addSampler(vk::raii::Sampler) override {
        return SamplerHandle(++samplerCount_);
    }

    bool bindSamplerToTexture(SamplerHandle sampler, TextureHandle texture) override {
        if (sampler.index() > samplerCount_ || texture.index() >= nextSlot_) {
            return false;
        }
        version_ = version_.increment();
        return true;
    }

    std::optional<TextureHandle> addTexture(const fs::path&) override {
        addTextureCalls_++;
        if (nextSlot_ >= MAX_SUPPORTED_TEXTURES) {
            return std::nullopt;
        }
        version_ = version_.increment();
        return TextureHandle(nextSlot_++);
    }

private:
    int& addTextureCalls_;
    AtlasVersion version_ = AtlasVersion::newOutOfDate().increment();
    uint32_t samplerCount_ = 0;
    uint32_t nextSlot_ = 1;
};

// A real file on disk so canonical() succeeds.
struct TempFile {
    fs::path path;

    explicit TempFile(const std::string& name)
        : path(fs::temp_directory_path() / name) {
        std::ofstream(path) << "not really an image";
    }
    ~TempFile() {
        std::error_code ignored;
        fs::remove(path, ignored);
    }
};

} // namespace

TEST_SUITE("AtlasVersion") {
    TEST_CASE("a new out of date version is out of date against everything") {
        AtlasVersion outOfDate = AtlasVersion::newOutOfDate();
        CHECK(outOfDate.revisionCount() == 0);
        CHECK(outOfDate.isOutOfDate(outOfDate));
        CHECK(outOfDate.increment().isOutOfDate(outOfDate));
    }

    TEST_CASE("equal revisions are up to date") {
        AtlasVersion a = AtlasVersion::newOutOfDate().increment();
        AtlasVersion b = AtlasVersion::newOutOfDate().increment();
        CHECK_FALSE(a.isOutOfDate(b));
        CHECK(a == b);
    }

    TEST_CASE("increment moves to the next revision") {
        AtlasVersion a = AtlasVersion::newOutOfDate().increment();
        AtlasVersion b = a.increment();
        CHECK(b.revisionCount() == a.revisionCount() + 1);
        CHECK(a.isOutOfDate(b));
        CHECK(b.isOutOfDate(a));
    }
}

TEST_SUITE("TextureHandle") {
    TEST_CASE("default handles are slot zero") {
        CHECK(TextureHandle().index() == 0);
        CHECK(SamplerHandle().index() == 0);
        CHECK(TextureHandle(5) == TextureHandle(5));
        CHECK(TextureHandle(5) != TextureHandle(6));
    }
}

TEST_SUITE("CachedAtlas") {
    TEST_CASE("the same file is only loaded once") {
        TempFile file("draw2d_cached_atlas_once.png");
        int calls = 0;
        CachedAtlas atlas(std::make_unique<StubAtlas>(calls));

        auto first = atlas.addTexture(file.path);
        auto second = atlas.addTexture(file.path);
        REQUIRE(first);
        REQUIRE(second);
        CHECK(*first == *second);
        CHECK(calls == 1);
        CHECK(atlas.cachedTextureCount() == 1);
    }

    TEST_CASE("different spellings of a path share a handle") {
        TempFile file("draw2d_cached_atlas_spelling.png");
        int calls = 0;
        CachedAtlas atlas(std::make_unique<StubAtlas>(calls));

        const fs::path dotted = file.path.parent_path() / "." / file.path.filename();
        auto first = atlas.addTexture(file.path);
        auto second = atlas.addTexture(dotted);
        REQUIRE(first);
        REQUIRE(second);
        CHECK(*first == *second);
        CHECK(calls == 1);
    }

    TEST_CASE("different files get different handles") {
        TempFile a("draw2d_cached_atlas_a.png");
        TempFile b("draw2d_cached_atlas_b.png");
        int calls = 0;
        CachedAtlas atlas(std::make_unique<StubAtlas>(calls));

        auto first = atlas.addTexture(a.path);
        auto second = atlas.addTexture(b.path);
        REQUIRE(first);
        REQUIRE(second);
        CHECK(*first != *second);
        CHECK(calls == 2);
    }

    TEST_CASE("missing files fail without reaching the atlas") {
        int calls = 0;
        CachedAtlas atlas(std::make_unique<StubAtlas>(calls));

        CHECK_FALSE(atlas.addTexture(fs::temp_directory_path() / "draw2d_does_not_exist.png"));
        CHECK(calls == 0);
        CHECK(atlas.cachedTextureCount() == 0);
    }

    TEST_CASE("uncached adds always take a new slot") {
        TempFile file("draw2d_cached_atlas_copy.png");
        int calls = 0;
        CachedAtlas atlas(std::make_unique<StubAtlas>(calls));

        auto cached = atlas.addTexture(file.path);
        auto copy = atlas.addTextureUncached(file.path);
        REQUIRE(cached);
        REQUIRE(copy);
        CHECK(*cached != *copy);
        CHECK(atlas.addTexture(file.path) == cached);
        CHECK(calls == 2);
    }

    TEST_CASE("samplers, binding and version are forwarded") {
        TempFile file("draw2d_cached_atlas_forward.png");
        int calls = 0;
        CachedAtlas atlas(std::make_unique<StubAtlas>(calls));

        const AtlasVersion before = atlas.version();
        auto texture = atlas.addTexture(file.path);
        REQUIRE(texture);
        CHECK(before.isOutOfDate(atlas.version()));

        auto sampler = atlas.addSampler(vk::raii::Sampler(nullptr));
        REQUIRE(sampler);
        CHECK(sampler->index() == 1);

        const AtlasVersion afterAdd = atlas.version();
        CHECK(atlas.bindSamplerToTexture(*sampler, *texture));
        CHECK(afterAdd.isOutOfDate(atlas.version()));

        CHECK_FALSE(atlas.bindSamplerToTexture(SamplerHandle(9), *texture));
        CHECK(atlas.buildDescriptorImageInfos().size() == MAX_SUPPORTED_TEXTURES);
    }
}

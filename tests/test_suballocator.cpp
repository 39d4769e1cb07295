#include <doctest/doctest.h>
#include <vector>

#include "draw2d/alloc/Suballocator.h"

using namespace draw2d::alloc;

using Regions = std::vector<Region>;

TEST_SUITE("Suballocator") {
    TEST_CASE("allocate splits the free region") {
        Suballocator sub(Region(0, 1024));
        CHECK(sub.freeRegions() == Regions{Region(0, 1024)});

        CHECK(sub.allocate(256) == Region(0, 256));
        CHECK(sub.freeRegions() == Regions{Region(256, 768)});

        CHECK(sub.allocate(768) == Region(256, 768));
        CHECK(sub.freeRegions().empty());
    }

    TEST_CASE("a full block refuses more") {
        Suballocator sub(Region(0, 1024));
        REQUIRE(sub.allocate(1024));
        CHECK_FALSE(sub.allocate(1));
    }

    TEST_CASE("zero sized requests are refused") {
        Suballocator sub(Region(0, 1024));
        CHECK_FALSE(sub.allocate(0));
    }

    TEST_CASE("freeing the whole block") {
        Suballocator sub(Region(0, 1024));
        auto region = sub.allocate(1024);
        REQUIRE(region);
        CHECK_FALSE(sub.isEmpty());

        CHECK(sub.free(*region));
        CHECK(sub.freeRegions() == Regions{Region(0, 1024)});
        CHECK(sub.isEmpty());
    }

    TEST_CASE("freeing merges front and back") {
        Suballocator sub(Region(0, 1024));
        auto a = sub.allocate(256);
        auto b = sub.allocate(512);
        auto c = sub.allocate(256);
        REQUIRE((a && b && c));

        CHECK(sub.free(*c));
        CHECK(sub.freeRegions() == Regions{Region(768, 256)});

        CHECK(sub.free(*a));
        CHECK(sub.freeRegions() == Regions{Region(0, 256), Region(768, 256)});

        CHECK(sub.free(*b));
        CHECK(sub.freeRegions() == Regions{Region(0, 1024)});
    }

    TEST_CASE("freeing merges with a leading region") {
        Suballocator sub(Region(0, 1024));
        auto a = sub.allocate(256);
        auto b = sub.allocate(256);
        auto c = sub.allocate(256);
        auto d = sub.allocate(256);
        REQUIRE((a && b && c && d));

        CHECK(sub.free(*a));
        CHECK(sub.free(*d));
        CHECK(sub.freeRegions() == Regions{Region(0, 256), Region(768, 256)});

        CHECK(sub.free(*c));
        CHECK(sub.freeRegions() == Regions{Region(0, 256), Region(512, 512)});

        CHECK(sub.free(*b));
        CHECK(sub.freeRegions() == Regions{Region(0, 1024)});
    }

    TEST_CASE("freeing merges with a trailing region") {
        Suballocator sub(Region(0, 1024));
        auto a = sub.allocate(256);
        auto b = sub.allocate(256);
        auto c = sub.allocate(256);
        auto d = sub.allocate(256);
        REQUIRE((a && b && c && d));

        CHECK(sub.free(*a));
        CHECK(sub.free(*d));
        CHECK(sub.free(*b));
        CHECK(sub.freeRegions() == Regions{Region(0, 512), Region(768, 256)});

        CHECK(sub.free(*c));
        CHECK(sub.freeRegions() == Regions{Region(0, 1024)});
    }

    TEST_CASE("double free is rejected") {
        Suballocator sub(Region(0, 1024));
        auto a = sub.allocate(256);
        auto b = sub.allocate(256);
        REQUIRE((a && b));

        CHECK(sub.free(*a));
        CHECK_FALSE(sub.free(*a));
        CHECK(sub.freeRegions() == Regions{Region(0, 256), Region(512, 512)});
    }

    TEST_CASE("regions outside the block are rejected") {
        Suballocator sub(Region(1024, 1024));
        REQUIRE(sub.allocate(2048 - 1024));
        CHECK_FALSE(sub.free(Region(0, 256)));
        CHECK_FALSE(sub.free(Region(1900, 256)));
    }

    TEST_CASE("freed space is reused first fit") {
        Suballocator sub(Region(0, 1024));
        auto a = sub.allocate(256);
        auto b = sub.allocate(256);
        REQUIRE((a && b));
        CHECK(sub.free(*a));

        CHECK(sub.allocate(128) == Region(0, 128));
        CHECK(sub.allocate(256) == Region(512, 256));
    }

    TEST_CASE("alignment leaves the padding free") {
        Suballocator sub(Region(0, 1024));
        REQUIRE(sub.allocate(100) == Region(0, 100));

        auto aligned = sub.allocate(128, 256);
        REQUIRE(aligned);
        CHECK(*aligned == Region(256, 128));
        CHECK(sub.freeRegions() == Regions{Region(100, 156), Region(384, 640)});

        // The padding is still usable by unaligned requests
        CHECK(sub.allocate(156) == Region(100, 156));
    }

    TEST_CASE("alignment skips regions too small once padded") {
        Suballocator sub(Region(0, 512));
        REQUIRE(sub.allocate(10) == Region(0, 10));
        CHECK(sub.allocate(256, 256) == Region(256, 256));
        CHECK_FALSE(sub.allocate(256, 256));
    }

    TEST_CASE("aligned regions free back into one block") {
        Suballocator sub(Region(0, 1024));
        auto a = sub.allocate(100);
        auto b = sub.allocate(128, 256);
        REQUIRE((a && b));
        CHECK(sub.free(*b));
        CHECK(sub.free(*a));
        CHECK(sub.isEmpty());
    }
}

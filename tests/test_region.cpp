#include <doctest/doctest.h>

#include "draw2d/alloc/MemUnit.h"
#include "draw2d/alloc/Region.h"

using namespace draw2d::alloc;

TEST_SUITE("MemUnit") {
    TEST_CASE("converts to bytes") {
        CHECK(toBytes(MemUnit::B, 3) == 3);
        CHECK(toBytes(MemUnit::KiB, 2) == 2048);
        CHECK(toBytes(MemUnit::MiB, 64) == 64ull * 1024 * 1024);
        CHECK(toBytes(MemUnit::GiB, 1) == 1024ull * 1024 * 1024);
    }
}

TEST_SUITE("Region") {
    TEST_CASE("contiguous regions touch at either end") {
        Region a(0, 256);
        Region b(256, 128);
        Region c(512, 64);
        CHECK(a.isContiguous(b));
        CHECK(b.isContiguous(a));
        CHECK_FALSE(a.isContiguous(c));
    }

    TEST_CASE("merge combines touching regions in either order") {
        Region a(0, 256);
        Region b(256, 128);
        CHECK(a.merge(b) == Region(0, 384));
        CHECK(b.merge(a) == Region(0, 384));
    }

    TEST_CASE("merge refuses gaps") {
        CHECK_FALSE(Region(0, 100).merge(Region(101, 10)));
    }

    TEST_CASE("overlap") {
        CHECK(Region(0, 100).overlaps(Region(50, 100)));
        CHECK(Region(50, 100).overlaps(Region(0, 100)));
        CHECK_FALSE(Region(0, 100).overlaps(Region(100, 100)));
    }

    TEST_CASE("takeSubregion splits off the front") {
        Region region(128, 512);
        auto taken = region.takeSubregion(200);
        REQUIRE(taken);
        CHECK(*taken == Region(128, 200));
        CHECK(region == Region(328, 312));
    }

    TEST_CASE("takeSubregion can take everything but not more") {
        Region region(0, 64);
        CHECK_FALSE(region.takeSubregion(65));
        CHECK(region == Region(0, 64));

        auto all = region.takeSubregion(64);
        REQUIRE(all);
        CHECK(*all == Region(0, 64));
        CHECK(region.size == 0);
    }
}

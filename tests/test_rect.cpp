#include <doctest/doctest.h>

#include "draw2d/geometry/Rect.h"

using namespace draw2d;

TEST_SUITE("Rect") {
    TEST_CASE("width and height") {
        Rect<float> rect(-2.0f, 3.0f, -1.0f, 4.0f);
        CHECK(rect.width() == doctest::Approx(5.0f));
        CHECK(rect.height() == doctest::Approx(5.0f));
    }

    TEST_CASE("contains is inclusive on the edges") {
        Rect<int> rect(0, 10, 0, 5);
        CHECK(rect.contains(0, 0));
        CHECK(rect.contains(10, 5));
        CHECK(rect.contains(glm::ivec2(4, 2)));
        CHECK_FALSE(rect.contains(11, 2));
        CHECK_FALSE(rect.contains(4, -1));
    }

    TEST_CASE("equality") {
        CHECK(Rect<int>(0, 1, 2, 3) == Rect<int>(0, 1, 2, 3));
        CHECK(Rect<int>(0, 1, 2, 3) != Rect<int>(0, 1, 2, 4));
    }
}

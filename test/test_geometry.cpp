#include <doctest/doctest.h>
#include <prism_image/prism_image.hpp>

#include "helpers/test_images.hpp"

namespace {

// 3x2 grid with a distinct colour per pixel:
//   A B C
//   D E F
const prism_image::pixel A{1, 0, 0};
const prism_image::pixel B{2, 0, 0};
const prism_image::pixel C{3, 0, 0};
const prism_image::pixel D{4, 0, 0};
const prism_image::pixel E{5, 0, 0};
const prism_image::pixel F{6, 0, 0};

prism_image::pixel_grid letters() {
    const prism_image::pixel cells[2][3] = {{A, B, C}, {D, E, F}};
    return test_images::make_grid(3, 2, prism_image::pixel_format::rgb888,
                                  [&cells](int x, int y) { return cells[y][x]; });
}

} // namespace

TEST_CASE("Geometry: mirrors") {
    const auto src = letters();
    prism_image::pixel_grid dst;

    SUBCASE("Horizontal reverses each row") {
        REQUIRE(prism_image::mirror_horizontal(src, dst).ok);
        CHECK(dst.at(0, 0) == C);
        CHECK(dst.at(2, 0) == A);
        CHECK(dst.at(0, 1) == F);
        CHECK(dst.at(1, 1) == E);
    }

    SUBCASE("Vertical reverses the row order") {
        REQUIRE(prism_image::mirror_vertical(src, dst).ok);
        CHECK(dst.at(0, 0) == D);
        CHECK(dst.at(2, 0) == F);
        CHECK(dst.at(0, 1) == A);
    }

    SUBCASE("Both are involutions") {
        const auto grid = test_images::gradient(7, 5, true);
        prism_image::pixel_grid once;
        prism_image::pixel_grid twice;

        REQUIRE(prism_image::mirror_horizontal(grid, once).ok);
        REQUIRE(prism_image::mirror_horizontal(once, twice).ok);
        CHECK(twice == grid);

        REQUIRE(prism_image::mirror_vertical(grid, once).ok);
        REQUIRE(prism_image::mirror_vertical(once, twice).ok);
        CHECK(twice == grid);
    }
}

TEST_CASE("Geometry: rotate") {
    const auto src = letters();
    prism_image::pixel_grid dst;

    SUBCASE("90 degrees turns clockwise") {
        REQUIRE(prism_image::rotate(src, dst, 90).ok);
        REQUIRE(dst.width() == 2);
        REQUIRE(dst.height() == 3);
        CHECK(dst.at(0, 0) == D);
        CHECK(dst.at(1, 0) == A);
        CHECK(dst.at(0, 1) == E);
        CHECK(dst.at(1, 1) == B);
        CHECK(dst.at(0, 2) == F);
        CHECK(dst.at(1, 2) == C);
    }

    SUBCASE("Negative degrees turn counter-clockwise") {
        REQUIRE(prism_image::rotate(src, dst, -90).ok);
        REQUIRE(dst.width() == 2);
        CHECK(dst.at(0, 0) == C);
        CHECK(dst.at(1, 0) == F);
        CHECK(dst.at(0, 2) == A);
        CHECK(dst.at(1, 2) == D);

        prism_image::pixel_grid three_quarters;
        REQUIRE(prism_image::rotate(src, three_quarters, 270).ok);
        CHECK(three_quarters == dst);
    }

    SUBCASE("180 degrees is both mirrors") {
        REQUIRE(prism_image::rotate(src, dst, 180).ok);
        CHECK(dst.width() == 3);
        CHECK(dst.at(0, 0) == F);
        CHECK(dst.at(2, 1) == A);

        prism_image::pixel_grid h;
        prism_image::pixel_grid hv;
        REQUIRE(prism_image::mirror_horizontal(src, h).ok);
        REQUIRE(prism_image::mirror_vertical(h, hv).ok);
        CHECK(dst == hv);
    }

    SUBCASE("Composition") {
        const auto grid = test_images::gradient(11, 4, true);
        prism_image::pixel_grid quarter;
        prism_image::pixel_grid back;

        REQUIRE(prism_image::rotate(grid, quarter, 90).ok);
        CHECK(quarter.width() == 4);
        CHECK(quarter.height() == 11);
        REQUIRE(prism_image::rotate(quarter, back, 270).ok);
        CHECK(back == grid);

        REQUIRE(prism_image::rotate(grid, back, 360).ok);
        CHECK(back == grid);

        REQUIRE(prism_image::rotate(grid, back, 0).ok);
        CHECK(back == grid);

        prism_image::pixel_grid wrapped;
        REQUIRE(prism_image::rotate(grid, wrapped, 450).ok);
        CHECK(wrapped == quarter);
        REQUIRE(prism_image::rotate(grid, wrapped, -270).ok);
        CHECK(wrapped == quarter);
    }

    SUBCASE("Non-multiple of 90") {
        auto res = prism_image::rotate(src, dst, 45);
        CHECK(res.error == prism_image::error_code::invalid_parameter);
        CHECK(dst.empty());
    }
}

TEST_CASE("Geometry: tile") {
    prism_image::pixel_grid dst;

    SUBCASE("Dimensions and content") {
        const auto src = test_images::gradient(10, 20);
        REQUIRE(prism_image::tile(src, dst, 3).ok);
        REQUIRE(dst.width() == 30);
        REQUIRE(dst.height() == 60);

        for (int y = 0; y < 20; ++y) {
            for (int x = 0; x < 10; ++x) {
                CHECK(dst.at(x, y) == src.at(x, y));
                CHECK(dst.at(x + 20, y + 40) == src.at(x, y));
            }
        }
    }

    SUBCASE("Size 1 is the identity") {
        const auto src = test_images::gradient(4, 3, true);
        REQUIRE(prism_image::tile(src, dst, 1).ok);
        CHECK(dst == src);
    }

    SUBCASE("Invalid sizes") {
        const auto src = test_images::gradient(2, 2);
        CHECK(prism_image::tile(src, dst, 0).error == prism_image::error_code::invalid_parameter);
        CHECK(prism_image::tile(src, dst, -2).error == prism_image::error_code::invalid_parameter);
        CHECK(prism_image::tile(src, dst, 65).error == prism_image::error_code::invalid_parameter);
    }

    SUBCASE("Output over the limits") {
        const auto src = test_images::gradient(10, 10);
        prism_image::engine_limits limits;
        limits.max_width = 25;
        CHECK(prism_image::tile(src, dst, 3, limits).error == prism_image::error_code::resource_limit_exceeded);
        CHECK(dst.empty());
    }
}

TEST_CASE("Geometry: resize") {
    prism_image::pixel_grid dst;

    SUBCASE("Downscale picks floor-scaled source pixels") {
        const auto src = test_images::gradient(4, 2);
        REQUIRE(prism_image::resize(src, dst, 2, 1).ok);
        REQUIRE(dst.width() == 2);
        REQUIRE(dst.height() == 1);
        CHECK(dst.at(0, 0) == src.at(0, 0));
        CHECK(dst.at(1, 0) == src.at(2, 0));
    }

    SUBCASE("Upscale repeats pixels") {
        const auto src = letters();
        REQUIRE(prism_image::resize(src, dst, 6, 4).ok);
        CHECK(dst.at(0, 0) == A);
        CHECK(dst.at(1, 1) == A);
        CHECK(dst.at(2, 0) == B);
        CHECK(dst.at(5, 3) == F);
        CHECK(dst.at(4, 2) == F);
    }

    SUBCASE("Non-integral ratios") {
        const auto src = letters();
        REQUIRE(prism_image::resize(src, dst, 2, 2).ok);
        // x * 3 / 2 -> 0, 1
        CHECK(dst.at(0, 0) == A);
        CHECK(dst.at(1, 0) == B);
        CHECK(dst.at(1, 1) == E);
    }

    SUBCASE("Same size is the identity") {
        const auto src = test_images::gradient(5, 5, true);
        REQUIRE(prism_image::resize(src, dst, 5, 5).ok);
        CHECK(dst == src);
    }

    SUBCASE("Zero width") {
        const auto src = letters();
        CHECK(prism_image::resize(src, dst, 0, 4).error == prism_image::error_code::invalid_parameter);
        CHECK(dst.empty());
    }

    SUBCASE("Target over the limits") {
        const auto src = letters();
        prism_image::engine_limits limits;
        limits.max_buffer_bytes = 1024;
        CHECK(prism_image::resize(src, dst, 100, 100, limits).error ==
              prism_image::error_code::resource_limit_exceeded);
    }
}

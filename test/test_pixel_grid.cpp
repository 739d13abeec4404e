#include <doctest/doctest.h>
#include <prism_image/prism_image.hpp>

#include "helpers/test_images.hpp"

#include <cstdint>
#include <string>
#include <vector>

TEST_CASE("Pixel grid: layout") {
    SUBCASE("RGB grid has no row padding") {
        prism_image::pixel_grid grid;
        REQUIRE(grid.set_size(5, 3, prism_image::pixel_format::rgb888));
        CHECK(grid.width() == 5);
        CHECK(grid.height() == 3);
        CHECK(grid.channels() == 3);
        CHECK(grid.pitch() == 15);
        CHECK(grid.pixels().size() == 45);
        CHECK_FALSE(grid.has_alpha());
        CHECK(grid.offset(2, 1) == 15 + 6);
    }

    SUBCASE("RGBA grid") {
        prism_image::pixel_grid grid;
        REQUIRE(grid.set_size(4, 2, prism_image::pixel_format::rgba8888));
        CHECK(grid.channels() == 4);
        CHECK(grid.pitch() == 16);
        CHECK(grid.has_alpha());
        CHECK(grid.offset(3, 1) == 16 + 12);
    }

    SUBCASE("Freshly sized grid is zeroed") {
        prism_image::pixel_grid grid;
        REQUIRE(grid.set_size(3, 3, prism_image::pixel_format::rgba8888));
        for (const auto b : grid.pixels()) {
            CHECK(b == 0);
        }
    }

    SUBCASE("Default grid is empty") {
        prism_image::pixel_grid grid;
        CHECK(grid.empty());
        CHECK(grid.width() == 0);
    }

    SUBCASE("Non-positive sizes are refused") {
        prism_image::pixel_grid grid;
        CHECK_FALSE(grid.set_size(0, 10, prism_image::pixel_format::rgb888));
        CHECK_FALSE(grid.set_size(10, -1, prism_image::pixel_format::rgb888));
        CHECK(grid.empty());
    }
}

TEST_CASE("Pixel grid: pixel access") {
    prism_image::pixel_grid grid;
    REQUIRE(grid.set_size(2, 2, prism_image::pixel_format::rgb888));

    SUBCASE("set and at") {
        grid.set(1, 0, {10, 20, 30, 40});
        const auto p = grid.at(1, 0);
        CHECK(p.r == 10);
        CHECK(p.g == 20);
        CHECK(p.b == 30);
        // Alpha is dropped for rgb grids and reads back opaque
        CHECK(p.a == 255);
        CHECK(grid.pixels()[3] == 10);
    }

    SUBCASE("Out-of-range set is ignored") {
        grid.set(2, 0, {1, 2, 3});
        grid.set(-1, 1, {1, 2, 3});
        for (const auto b : grid.pixels()) {
            CHECK(b == 0);
        }
    }

    SUBCASE("fill") {
        grid.fill({7, 8, 9});
        CHECK(grid.at(0, 0) == prism_image::pixel{7, 8, 9});
        CHECK(grid.at(1, 1) == prism_image::pixel{7, 8, 9});
    }

    SUBCASE("write_pixels clips to the row") {
        const std::uint8_t data[9] = {1, 2, 3, 4, 5, 6, 7, 8, 9};
        grid.write_pixels(3, 1, 9, data);
        CHECK(grid.at(1, 1) == prism_image::pixel{1, 2, 3});
        CHECK(grid.at(0, 1) == prism_image::pixel{0, 0, 0});
    }
}

TEST_CASE("Pixel grid: clone and equality") {
    auto grid = test_images::gradient(6, 4, true);
    auto copy = grid.clone();

    CHECK(copy == grid);
    CHECK(copy.pixels().data() != grid.pixels().data());

    copy.set(0, 0, {1, 1, 1, 1});
    CHECK_FALSE(copy == grid);

    SUBCASE("Format is part of equality") {
        auto rgb = test_images::solid(2, 2, {5, 5, 5});
        auto rgba = test_images::solid(2, 2, {5, 5, 5}, prism_image::pixel_format::rgba8888);
        CHECK_FALSE(rgb == rgba);
    }

    SUBCASE("Move leaves the buffer with the destination") {
        const auto* data = grid.pixels().data();
        prism_image::pixel_grid moved = std::move(grid);
        CHECK(moved.pixels().data() == data);
        CHECK(moved.width() == 6);
    }
}

TEST_CASE("Pixel grid: limits") {
    const prism_image::engine_limits limits;

    SUBCASE("Within defaults") {
        CHECK(prism_image::check_limits(1920, 1080, prism_image::pixel_format::rgba8888, limits).ok);
    }

    SUBCASE("Non-positive dimensions") {
        auto res = prism_image::check_limits(0, 10, prism_image::pixel_format::rgb888, limits);
        CHECK_FALSE(res.ok);
        CHECK(res.error == prism_image::error_code::invalid_parameter);
    }

    SUBCASE("Dimension ceiling") {
        auto res = prism_image::check_limits(16385, 1, prism_image::pixel_format::rgb888, limits);
        CHECK(res.error == prism_image::error_code::resource_limit_exceeded);
    }

    SUBCASE("Buffer ceiling") {
        prism_image::engine_limits small;
        small.max_buffer_bytes = 1000;
        CHECK(prism_image::check_limits(10, 10, prism_image::pixel_format::rgba8888, small).ok);
        auto res = prism_image::check_limits(16, 16, prism_image::pixel_format::rgba8888, small);
        CHECK(res.error == prism_image::error_code::resource_limit_exceeded);
    }

    SUBCASE("Zero limits fall back to defaults") {
        prism_image::engine_limits zero;
        zero.max_width = 0;
        zero.max_height = 0;
        zero.max_buffer_bytes = 0;
        CHECK(prism_image::check_limits(16384, 16, prism_image::pixel_format::rgb888, zero).ok);
        CHECK_FALSE(prism_image::check_limits(16385, 16, prism_image::pixel_format::rgb888, zero).ok);
    }

    SUBCASE("buffer_size") {
        CHECK(prism_image::buffer_size(10, 20, prism_image::pixel_format::rgb888) == 600);
        CHECK(prism_image::buffer_size(0, 20, prism_image::pixel_format::rgb888) == 0);
    }
}

TEST_CASE("Channel helpers") {
    SUBCASE("clamp_channel") {
        CHECK(prism_image::clamp_channel(-5) == 0);
        CHECK(prism_image::clamp_channel(0) == 0);
        CHECK(prism_image::clamp_channel(128) == 128);
        CHECK(prism_image::clamp_channel(400) == 255);
    }

    SUBCASE("round_channel rounds ties up") {
        CHECK(prism_image::round_channel(2.5) == 3);
        CHECK(prism_image::round_channel(3.5) == 4);
        CHECK(prism_image::round_channel(2.49) == 2);
        CHECK(prism_image::round_channel(-3.0) == 0);
        CHECK(prism_image::round_channel(300.0) == 255);
    }
}

TEST_CASE("Image format names") {
    CHECK(prism_image::parse_image_format("png") == prism_image::image_format::png);
    CHECK(prism_image::parse_image_format(".JPG") == prism_image::image_format::jpeg);
    CHECK(prism_image::parse_image_format("Jpeg") == prism_image::image_format::jpeg);
    CHECK(prism_image::parse_image_format("webp") == prism_image::image_format::webp);
    CHECK(prism_image::parse_image_format(".bmp") == prism_image::image_format::bmp);
    CHECK_FALSE(prism_image::parse_image_format("gif").has_value());
    CHECK_FALSE(prism_image::parse_image_format("").has_value());
    CHECK_FALSE(prism_image::parse_image_format("pngpng").has_value());

    CHECK(std::string(prism_image::to_string(prism_image::image_format::jpeg)) == "jpeg");
    CHECK(std::string(prism_image::to_string(prism_image::error_code::resource_limit_exceeded)) ==
          "resource_limit_exceeded");
}

#include <doctest/doctest.h>
#include <prism_image/prism_image.hpp>

#include "helpers/test_images.hpp"

#include <cstdint>
#include <vector>

namespace {

struct bmp_spec {
    std::uint32_t header_size = 40;
    std::int32_t width = 1;
    std::int32_t height = 1;
    std::uint16_t bits_per_pixel = 24;
    std::uint32_t compression = 0;
    std::uint32_t colors_used = 0;
    std::vector<std::uint8_t> header_tail;  // Header bytes past the first 40 (V2+ masks)
    std::vector<std::uint8_t> extra;        // Bitfield masks or palette after the header
    std::vector<std::uint8_t> pixel_data;
};

std::vector<std::uint8_t> build_bmp(const bmp_spec& spec) {
    const auto data_offset = static_cast<std::uint32_t>(14 + spec.header_size + spec.extra.size());

    std::vector<std::uint8_t> data = {'B', 'M'};
    test_images::put_le32(data, static_cast<std::uint32_t>(data_offset + spec.pixel_data.size()));
    test_images::put_le32(data, 0);
    test_images::put_le32(data, data_offset);

    test_images::put_le32(data, spec.header_size);
    test_images::put_le32(data, static_cast<std::uint32_t>(spec.width));
    test_images::put_le32(data, static_cast<std::uint32_t>(spec.height));
    test_images::put_le16(data, 1);
    test_images::put_le16(data, spec.bits_per_pixel);
    test_images::put_le32(data, spec.compression);
    test_images::put_le32(data, static_cast<std::uint32_t>(spec.pixel_data.size()));
    test_images::put_le32(data, 2835);
    test_images::put_le32(data, 2835);
    test_images::put_le32(data, spec.colors_used);
    test_images::put_le32(data, 0);

    data.insert(data.end(), spec.header_tail.begin(), spec.header_tail.end());
    data.insert(data.end(), spec.extra.begin(), spec.extra.end());
    data.insert(data.end(), spec.pixel_data.begin(), spec.pixel_data.end());
    return data;
}

// 3x2, 24-bit, rows stored bottom-up with 3 bytes of padding
std::vector<std::uint8_t> bmp_24bit_3x2() {
    bmp_spec spec;
    spec.width = 3;
    spec.height = 2;
    spec.pixel_data = {
        // bottom row (y = 1): BGR
        0, 0, 0,   128, 128, 128,   255, 255, 255,   0, 0, 0,
        // top row (y = 0)
        0, 0, 255,   0, 255, 0,   255, 0, 0,   0, 0, 0,
    };
    return build_bmp(spec);
}

prism_image::result decode_bmp(const std::vector<std::uint8_t>& data, prism_image::pixel_grid& grid,
                               const prism_image::decode_options& options = {}) {
    return prism_image::bmp_codec::decode(data, grid, options);
}

} // namespace

TEST_CASE("BMP codec: sniff") {
    SUBCASE("Valid BMP signature") {
        std::vector<std::uint8_t> data = {'B', 'M', 0x00, 0x00};
        CHECK(prism_image::bmp_codec::sniff(data));
    }

    SUBCASE("Invalid signature") {
        std::vector<std::uint8_t> data = {'P', 'N', 'G', 0x00};
        CHECK_FALSE(prism_image::bmp_codec::sniff(data));
    }

    SUBCASE("Too short") {
        std::vector<std::uint8_t> data = {'B'};
        CHECK_FALSE(prism_image::bmp_codec::sniff(data));
    }
}

TEST_CASE("BMP codec: decode") {
    SUBCASE("24-bit bottom-up") {
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(bmp_24bit_3x2(), grid).ok);
        CHECK(grid.width() == 3);
        CHECK(grid.height() == 2);
        CHECK(grid.format() == prism_image::pixel_format::rgb888);
        CHECK(grid.at(0, 0) == prism_image::pixel{255, 0, 0});
        CHECK(grid.at(1, 0) == prism_image::pixel{0, 255, 0});
        CHECK(grid.at(2, 0) == prism_image::pixel{0, 0, 255});
        CHECK(grid.at(0, 1) == prism_image::pixel{0, 0, 0});
        CHECK(grid.at(1, 1) == prism_image::pixel{128, 128, 128});
        CHECK(grid.at(2, 1) == prism_image::pixel{255, 255, 255});
    }

    SUBCASE("24-bit top-down") {
        bmp_spec spec;
        spec.width = 1;
        spec.height = -2;
        spec.pixel_data = {
            3, 2, 1, 0,   // y = 0
            6, 5, 4, 0,   // y = 1
        };
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.height() == 2);
        CHECK(grid.at(0, 0) == prism_image::pixel{1, 2, 3});
        CHECK(grid.at(0, 1) == prism_image::pixel{4, 5, 6});
    }

    SUBCASE("1-bit palette packs pixels from the high bit") {
        bmp_spec spec;
        spec.width = 10;
        spec.bits_per_pixel = 1;
        spec.extra = {
            0, 0, 0, 0,         // index 0: black
            255, 255, 255, 0,   // index 1: white
        };
        spec.pixel_data = {0xA0, 0x40, 0, 0};  // 1010 0000 01..
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.at(0, 0) == prism_image::pixel{255, 255, 255});
        CHECK(grid.at(1, 0) == prism_image::pixel{0, 0, 0});
        CHECK(grid.at(2, 0) == prism_image::pixel{255, 255, 255});
        CHECK(grid.at(8, 0) == prism_image::pixel{0, 0, 0});
        CHECK(grid.at(9, 0) == prism_image::pixel{255, 255, 255});
    }

    SUBCASE("4-bit palette uses the high nibble first") {
        bmp_spec spec;
        spec.width = 3;
        spec.bits_per_pixel = 4;
        spec.colors_used = 3;
        spec.extra = {
            0, 0, 0, 0,
            0, 0, 200, 0,   // index 1: red
            0, 150, 0, 0,   // index 2: green
        };
        spec.pixel_data = {0x21, 0x00, 0, 0};
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.at(0, 0) == prism_image::pixel{0, 150, 0});
        CHECK(grid.at(1, 0) == prism_image::pixel{200, 0, 0});
        CHECK(grid.at(2, 0) == prism_image::pixel{0, 0, 0});
    }

    SUBCASE("8-bit palette") {
        bmp_spec spec;
        spec.width = 2;
        spec.height = 2;
        spec.bits_per_pixel = 8;
        spec.colors_used = 2;
        spec.extra = {
            255, 0, 0, 0,     // index 0: blue
            30, 20, 10, 0,    // index 1
        };
        spec.pixel_data = {
            1, 0, 0, 0,   // bottom row
            0, 1, 0, 0,   // top row
        };
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.format() == prism_image::pixel_format::rgb888);
        CHECK(grid.at(0, 0) == prism_image::pixel{0, 0, 255});
        CHECK(grid.at(1, 0) == prism_image::pixel{10, 20, 30});
        CHECK(grid.at(0, 1) == prism_image::pixel{10, 20, 30});
        CHECK(grid.at(1, 1) == prism_image::pixel{0, 0, 255});
    }

    SUBCASE("32-bit bitfields with alpha mask") {
        bmp_spec spec;
        spec.header_size = 56;
        spec.height = -1;
        spec.bits_per_pixel = 32;
        spec.compression = 3;
        spec.header_tail.clear();
        test_images::put_le32(spec.header_tail, 0x00FF0000);
        test_images::put_le32(spec.header_tail, 0x0000FF00);
        test_images::put_le32(spec.header_tail, 0x000000FF);
        test_images::put_le32(spec.header_tail, 0xFF000000);
        spec.pixel_data = {0x33, 0x22, 0x11, 0x80};
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.format() == prism_image::pixel_format::rgba8888);
        CHECK(grid.at(0, 0) == prism_image::pixel{0x11, 0x22, 0x33, 0x80});
    }

    SUBCASE("32-bit BI_RGB ignores the fourth byte") {
        bmp_spec spec;
        spec.bits_per_pixel = 32;
        spec.pixel_data = {3, 2, 1, 99};
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.format() == prism_image::pixel_format::rgb888);
        CHECK(grid.at(0, 0) == prism_image::pixel{1, 2, 3});
    }

    SUBCASE("16-bit bitfields with alpha mask") {
        bmp_spec spec;
        spec.header_size = 56;
        spec.bits_per_pixel = 16;
        spec.compression = 3;
        spec.header_tail.clear();
        test_images::put_le32(spec.header_tail, 0x0F00);
        test_images::put_le32(spec.header_tail, 0x00F0);
        test_images::put_le32(spec.header_tail, 0x000F);
        test_images::put_le32(spec.header_tail, 0xF000);
        spec.pixel_data = {0x42, 0x8F, 0, 0};  // a = 8, r = 15, g = 4, b = 2
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.format() == prism_image::pixel_format::rgba8888);
        CHECK(grid.at(0, 0) == prism_image::pixel{255, 68, 34, 136});
    }

    SUBCASE("16-bit bitfields without alpha mask") {
        bmp_spec spec;
        spec.bits_per_pixel = 16;
        spec.compression = 3;
        test_images::put_le32(spec.extra, 0xF800);
        test_images::put_le32(spec.extra, 0x07E0);
        test_images::put_le32(spec.extra, 0x001F);
        spec.pixel_data = {0x1F, 0xF8, 0, 0};  // r = 31, g = 0, b = 31
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.format() == prism_image::pixel_format::rgb888);
        CHECK(grid.at(0, 0) == prism_image::pixel{255, 0, 255});
    }

    SUBCASE("16-bit default 5-5-5 layout") {
        bmp_spec spec;
        spec.bits_per_pixel = 16;
        spec.pixel_data = {0x10, 0x7C, 0, 0};  // r = 31, g = 0, b = 16
        prism_image::pixel_grid grid;
        REQUIRE(decode_bmp(build_bmp(spec), grid).ok);
        CHECK(grid.at(0, 0) == prism_image::pixel{255, 0, 132});
    }
}

TEST_CASE("BMP codec: decode failures") {
    prism_image::pixel_grid grid;

    SUBCASE("RLE compression is unsupported") {
        bmp_spec spec;
        spec.bits_per_pixel = 8;
        spec.compression = 1;
        spec.pixel_data = {0, 0, 0, 1};
        auto res = decode_bmp(build_bmp(spec), grid);
        CHECK(res.error == prism_image::error_code::unsupported_format);
    }

    SUBCASE("Truncated pixel data") {
        auto data = bmp_24bit_3x2();
        data.resize(data.size() - 12);
        auto res = decode_bmp(data, grid);
        CHECK(res.error == prism_image::error_code::corrupt_input);
        CHECK(grid.empty());
    }

    SUBCASE("Truncated header") {
        auto data = bmp_24bit_3x2();
        data.resize(20);
        auto res = decode_bmp(data, grid);
        CHECK(res.error == prism_image::error_code::corrupt_input);
    }

    SUBCASE("Invalid bit depth") {
        bmp_spec spec;
        spec.bits_per_pixel = 7;
        spec.pixel_data = {0, 0, 0, 0};
        auto res = decode_bmp(build_bmp(spec), grid);
        CHECK(res.error == prism_image::error_code::corrupt_input);
    }

    SUBCASE("Zero width") {
        bmp_spec spec;
        spec.width = 0;
        auto res = decode_bmp(build_bmp(spec), grid);
        CHECK(res.error == prism_image::error_code::corrupt_input);
    }

    SUBCASE("Header dimensions over the limit") {
        bmp_spec spec;
        spec.width = 100000;
        spec.pixel_data = {0, 0, 0, 0};
        auto res = decode_bmp(build_bmp(spec), grid);
        CHECK(res.error == prism_image::error_code::resource_limit_exceeded);
    }
}

TEST_CASE("BMP codec: encode") {
    SUBCASE("Round trip is exact for RGB") {
        const auto grid = test_images::gradient(5, 3);
        std::vector<std::uint8_t> data;
        REQUIRE(prism_image::bmp_codec::encode(grid, data).ok);

        prism_image::pixel_grid decoded;
        REQUIRE(prism_image::decode(data, decoded).ok);
        CHECK(decoded == grid);
    }

    SUBCASE("Header fields") {
        std::vector<std::uint8_t> data;
        REQUIRE(prism_image::bmp_codec::encode(test_images::gradient(5, 3), data).ok);

        // 14 + 40 header bytes, rows of 15 bytes padded to 16
        REQUIRE(data.size() == 102);
        CHECK(data[0] == 'B');
        CHECK(data[1] == 'M');
        CHECK(data[2] == 102);
        CHECK(data[10] == 54);
        CHECK(data[14] == 40);
        CHECK(data[28] == 24);
        CHECK(data[30] == 0);                       // BI_RGB
        CHECK((data[38] | (data[39] << 8)) == 3779);  // 96 DPI
    }

    SUBCASE("Alpha is flattened onto the background") {
        auto grid = test_images::solid(2, 1, {0, 0, 255, 0}, prism_image::pixel_format::rgba8888);
        grid.set(1, 0, {0, 0, 255, 255});

        std::vector<std::uint8_t> data;
        REQUIRE(prism_image::bmp_codec::encode(grid, data).ok);

        prism_image::pixel_grid decoded;
        REQUIRE(prism_image::bmp_codec::decode(data, decoded).ok);
        CHECK(decoded.format() == prism_image::pixel_format::rgb888);
        CHECK(decoded.at(0, 0) == prism_image::pixel{255, 255, 255});
        CHECK(decoded.at(1, 0) == prism_image::pixel{0, 0, 255});

        prism_image::encode_options options;
        options.background = {10, 20, 30};
        grid.set(1, 0, {200, 100, 0, 128});
        REQUIRE(prism_image::bmp_codec::encode(grid, data, options).ok);
        REQUIRE(prism_image::bmp_codec::decode(data, decoded).ok);
        CHECK(decoded.at(0, 0) == prism_image::pixel{10, 20, 30});
        // (c * 128 + bg * 127 + 127) / 255
        CHECK(decoded.at(1, 0) == prism_image::pixel{105, 60, 15});
    }
}

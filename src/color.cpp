#include <prism_image/color.hpp>
#include "transform_helpers.hpp"

#include <cmath>
#include <string>

namespace prism_image {

namespace {

// Rec. 601 luma weights scaled by 1000
constexpr std::int64_t LUMA_R = 299;
constexpr std::int64_t LUMA_G = 587;
constexpr std::int64_t LUMA_B = 114;

// Sepia tone matrix, one row per output channel
constexpr double SEPIA[3][3] = {
    {0.393, 0.769, 0.189},
    {0.349, 0.686, 0.168},
    {0.272, 0.534, 0.131},
};

constexpr double CHECKER_DARKEN = 0.5;
constexpr double CHECKER_BRIGHTEN = 2.0;

} // namespace

result add_color(const pixel_grid& src, pixel_grid& dst, int dr, int dg, int db) {
    auto check = check_source(src, "add_color");
    if (!check) return check;

    const std::int64_t delta[3] = {dr, dg, db};
    return map_pixels(src, dst, [&](std::uint8_t* o, const std::uint8_t* in, int, int) {
        for (int c = 0; c < 3; ++c) {
            o[c] = clamp_channel(in[c] + delta[c]);
        }
    });
}

result shift_channel(const pixel_grid& src, pixel_grid& dst, channel ch, int amount) {
    auto check = check_source(src, "shift_channel");
    if (!check) return check;

    const int target = static_cast<int>(ch);
    return map_pixels(src, dst, [&](std::uint8_t* o, const std::uint8_t* in, int, int) {
        for (int c = 0; c < 3; ++c) {
            o[c] = c == target ? clamp_channel(static_cast<std::int64_t>(in[c]) + amount) : in[c];
        }
    });
}

result red_shift(const pixel_grid& src, pixel_grid& dst, int amount) {
    return shift_channel(src, dst, channel::red, amount);
}

result green_shift(const pixel_grid& src, pixel_grid& dst, int amount) {
    return shift_channel(src, dst, channel::green, amount);
}

result blue_shift(const pixel_grid& src, pixel_grid& dst, int amount) {
    return shift_channel(src, dst, channel::blue, amount);
}

result shift_brightness(const pixel_grid& src, pixel_grid& dst, double factor) {
    auto check = check_source(src, "shift_brightness");
    if (!check) return check;

    if (!std::isfinite(factor) || factor < 0.0 || factor > MAX_BRIGHTNESS_FACTOR) {
        return result::failure(error_code::invalid_parameter,
            "shift_brightness: factor must be within 0..64, got " + std::to_string(factor));
    }

    return map_pixels(src, dst, [&](std::uint8_t* o, const std::uint8_t* in, int, int) {
        for (int c = 0; c < 3; ++c) {
            o[c] = round_channel(in[c] * factor);
        }
    });
}

result make_monochrome(const pixel_grid& src, pixel_grid& dst) {
    auto check = check_source(src, "make_monochrome");
    if (!check) return check;

    return map_pixels(src, dst, [](std::uint8_t* o, const std::uint8_t* in, int, int) {
        const std::int64_t luma = (LUMA_R * in[0] + LUMA_G * in[1] + LUMA_B * in[2] + 500) / 1000;
        o[0] = o[1] = o[2] = clamp_channel(luma);
    });
}

result negative(const pixel_grid& src, pixel_grid& dst) {
    auto check = check_source(src, "negative");
    if (!check) return check;

    return map_pixels(src, dst, [](std::uint8_t* o, const std::uint8_t* in, int, int) {
        for (int c = 0; c < 3; ++c) {
            o[c] = static_cast<std::uint8_t>(255 - in[c]);
        }
    });
}

result sepia(const pixel_grid& src, pixel_grid& dst) {
    auto check = check_source(src, "sepia");
    if (!check) return check;

    return map_pixels(src, dst, [](std::uint8_t* o, const std::uint8_t* in, int, int) {
        for (int c = 0; c < 3; ++c) {
            o[c] = round_channel(SEPIA[c][0] * in[0] + SEPIA[c][1] * in[1] + SEPIA[c][2] * in[2]);
        }
    });
}

result checkerboard(const pixel_grid& src, pixel_grid& dst, int size) {
    auto check = check_source(src, "checkerboard");
    if (!check) return check;
    check = check_range("checkerboard", "size", size, 1, MAX_BLOCK_SIZE);
    if (!check) return check;

    return map_pixels(src, dst, [&](std::uint8_t* o, const std::uint8_t* in, int x, int y) {
        const bool even = ((y / size) + (x / size)) % 2 == 0;
        const double factor = even ? CHECKER_DARKEN : CHECKER_BRIGHTEN;
        for (int c = 0; c < 3; ++c) {
            o[c] = round_channel(in[c] * factor);
        }
    });
}

} // namespace prism_image

#pragma once

#include <prism_image/types.hpp>
#include <prism_image/pixel_grid.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace prism_image {

// Parameter ceilings shared by the operators and the dispatcher tables
constexpr int MAX_TILE_SIZE = 64;
constexpr int MAX_BLUR_RADIUS = 256;
constexpr int MAX_BLOCK_SIZE = 65536;
constexpr double MAX_BRIGHTNESS_FACTOR = 64.0;

inline result check_source(const pixel_grid& src, const char* op) {
    if (src.empty() || src.width() <= 0 || src.height() <= 0) {
        return result::failure(error_code::invalid_parameter,
            std::string(op) + ": source grid is empty");
    }
    return result::success();
}

inline result check_range(const char* op, const char* param, std::int64_t value,
                          std::int64_t min, std::int64_t max) {
    if (value < min || value > max) {
        return result::failure(error_code::invalid_parameter,
            std::string(op) + ": " + param + " must be within " + std::to_string(min) +
            ".." + std::to_string(max) + ", got " + std::to_string(value));
    }
    return result::success();
}

inline result allocate(pixel_grid& out, int width, int height, pixel_format format) {
    if (!out.set_size(width, height, format)) {
        return result::failure(error_code::internal_error, "Failed to allocate output grid");
    }
    return result::success();
}

// Apply fn(dst_rgb, src_rgb, x, y) to every pixel, copying alpha through.
// The output is built aside and moved into dst only on success.
template <typename Fn>
result map_pixels(const pixel_grid& src, pixel_grid& dst, Fn fn) {
    pixel_grid out;
    auto alloc = allocate(out, src.width(), src.height(), src.format());
    if (!alloc) return alloc;

    const std::size_t bpp = src.channels();
    const std::uint8_t* in = src.pixels().data();
    std::uint8_t* o = out.mutable_pixels().data();

    for (int y = 0; y < src.height(); ++y) {
        for (int x = 0; x < src.width(); ++x, in += bpp, o += bpp) {
            fn(o, in, x, y);
            if (bpp == 4) {
                o[3] = in[3];
            }
        }
    }

    dst = std::move(out);
    return result::success();
}

} // namespace prism_image

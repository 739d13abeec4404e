#include <prism_image/geometry.hpp>
#include "transform_helpers.hpp"

#include <cstring>
#include <string>

namespace prism_image {

result mirror_horizontal(const pixel_grid& src, pixel_grid& dst) {
    auto check = check_source(src, "mirror_horizontal");
    if (!check) return check;

    pixel_grid out;
    auto alloc = allocate(out, src.width(), src.height(), src.format());
    if (!alloc) return alloc;

    const std::size_t bpp = src.channels();
    const std::uint8_t* in = src.pixels().data();
    std::uint8_t* o = out.mutable_pixels().data();
    const int w = src.width();

    for (int y = 0; y < src.height(); ++y) {
        for (int x = 0; x < w; ++x) {
            std::memcpy(o + out.offset(x, y), in + src.offset(w - 1 - x, y), bpp);
        }
    }

    dst = std::move(out);
    return result::success();
}

result mirror_vertical(const pixel_grid& src, pixel_grid& dst) {
    auto check = check_source(src, "mirror_vertical");
    if (!check) return check;

    pixel_grid out;
    auto alloc = allocate(out, src.width(), src.height(), src.format());
    if (!alloc) return alloc;

    const std::size_t pitch = src.pitch();
    const std::uint8_t* in = src.pixels().data();
    std::uint8_t* o = out.mutable_pixels().data();
    const int h = src.height();

    for (int y = 0; y < h; ++y) {
        std::memcpy(o + static_cast<std::size_t>(y) * pitch,
                    in + static_cast<std::size_t>(h - 1 - y) * pitch, pitch);
    }

    dst = std::move(out);
    return result::success();
}

result rotate(const pixel_grid& src, pixel_grid& dst, int degrees) {
    auto check = check_source(src, "rotate");
    if (!check) return check;

    if (degrees % 90 != 0) {
        return result::failure(error_code::invalid_parameter,
            "rotate: degrees must be a multiple of 90, got " + std::to_string(degrees));
    }

    // Clockwise quarter turns in 0..3
    const int turns = ((degrees / 90) % 4 + 4) % 4;
    if (turns == 0) {
        dst = src.clone();
        return result::success();
    }

    const int w = src.width();
    const int h = src.height();
    const bool swap = turns != 2;

    pixel_grid out;
    auto alloc = allocate(out, swap ? h : w, swap ? w : h, src.format());
    if (!alloc) return alloc;

    const std::size_t bpp = src.channels();
    const std::uint8_t* in = src.pixels().data();
    std::uint8_t* o = out.mutable_pixels().data();

    for (int y = 0; y < out.height(); ++y) {
        for (int x = 0; x < out.width(); ++x) {
            int sx = 0;
            int sy = 0;
            switch (turns) {
                case 1:  // clockwise: transpose, then reverse each row
                    sx = y;
                    sy = h - 1 - x;
                    break;
                case 2:
                    sx = w - 1 - x;
                    sy = h - 1 - y;
                    break;
                default:  // counter-clockwise: transpose, then reverse the rows
                    sx = w - 1 - y;
                    sy = x;
                    break;
            }
            std::memcpy(o + out.offset(x, y), in + src.offset(sx, sy), bpp);
        }
    }

    dst = std::move(out);
    return result::success();
}

result tile(const pixel_grid& src, pixel_grid& dst, int size, const engine_limits& limits) {
    auto check = check_source(src, "tile");
    if (!check) return check;
    check = check_range("tile", "size", size, 1, MAX_TILE_SIZE);
    if (!check) return check;

    const std::int64_t out_w = static_cast<std::int64_t>(src.width()) * size;
    const std::int64_t out_h = static_cast<std::int64_t>(src.height()) * size;
    check = check_limits(out_w, out_h, src.format(), limits);
    if (!check) return check;

    pixel_grid out;
    auto alloc = allocate(out, static_cast<int>(out_w), static_cast<int>(out_h), src.format());
    if (!alloc) return alloc;

    const std::size_t src_pitch = src.pitch();
    const std::uint8_t* in = src.pixels().data();
    std::uint8_t* o = out.mutable_pixels().data();

    for (int y = 0; y < out.height(); ++y) {
        const std::uint8_t* row = in + static_cast<std::size_t>(y % src.height()) * src_pitch;
        std::uint8_t* dst_row = o + static_cast<std::size_t>(y) * out.pitch();
        for (int t = 0; t < size; ++t) {
            std::memcpy(dst_row + static_cast<std::size_t>(t) * src_pitch, row, src_pitch);
        }
    }

    dst = std::move(out);
    return result::success();
}

result resize(const pixel_grid& src, pixel_grid& dst, int width, int height,
              const engine_limits& limits) {
    auto check = check_source(src, "resize");
    if (!check) return check;

    if (width < 1 || height < 1) {
        return result::failure(error_code::invalid_parameter,
            "resize: width and height must be at least 1, got " +
            std::to_string(width) + "x" + std::to_string(height));
    }

    check = check_limits(width, height, src.format(), limits);
    if (!check) return check;

    pixel_grid out;
    auto alloc = allocate(out, width, height, src.format());
    if (!alloc) return alloc;

    const std::size_t bpp = src.channels();
    const std::int64_t src_w = src.width();
    const std::int64_t src_h = src.height();
    const std::uint8_t* in = src.pixels().data();
    std::uint8_t* o = out.mutable_pixels().data();

    for (int y = 0; y < height; ++y) {
        const auto sy = static_cast<int>(y * src_h / height);
        for (int x = 0; x < width; ++x) {
            const auto sx = static_cast<int>(x * src_w / width);
            std::memcpy(o + out.offset(x, y), in + src.offset(sx, sy), bpp);
        }
    }

    dst = std::move(out);
    return result::success();
}

} // namespace prism_image

#pragma once

#include <prism_image/types.hpp>
#include <prism_image/surface.hpp>
#include <prism_image/pixel_grid.hpp>

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace prism_image {

// Check header dimensions (as read from the container) against decode limits.
// Values that do not fit an int are reported as exceeding the limits.
inline result validate_dimensions(std::int64_t width, std::int64_t height,
                                  pixel_format format, const decode_options& options) {
    if (width <= 0 || height <= 0) {
        return result::failure(error_code::corrupt_input, "Image header has zero dimensions");
    }
    constexpr std::int64_t max_int = std::numeric_limits<int>::max();
    if (width > max_int || height > max_int) {
        return result::failure(error_code::resource_limit_exceeded,
            "Image dimensions exceed maximum supported size");
    }
    return check_limits(width, height, format, options.limits);
}

// Copy pixel data row-by-row to a surface
// data: pointer to pixel data (row-major, contiguous)
// row_bytes: bytes per row in the source data
// height: number of rows to copy
inline void write_rows(surface& surf, const std::uint8_t* data,
                       std::size_t row_bytes, int height) {
    for (int y = 0; y < height; ++y) {
        surf.write_pixels(0, y, static_cast<int>(row_bytes),
                          data + static_cast<std::size_t>(y) * row_bytes);
    }
}

// Row stride calculation (4-byte aligned, for BMP/DIB formats)
inline std::size_t row_stride_4byte(int width, int bits_per_pixel) {
    return ((static_cast<std::size_t>(width) * static_cast<std::size_t>(bits_per_pixel) + 31) / 32) * 4;
}

// Extract pixel from packed data (1, 4, or 8 bits per pixel)
inline std::uint8_t extract_pixel(const std::uint8_t* row, int x, int bits_per_pixel) {
    switch (bits_per_pixel) {
        case 1: {
            int byte_index = x / 8;
            int bit_index = 7 - (x % 8);
            return (row[byte_index] >> bit_index) & 0x01;
        }
        case 4: {
            int byte_index = x / 2;
            int bit_index = (x % 2) ? 0 : 4;
            return (row[byte_index] >> bit_index) & 0x0F;
        }
        case 8:
            return row[x];
        default:
            return 0;
    }
}

// Composite one straight-alpha channel over an opaque background
inline std::uint8_t flatten_channel(std::uint8_t c, std::uint8_t a, std::uint8_t bg) {
    const unsigned v = static_cast<unsigned>(c) * a + static_cast<unsigned>(bg) * (255u - a);
    return static_cast<std::uint8_t>((v + 127u) / 255u);
}

// Tightly packed RGB copy of a grid, compositing alpha over the background
inline std::vector<std::uint8_t> flatten_to_rgb(const pixel_grid& grid, const pixel& background) {
    const std::size_t count = static_cast<std::size_t>(grid.width()) *
                              static_cast<std::size_t>(grid.height());
    const auto src = grid.pixels();

    if (!grid.has_alpha()) {
        return std::vector<std::uint8_t>(src.begin(), src.end());
    }

    std::vector<std::uint8_t> rgb(count * 3);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t a = src[i * 4 + 3];
        rgb[i * 3 + 0] = flatten_channel(src[i * 4 + 0], a, background.r);
        rgb[i * 3 + 1] = flatten_channel(src[i * 4 + 1], a, background.g);
        rgb[i * 3 + 2] = flatten_channel(src[i * 4 + 2], a, background.b);
    }
    return rgb;
}

inline result validate_encode_input(const pixel_grid& grid, const encode_options& options) {
    if (grid.empty() || grid.width() <= 0 || grid.height() <= 0) {
        return result::failure(error_code::invalid_parameter, "Cannot encode an empty grid");
    }
    if (options.quality < 0 || options.quality > 100) {
        return result::failure(error_code::invalid_parameter,
            "Quality must be within 0..100, got " + std::to_string(options.quality));
    }
    return result::success();
}

} // namespace prism_image

#pragma once

#include <prism_image/pixel_grid.hpp>

#include <cstdint>
#include <cstring>
#include <vector>

namespace test_images {

// Grid filled from fn(x, y) -> pixel
template <typename Fn>
prism_image::pixel_grid make_grid(int width, int height, prism_image::pixel_format format, Fn fn) {
    prism_image::pixel_grid grid;
    if (!grid.set_size(width, height, format)) {
        return grid;
    }
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            grid.set(x, y, fn(x, y));
        }
    }
    return grid;
}

// Every pixel distinct enough that a misplaced pixel is caught
inline prism_image::pixel_grid gradient(int width, int height, bool alpha = false) {
    const auto format = alpha ? prism_image::pixel_format::rgba8888 : prism_image::pixel_format::rgb888;
    return make_grid(width, height, format, [alpha](int x, int y) {
        return prism_image::pixel{
            static_cast<std::uint8_t>((x * 37 + y * 11) % 256),
            static_cast<std::uint8_t>((x * 13 + y * 59) % 256),
            static_cast<std::uint8_t>((x * 7 + y * 3 + 100) % 256),
            static_cast<std::uint8_t>(alpha ? (x * 5 + y * 17 + 1) % 256 : 255)};
    });
}

inline prism_image::pixel_grid solid(int width, int height, prism_image::pixel p,
                                     prism_image::pixel_format format = prism_image::pixel_format::rgb888) {
    prism_image::pixel_grid grid;
    if (grid.set_size(width, height, format)) {
        grid.fill(p);
    }
    return grid;
}

// Single row grid from a list of pixels
inline prism_image::pixel_grid row(const std::vector<prism_image::pixel>& pixels,
                                   prism_image::pixel_format format = prism_image::pixel_format::rgb888) {
    return make_grid(static_cast<int>(pixels.size()), 1, format,
                     [&pixels](int x, int) { return pixels[static_cast<std::size_t>(x)]; });
}

inline void put_le16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

inline void put_le32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    put_le16(out, static_cast<std::uint16_t>(v & 0xFFFF));
    put_le16(out, static_cast<std::uint16_t>((v >> 16) & 0xFFFF));
}

} // namespace test_images

#include <prism_image/filters.hpp>
#include "transform_helpers.hpp"

#include <algorithm>
#include <new>
#include <vector>

namespace prism_image {

// Separable running-sum box filter. Column sums over the current (2r+1)-row
// window are exact integers, so the horizontal running sum over them is the
// full square window sum and dividing once gives the direct window mean.
// Scratch space is one row of sums.
result blur(const pixel_grid& src, pixel_grid& dst, int radius) {
    auto check = check_source(src, "blur");
    if (!check) return check;
    check = check_range("blur", "radius", radius, 1, MAX_BLUR_RADIUS);
    if (!check) return check;

    const int w = src.width();
    const int h = src.height();
    const std::size_t ch = src.channels();
    const std::size_t stride = static_cast<std::size_t>(w) * ch;
    const std::uint8_t* in = src.pixels().data();

    auto row_at = [&](int y) { return in + static_cast<std::size_t>(std::clamp(y, 0, h - 1)) * stride; };
    auto col = [ch, w](int x) { return static_cast<std::size_t>(std::clamp(x, 0, w - 1)) * ch; };

    pixel_grid out;
    auto alloc = allocate(out, w, h, src.format());
    if (!alloc) return alloc;
    std::uint8_t* o = out.mutable_pixels().data();

    std::vector<std::uint32_t> col_sums;
    try {
        col_sums.assign(stride, 0);
    } catch (const std::bad_alloc&) {
        return result::failure(error_code::internal_error, "blur: failed to allocate row sums");
    }

    for (int k = -radius; k <= radius; ++k) {
        const std::uint8_t* r = row_at(k);
        for (std::size_t i = 0; i < stride; ++i) {
            col_sums[i] += r[i];
        }
    }

    const std::uint32_t window = 2u * static_cast<std::uint32_t>(radius) + 1u;
    const std::uint32_t count = window * window;

    for (int y = 0; y < h; ++y) {
        std::uint8_t* dst_row = o + static_cast<std::size_t>(y) * stride;
        for (std::size_t c = 0; c < ch; ++c) {
            std::uint32_t sum = 0;
            for (int k = -radius; k <= radius; ++k) {
                sum += col_sums[col(k) + c];
            }
            for (int x = 0; x < w; ++x) {
                dst_row[static_cast<std::size_t>(x) * ch + c] = static_cast<std::uint8_t>((sum + count / 2) / count);
                sum += col_sums[col(x + radius + 1) + c];
                sum -= col_sums[col(x - radius) + c];
            }
        }

        // Slide the row window down by one
        const std::uint8_t* enter = row_at(y + radius + 1);
        const std::uint8_t* leave = row_at(y - radius);
        for (std::size_t i = 0; i < stride; ++i) {
            col_sums[i] += enter[i];
            col_sums[i] -= leave[i];
        }
    }

    dst = std::move(out);
    return result::success();
}

result pixelate(const pixel_grid& src, pixel_grid& dst, int block) {
    auto check = check_source(src, "pixelate");
    if (!check) return check;
    check = check_range("pixelate", "block", block, 1, MAX_BLOCK_SIZE);
    if (!check) return check;

    pixel_grid out;
    auto alloc = allocate(out, src.width(), src.height(), src.format());
    if (!alloc) return alloc;

    const int w = src.width();
    const int h = src.height();
    const std::size_t ch = src.channels();
    const std::uint8_t* in = src.pixels().data();
    std::uint8_t* o = out.mutable_pixels().data();

    for (int y0 = 0; y0 < h; y0 += block) {
        const int y1 = std::min(h, y0 + block);
        for (int x0 = 0; x0 < w; x0 += block) {
            const int x1 = std::min(w, x0 + block);

            std::uint64_t sums[4] = {0, 0, 0, 0};
            for (int y = y0; y < y1; ++y) {
                for (int x = x0; x < x1; ++x) {
                    const std::uint8_t* p = in + src.offset(x, y);
                    for (std::size_t c = 0; c < ch; ++c) {
                        sums[c] += p[c];
                    }
                }
            }

            const auto count = static_cast<std::uint64_t>(y1 - y0) * static_cast<std::uint64_t>(x1 - x0);
            std::uint8_t mean[4] = {0, 0, 0, 0};
            for (std::size_t c = 0; c < ch; ++c) {
                mean[c] = static_cast<std::uint8_t>((sums[c] + count / 2) / count);
            }

            for (int y = y0; y < y1; ++y) {
                for (int x = x0; x < x1; ++x) {
                    std::uint8_t* p = o + out.offset(x, y);
                    for (std::size_t c = 0; c < ch; ++c) {
                        p[c] = mean[c];
                    }
                }
            }
        }
    }

    dst = std::move(out);
    return result::success();
}

} // namespace prism_image

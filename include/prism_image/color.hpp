#ifndef PRISM_IMAGE_COLOR_HPP_
#define PRISM_IMAGE_COLOR_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/pixel_grid.hpp>

namespace prism_image {

// ============================================================================
// Colour Operators
// ============================================================================
//
// Every operator reads src and, on success only, replaces dst with a new
// grid of the same size and format. src and dst may be the same object.
// Alpha is copied through unchanged. Results are rounded (ties up) and
// clamped to 0..255.

enum class channel {
    red,
    green,
    blue
};

/**
 * Add a signed delta to each colour channel.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result add_color(const pixel_grid& src, pixel_grid& dst,
                                                  int dr, int dg, int db);

/**
 * Add a signed amount to one channel, leaving the other two untouched.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result shift_channel(const pixel_grid& src, pixel_grid& dst,
                                                      channel ch, int amount);

[[nodiscard]] PRISM_IMAGE_EXPORT result red_shift(const pixel_grid& src, pixel_grid& dst, int amount);
[[nodiscard]] PRISM_IMAGE_EXPORT result green_shift(const pixel_grid& src, pixel_grid& dst, int amount);
[[nodiscard]] PRISM_IMAGE_EXPORT result blue_shift(const pixel_grid& src, pixel_grid& dst, int amount);

/**
 * Multiply every colour channel by factor.
 * factor > 1 brightens, 0..1 darkens. Must be finite and within 0..64.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result shift_brightness(const pixel_grid& src, pixel_grid& dst,
                                                         double factor);

/**
 * Replace each pixel by its Rec. 601 luma (0.299 R + 0.587 G + 0.114 B),
 * computed in integers so results are bit-exact on every platform.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result make_monochrome(const pixel_grid& src, pixel_grid& dst);

// v -> 255 - v
[[nodiscard]] PRISM_IMAGE_EXPORT result negative(const pixel_grid& src, pixel_grid& dst);

// Classic sepia tone matrix
[[nodiscard]] PRISM_IMAGE_EXPORT result sepia(const pixel_grid& src, pixel_grid& dst);

/**
 * Darken and brighten alternating size x size tiles.
 * Tiles where (tile_row + tile_col) is even are halved, the others doubled.
 * Partial tiles at the right and bottom edges are treated like full ones.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result checkerboard(const pixel_grid& src, pixel_grid& dst, int size);

} // namespace prism_image

#endif // PRISM_IMAGE_COLOR_HPP_

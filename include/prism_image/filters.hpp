#ifndef PRISM_IMAGE_FILTERS_HPP_
#define PRISM_IMAGE_FILTERS_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/pixel_grid.hpp>

namespace prism_image {

// ============================================================================
// Neighbourhood Operators
// ============================================================================
//
// All channels, alpha included, are averaged. Means round half up.

/**
 * Box blur.
 * Each output pixel is the mean of the (2 * radius + 1)^2 window around it.
 * Window coordinates outside the image are clamped to the nearest edge pixel.
 * @param radius 1..256
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result blur(const pixel_grid& src, pixel_grid& dst, int radius);

/**
 * Replace each block x block cell by its mean colour.
 * Cells are aligned to the top-left corner; those on the right and bottom
 * edges may be smaller.
 * @param block 1..65536
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result pixelate(const pixel_grid& src, pixel_grid& dst, int block);

} // namespace prism_image

#endif // PRISM_IMAGE_FILTERS_HPP_

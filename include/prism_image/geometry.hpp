#ifndef PRISM_IMAGE_GEOMETRY_HPP_
#define PRISM_IMAGE_GEOMETRY_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/pixel_grid.hpp>

namespace prism_image {

// ============================================================================
// Geometric Operators
// ============================================================================

// Reverse pixel order within each row
[[nodiscard]] PRISM_IMAGE_EXPORT result mirror_horizontal(const pixel_grid& src, pixel_grid& dst);

// Reverse row order
[[nodiscard]] PRISM_IMAGE_EXPORT result mirror_vertical(const pixel_grid& src, pixel_grid& dst);

/**
 * Rotate in quarter turns.
 * @param degrees Any multiple of 90. Positive turns clockwise, negative
 *                counter-clockwise. 90 and 270 swap width and height.
 * @return invalid_parameter if degrees is not a multiple of 90
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result rotate(const pixel_grid& src, pixel_grid& dst, int degrees);

/**
 * Repeat the whole image size x size times edge to edge.
 * The output is (width * size) x (height * size); size 1 copies the source.
 * @param size 1..64
 * @param limits Ceiling for the output grid
 * @return invalid_parameter for size outside 1..64, resource_limit_exceeded
 *         if the output would exceed limits
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result tile(const pixel_grid& src, pixel_grid& dst, int size,
                                             const engine_limits& limits = {});

/**
 * Nearest-neighbour resample to width x height.
 * Output (x, y) samples source (x * src_w / width, y * src_h / height),
 * rounded down.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result resize(const pixel_grid& src, pixel_grid& dst,
                                               int width, int height,
                                               const engine_limits& limits = {});

} // namespace prism_image

#endif // PRISM_IMAGE_GEOMETRY_HPP_

#ifndef PRISM_IMAGE_SURFACE_HPP_
#define PRISM_IMAGE_SURFACE_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>

#include <cstdint>

namespace prism_image {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for decode targets.
 * Decoders write pixels to surfaces, so a caller can decode straight into
 * its own storage (a texture, a shared buffer) instead of a pixel_grid.
 */
class PRISM_IMAGE_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions and pixel format.
     * Called before any pixel writes.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Write a horizontal run of pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     * For RGB formats, use x = pixel_x * 3; for RGBA, use x = pixel_x * 4.
     *
     * @param x Starting byte offset within the row (NOT pixel coordinate)
     * @param y Y coordinate (row number)
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;
};

} // namespace prism_image

#endif // PRISM_IMAGE_SURFACE_HPP_

#ifndef PRISM_IMAGE_PIXEL_GRID_HPP_
#define PRISM_IMAGE_PIXEL_GRID_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/surface.hpp>
#include <prism_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace prism_image {

// ============================================================================
// Pixel Grid
// ============================================================================

/**
 * Decoded image held in one contiguous row-major buffer.
 *
 * Pixel (x, y) starts at byte y * pitch() + x * bytes_per_pixel(format()).
 * There is no row padding, so pitch() == width() * bytes_per_pixel(format()).
 *
 * Transforms never write to their source grid. Copying is explicit through
 * clone() so that a grid is never duplicated by accident.
 */
class PRISM_IMAGE_EXPORT pixel_grid : public surface {
public:
    pixel_grid() = default;
    ~pixel_grid() override = default;

    pixel_grid(const pixel_grid&) = delete;
    pixel_grid& operator=(const pixel_grid&) = delete;
    pixel_grid(pixel_grid&&) noexcept = default;
    pixel_grid& operator=(pixel_grid&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height, pixel_format format) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;

    /**
     * Deep copy of this grid.
     */
    [[nodiscard]] pixel_grid clone() const;

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] bool has_alpha() const noexcept { return format_ == pixel_format::rgba8888; }
    [[nodiscard]] std::size_t channels() const noexcept { return bytes_per_pixel(format_); }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }

    // Mutable accessors (for filling a freshly sized grid)
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }

    [[nodiscard]] std::size_t offset(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * pitch_ +
               static_cast<std::size_t>(x) * bytes_per_pixel(format_);
    }

    /**
     * Read a pixel. Alpha is 255 for rgb888 grids.
     * Coordinates must be inside the grid.
     */
    [[nodiscard]] pixel at(int x, int y) const noexcept;

    /**
     * Write a pixel. Alpha is dropped for rgb888 grids.
     * Out-of-range coordinates are ignored.
     */
    void set(int x, int y, const pixel& p) noexcept;

    /**
     * Fill every pixel with one colour.
     */
    void fill(const pixel& p) noexcept;

    friend PRISM_IMAGE_EXPORT bool operator==(const pixel_grid& lhs, const pixel_grid& rhs) noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgb888;
};

/**
 * Predicted buffer size for a grid, or 0 if the size overflows std::size_t.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT std::size_t buffer_size(std::int64_t width, std::int64_t height,
                                                          pixel_format format) noexcept;

/**
 * Check a grid shape against limits before allocating it.
 * @return success, invalid_parameter for non-positive dimensions, or
 *         resource_limit_exceeded when a dimension or the buffer is too large
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result check_limits(std::int64_t width, std::int64_t height,
                                                      pixel_format format,
                                                      const engine_limits& limits);

} // namespace prism_image

#endif // PRISM_IMAGE_PIXEL_GRID_HPP_

#include <prism_image/pixel_grid.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>
#include <string>

namespace prism_image {

namespace {

// Hard upper bound for any single allocation, independent of engine_limits
constexpr std::size_t MAX_BUFFER_SIZE = 1024ULL * 1024ULL * 1024ULL;

} // namespace

std::size_t buffer_size(std::int64_t width, std::int64_t height, pixel_format format) noexcept {
    if (width <= 0 || height <= 0) {
        return 0;
    }

    const auto w = static_cast<std::uint64_t>(width);
    const auto h = static_cast<std::uint64_t>(height);
    const std::uint64_t bpp = bytes_per_pixel(format);
    constexpr auto max_size = static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max());

    // Check for overflow in pitch calculation (width * bpp)
    if (w > max_size / bpp) {
        return 0;
    }
    const std::uint64_t pitch = w * bpp;

    // Check for overflow in total size calculation (pitch * height)
    if (pitch > max_size / h) {
        return 0;
    }
    return static_cast<std::size_t>(pitch * h);
}

result check_limits(std::int64_t width, std::int64_t height,
                    pixel_format format, const engine_limits& limits) {
    if (width <= 0 || height <= 0) {
        return result::failure(error_code::invalid_parameter,
            "Image dimensions must be positive");
    }

    const engine_limits defaults;
    const std::int64_t max_w = limits.max_width > 0 ? limits.max_width : defaults.max_width;
    const std::int64_t max_h = limits.max_height > 0 ? limits.max_height : defaults.max_height;
    const std::size_t max_bytes = limits.max_buffer_bytes > 0 ? limits.max_buffer_bytes
                                                              : defaults.max_buffer_bytes;

    if (width > max_w || height > max_h) {
        return result::failure(error_code::resource_limit_exceeded,
            "Image dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed limits");
    }

    const std::size_t bytes = buffer_size(width, height, format);
    if (bytes == 0 || bytes > max_bytes || bytes > MAX_BUFFER_SIZE) {
        return result::failure(error_code::resource_limit_exceeded,
            "Pixel buffer would exceed the memory ceiling");
    }

    return result::success();
}

bool pixel_grid::set_size(int width, int height, pixel_format format) {
    const std::size_t total_size = buffer_size(width, height, format);
    if (total_size == 0 || total_size > MAX_BUFFER_SIZE) {
        return false;
    }

    try {
        pixels_.assign(total_size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = static_cast<std::size_t>(width) * bytes_per_pixel(format);

    return true;
}

void pixel_grid::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (y < 0 || y >= height_ || x < 0 || count <= 0 || !pixels) {
        return;
    }

    const std::size_t x_offset = static_cast<std::size_t>(x);

    // Guard against x >= pitch_ to prevent underflow in max_bytes calculation
    if (x_offset >= pitch_) {
        return;
    }

    const std::size_t row_offset = static_cast<std::size_t>(y) * pitch_ + x_offset;
    const std::size_t max_bytes = pitch_ - x_offset;
    const std::size_t bytes_to_copy = std::min(static_cast<std::size_t>(count), max_bytes);

    if (row_offset + bytes_to_copy <= pixels_.size()) {
        std::memcpy(pixels_.data() + row_offset, pixels, bytes_to_copy);
    }
}

pixel_grid pixel_grid::clone() const {
    pixel_grid copy;
    copy.pixels_ = pixels_;
    copy.width_ = width_;
    copy.height_ = height_;
    copy.pitch_ = pitch_;
    copy.format_ = format_;
    return copy;
}

pixel pixel_grid::at(int x, int y) const noexcept {
    const std::uint8_t* p = pixels_.data() + offset(x, y);
    if (format_ == pixel_format::rgba8888) {
        return {p[0], p[1], p[2], p[3]};
    }
    return {p[0], p[1], p[2], 255};
}

void pixel_grid::set(int x, int y, const pixel& p) noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return;
    }

    std::uint8_t* dst = pixels_.data() + offset(x, y);
    dst[0] = p.r;
    dst[1] = p.g;
    dst[2] = p.b;
    if (format_ == pixel_format::rgba8888) {
        dst[3] = p.a;
    }
}

void pixel_grid::fill(const pixel& p) noexcept {
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            set(x, y, p);
        }
    }
}

bool operator==(const pixel_grid& lhs, const pixel_grid& rhs) noexcept {
    return lhs.width_ == rhs.width_ &&
           lhs.height_ == rhs.height_ &&
           lhs.format_ == rhs.format_ &&
           lhs.pixels_ == rhs.pixels_;
}

} // namespace prism_image

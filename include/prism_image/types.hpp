#ifndef PRISM_IMAGE_TYPES_HPP_
#define PRISM_IMAGE_TYPES_HPP_

#include <prism_image/prism_image_export.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace prism_image {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    rgb888,     // 24-bit, 8-bit RGB components, no alpha
    rgba8888    // 32-bit, 8-bit RGBA components (straight alpha)
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::rgb888:   return 3;
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

// ============================================================================
// Pixel
// ============================================================================

/**
 * A single colour value. Components are always within 0..255; arithmetic that
 * leaves that range goes through clamp_channel() before a pixel is built.
 */
struct pixel {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    friend constexpr bool operator==(const pixel&, const pixel&) noexcept = default;
};

// Saturate to the channel range (clamp, never wrap)
[[nodiscard]] constexpr std::uint8_t clamp_channel(std::int64_t v) noexcept {
    if (v < 0) return 0;
    if (v > 255) return 255;
    return static_cast<std::uint8_t>(v);
}

// Round to nearest with ties going up, then saturate
[[nodiscard]] constexpr std::uint8_t round_channel(double v) noexcept {
    if (!(v > 0.0)) return 0;  // also catches NaN
    if (v >= 255.0) return 255;
    return static_cast<std::uint8_t>(static_cast<int>(v + 0.5));
}

// ============================================================================
// Image Formats
// ============================================================================

enum class image_format {
    png,
    jpeg,
    webp,
    bmp
};

[[nodiscard]] PRISM_IMAGE_EXPORT const char* to_string(image_format fmt) noexcept;

/**
 * Parse a format name ("png", "jpg", "jpeg", "webp", "bmp").
 * A leading dot is accepted so file extensions can be passed directly.
 * @return Format, or std::nullopt if the name is not recognised
 */
[[nodiscard]] PRISM_IMAGE_EXPORT std::optional<image_format> parse_image_format(std::string_view name) noexcept;

// ============================================================================
// Errors
// ============================================================================

enum class error_code {
    none,
    unsupported_format,
    corrupt_input,
    unknown_operation,
    invalid_parameter,
    resource_limit_exceeded,
    encode_failed,
    internal_error
};

[[nodiscard]] PRISM_IMAGE_EXPORT const char* to_string(error_code err) noexcept;

// ============================================================================
// Result
// ============================================================================

struct result {
    bool ok = false;
    error_code error = error_code::none;
    std::string message;

    [[nodiscard]] static result success() {
        return {true, error_code::none, {}};
    }

    [[nodiscard]] static result failure(error_code err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Options
// ============================================================================

struct engine_limits {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // Ceiling for a single pixel buffer in bytes (0 = use default)
    std::size_t max_buffer_bytes = 512ULL * 1024ULL * 1024ULL;
};

struct decode_options {
    engine_limits limits;
};

struct encode_options {
    // Lossy quality for JPEG and WEBP, 0..100. Ignored by PNG and BMP.
    int quality = 90;

    // WEBP only: use the lossless encoder and ignore quality
    bool lossless = false;

    // Colour that alpha is flattened onto for formats without alpha
    pixel background = {255, 255, 255, 255};
};

} // namespace prism_image

#endif // PRISM_IMAGE_TYPES_HPP_

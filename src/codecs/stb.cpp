// stb_image / stb_image_write based JPEG codec

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO  // Byte buffers only, never files
#define STBI_NO_PNG    // We use lodepng for PNG
#define STBI_NO_BMP    // BMP is handled natively
#define STBI_NO_PSD
#define STBI_NO_TGA
#define STBI_NO_GIF
#define STBI_NO_HDR
#define STBI_NO_PIC
#define STBI_NO_PNM

#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_WRITE_NO_STDIO

#include <stb_image_write.h>

#include <prism_image/codecs/jpeg.hpp>
#include "codec_helpers.hpp"

#include <limits>
#include <memory>
#include <string>

namespace prism_image {

namespace {

// stb_image_write cannot address larger images (16-bit SOF fields)
constexpr int JPEG_MAX_DIMENSION = 65535;

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

// stb_image zero-fills a scan that runs out of data, so a cut-off stream has
// to be caught by its missing EOI marker. Trailing fill bytes are tolerated.
bool has_end_marker(std::span<const std::uint8_t> data) noexcept {
    std::size_t end = data.size();
    while (end > 0 && (data[end - 1] == 0x00 || data[end - 1] == 0xFF)) {
        --end;
    }
    return end >= 4 && data[end - 2] == 0xFF && data[end - 1] == 0xD9;
}

} // namespace

// ============================================================================
// JPEG Decoder
// ============================================================================

bool jpeg_codec::sniff(std::span<const std::uint8_t> data) noexcept {
    // JPEG starts with FFD8FF
    if (data.size() < 3) {
        return false;
    }
    return data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

result jpeg_codec::decode(std::span<const std::uint8_t> data,
                          surface& surf,
                          const decode_options& options) {
    if (!sniff(data)) {
        return result::failure(error_code::unsupported_format, "Not a valid JPEG file");
    }

    // Guard against data size exceeding INT_MAX (stb uses int for length)
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return result::failure(error_code::resource_limit_exceeded,
            "Input data exceeds maximum supported size");
    }

    // Header pass: a JPEG signature without a readable frame header is corrupt
    int info_width = 0;
    int info_height = 0;
    int info_channels = 0;
    if (!stbi_info_from_memory(data.data(), static_cast<int>(data.size()),
                               &info_width, &info_height, &info_channels)) {
        return result::failure(error_code::corrupt_input,
            std::string("JPEG header error: ") + stbi_failure_reason());
    }

    auto check = validate_dimensions(info_width, info_height, pixel_format::rgb888, options);
    if (!check) return check;

    if (!has_end_marker(data)) {
        return result::failure(error_code::corrupt_input, "JPEG data is truncated (no EOI marker)");
    }

    int width = 0;
    int height = 0;
    int channels = 0;

    // Request RGB output
    constexpr int desired_channels = 3;

    stbi_uc* pixels = stbi_load_from_memory(
        data.data(),
        static_cast<int>(data.size()),
        &width,
        &height,
        &channels,
        desired_channels
    );

    if (!pixels) {
        return result::failure(error_code::corrupt_input,
            std::string("JPEG decode error: ") + stbi_failure_reason());
    }

    // Use unique_ptr for automatic cleanup
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> pixel_guard(pixels, stbi_image_free);

    if (width != info_width || height != info_height) {
        return result::failure(error_code::corrupt_input, "JPEG frame size is inconsistent");
    }

    if (!surf.set_size(width, height, pixel_format::rgb888)) {
        return result::failure(error_code::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, pixels, static_cast<std::size_t>(width) * 3, height);

    return result::success();
}

// ============================================================================
// JPEG Encoder
// ============================================================================

result jpeg_codec::encode(const pixel_grid& grid,
                          std::vector<std::uint8_t>& out,
                          const encode_options& options) {
    auto check = validate_encode_input(grid, options);
    if (!check) return check;

    if (grid.width() > JPEG_MAX_DIMENSION || grid.height() > JPEG_MAX_DIMENSION) {
        return result::failure(error_code::encode_failed,
            "JPEG dimensions are limited to 65535 pixels");
    }

    const auto rgb = flatten_to_rgb(grid, options.background);

    // stb treats quality 0 as "use default", so the lowest real setting is 1
    const int quality = options.quality < 1 ? 1 : options.quality;

    std::vector<std::uint8_t> jpeg_data;
    if (!stbi_write_jpg_to_func(append_to_vector, &jpeg_data,
                                grid.width(), grid.height(), 3, rgb.data(), quality)) {
        return result::failure(error_code::encode_failed, "JPEG encoder failed");
    }

    out = std::move(jpeg_data);
    return result::success();
}

} // namespace prism_image

#include <prism_image/codecs/png.hpp>
#include "byte_io.hpp"
#include "codec_helpers.hpp"
#include <lodepng.h>

#include <string>

namespace prism_image {

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

// IHDR chunk structure:
// Offset 8-11: IHDR length (should be 13)
// Offset 12-15: IHDR type ("IHDR" = 0x49484452)
constexpr std::size_t PNG_IHDR_LENGTH_OFFSET = 8;
constexpr std::size_t PNG_IHDR_TYPE_OFFSET = 12;
constexpr std::size_t PNG_MIN_SIZE_FOR_DIMENSIONS = 24;  // signature + IHDR length/type + width/height
constexpr std::uint32_t PNG_IHDR_TYPE = 0x49484452;  // "IHDR" in big-endian
constexpr std::uint32_t PNG_IHDR_LENGTH = 13;  // IHDR data is always 13 bytes

result png_failure(const char* what, unsigned error) {
    return result::failure(error_code::corrupt_input,
        std::string(what) + ": " + lodepng_error_text(error));
}

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_codec::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }

    for (std::size_t i = 0; i < PNG_SIGNATURE_SIZE; ++i) {
        if (data[i] != PNG_SIGNATURE[i]) {
            return false;
        }
    }

    return true;
}

result png_codec::decode(std::span<const std::uint8_t> data,
                         surface& surf,
                         const decode_options& options) {
    if (!sniff(data)) {
        return result::failure(error_code::unsupported_format, "Not a valid PNG file");
    }

    if (data.size() < PNG_MIN_SIZE_FOR_DIMENSIONS ||
        read_be32(data.data() + PNG_IHDR_LENGTH_OFFSET) != PNG_IHDR_LENGTH ||
        read_be32(data.data() + PNG_IHDR_TYPE_OFFSET) != PNG_IHDR_TYPE) {
        return result::failure(error_code::corrupt_input, "PNG is missing its IHDR chunk");
    }

    // Read the header first so huge images are rejected before inflating
    lodepng::State state;
    unsigned width = 0;
    unsigned height = 0;
    unsigned error = lodepng_inspect(&width, &height, &state, data.data(), data.size());
    if (error) {
        return png_failure("PNG header error", error);
    }

    const bool alpha = lodepng_can_have_alpha(&state.info_png.color) != 0;
    const pixel_format format = alpha ? pixel_format::rgba8888 : pixel_format::rgb888;

    auto check = validate_dimensions(width, height, format, options);
    if (!check) return check;

    std::vector<std::uint8_t> pixels;
    error = lodepng::decode(pixels, width, height, data.data(), data.size(),
                            alpha ? LCT_RGBA : LCT_RGB, 8);
    if (error) {
        return png_failure("PNG decode error", error);
    }

    if (!surf.set_size(static_cast<int>(width), static_cast<int>(height), format)) {
        return result::failure(error_code::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, pixels.data(), static_cast<std::size_t>(width) * bytes_per_pixel(format),
               static_cast<int>(height));

    return result::success();
}

// ============================================================================
// PNG Encoder
// ============================================================================

result png_codec::encode(const pixel_grid& grid,
                         std::vector<std::uint8_t>& out,
                         const encode_options& options) {
    auto check = validate_encode_input(grid, options);
    if (!check) return check;

    const LodePNGColorType color_type = grid.has_alpha() ? LCT_RGBA : LCT_RGB;

    // Pin the output colour type so an opaque RGBA grid stays RGBA on disk
    // and decodes back to the same pixel format.
    lodepng::State state;
    state.encoder.auto_convert = 0;
    state.info_raw.colortype = color_type;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = color_type;
    state.info_png.color.bitdepth = 8;

    std::vector<std::uint8_t> png_data;
    const unsigned error = lodepng::encode(png_data, grid.pixels().data(),
                                           static_cast<unsigned>(grid.width()),
                                           static_cast<unsigned>(grid.height()), state);
    if (error) {
        return result::failure(error_code::encode_failed,
            std::string("PNG encode error: ") + lodepng_error_text(error));
    }

    out = std::move(png_data);
    return result::success();
}

} // namespace prism_image

#include <prism_image/codecs/webp.hpp>
#include "byte_io.hpp"
#include "codec_helpers.hpp"

#include <webp/decode.h>
#include <webp/encode.h>

#include <cstring>
#include <memory>
#include <string>

namespace prism_image {

namespace {

// RIFF container: "RIFF" <size:le32> "WEBP"
constexpr std::size_t WEBP_HEADER_SIZE = 12;

// libwebp rejects anything larger
constexpr int WEBP_MAX_DIMENSION = 16383;

struct webp_deleter {
    void operator()(std::uint8_t* p) const noexcept { WebPFree(p); }
};

using webp_buffer = std::unique_ptr<std::uint8_t, webp_deleter>;

const char* status_text(VP8StatusCode status) noexcept {
    switch (status) {
        case VP8_STATUS_OK:                  return "ok";
        case VP8_STATUS_OUT_OF_MEMORY:       return "out of memory";
        case VP8_STATUS_INVALID_PARAM:       return "invalid parameter";
        case VP8_STATUS_BITSTREAM_ERROR:     return "bitstream error";
        case VP8_STATUS_UNSUPPORTED_FEATURE: return "unsupported feature";
        case VP8_STATUS_SUSPENDED:           return "suspended";
        case VP8_STATUS_USER_ABORT:          return "user abort";
        case VP8_STATUS_NOT_ENOUGH_DATA:     return "not enough data";
    }
    return "unknown status";
}

} // namespace

// ============================================================================
// WEBP Decoder
// ============================================================================

bool webp_codec::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < WEBP_HEADER_SIZE) {
        return false;
    }
    return std::memcmp(data.data(), "RIFF", 4) == 0 &&
           std::memcmp(data.data() + 8, "WEBP", 4) == 0;
}

result webp_codec::decode(std::span<const std::uint8_t> data,
                          surface& surf,
                          const decode_options& options) {
    if (!sniff(data)) {
        return result::failure(error_code::unsupported_format, "Not a valid WEBP file");
    }

    // The RIFF size field must cover the payload that follows it
    const std::uint32_t riff_size = read_le32(data.data() + 4);
    if (static_cast<std::size_t>(riff_size) + 8 > data.size()) {
        return result::failure(error_code::corrupt_input, "WEBP file is truncated");
    }

    WebPBitstreamFeatures features;
    const VP8StatusCode status = WebPGetFeatures(data.data(), data.size(), &features);
    if (status != VP8_STATUS_OK) {
        return result::failure(error_code::corrupt_input,
            std::string("WEBP header error: ") + status_text(status));
    }

    if (features.has_animation) {
        return result::failure(error_code::unsupported_format,
            "Animated WEBP images are not supported");
    }

    const bool alpha = features.has_alpha != 0;
    const pixel_format format = alpha ? pixel_format::rgba8888 : pixel_format::rgb888;

    auto check = validate_dimensions(features.width, features.height, format, options);
    if (!check) return check;

    int width = 0;
    int height = 0;
    webp_buffer pixels(alpha ? WebPDecodeRGBA(data.data(), data.size(), &width, &height)
                             : WebPDecodeRGB(data.data(), data.size(), &width, &height));
    if (!pixels) {
        return result::failure(error_code::corrupt_input, "WEBP bitstream could not be decoded");
    }

    if (!surf.set_size(width, height, format)) {
        return result::failure(error_code::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, pixels.get(), static_cast<std::size_t>(width) * bytes_per_pixel(format), height);

    return result::success();
}

// ============================================================================
// WEBP Encoder
// ============================================================================

result webp_codec::encode(const pixel_grid& grid,
                          std::vector<std::uint8_t>& out,
                          const encode_options& options) {
    auto check = validate_encode_input(grid, options);
    if (!check) return check;

    if (grid.width() > WEBP_MAX_DIMENSION || grid.height() > WEBP_MAX_DIMENSION) {
        return result::failure(error_code::encode_failed,
            "WEBP dimensions are limited to 16383 pixels");
    }

    const std::uint8_t* src = grid.pixels().data();
    const int w = grid.width();
    const int h = grid.height();
    const int stride = static_cast<int>(grid.pitch());
    const auto quality = static_cast<float>(options.quality);

    std::uint8_t* output = nullptr;
    std::size_t size = 0;
    if (options.lossless) {
        size = grid.has_alpha() ? WebPEncodeLosslessRGBA(src, w, h, stride, &output)
                                : WebPEncodeLosslessRGB(src, w, h, stride, &output);
    } else {
        size = grid.has_alpha() ? WebPEncodeRGBA(src, w, h, stride, quality, &output)
                                : WebPEncodeRGB(src, w, h, stride, quality, &output);
    }
    webp_buffer guard(output);

    if (size == 0 || !output) {
        return result::failure(error_code::encode_failed, "WEBP encoder failed");
    }

    out.assign(output, output + size);
    return result::success();
}

} // namespace prism_image

#ifndef PRISM_IMAGE_CODECS_BMP_HPP_
#define PRISM_IMAGE_CODECS_BMP_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/surface.hpp>
#include <prism_image/pixel_grid.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace prism_image {

// ============================================================================
// BMP Codec
// ============================================================================

/**
 * BMP/DIB image (lossless, no alpha on write).
 * Reads Windows BITMAPINFOHEADER (and V4/V5) and OS/2 1.x core headers with
 * 1, 4, 8, 16, 24 and 32 bits per pixel, BI_RGB or BI_BITFIELDS, top-down or
 * bottom-up. A 32-bit bitfield image with an alpha mask decodes as rgba8888.
 * Encoding writes 24-bit BI_RGB, flattening alpha onto options.background.
 */
class PRISM_IMAGE_EXPORT bmp_codec {
public:
    static constexpr std::string_view name = "bmp";
    static constexpr image_format format = image_format::bmp;
    static constexpr std::string_view extensions[] = {".bmp", ".dib"};

    /**
     * Check if data appears to be a BMP file.
     * @param data Raw file data
     * @return true if the signature matches BMP format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode BMP image data to a surface.
     * @param data Raw file data
     * @param surf Destination surface (untouched on failure)
     * @param options Decode options
     * @return Result with success/error status
     */
    [[nodiscard]] static result decode(std::span<const std::uint8_t> data,
                                       surface& surf,
                                       const decode_options& options = {});

    /**
     * Encode a grid to BMP format.
     * @param grid Source grid
     * @param out Receives the encoded bytes (replaced on success only)
     * @param options Encode options
     * @return Result with success/error status
     */
    [[nodiscard]] static result encode(const pixel_grid& grid,
                                       std::vector<std::uint8_t>& out,
                                       const encode_options& options = {});
};

} // namespace prism_image

#endif // PRISM_IMAGE_CODECS_BMP_HPP_

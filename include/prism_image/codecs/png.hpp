#ifndef PRISM_IMAGE_CODECS_PNG_HPP_
#define PRISM_IMAGE_CODECS_PNG_HPP_

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
// PNG Codec
// ============================================================================

/**
 * PNG image (lossless). Sources whose colour type can carry alpha
 * (grey+alpha, RGBA, or a tRNS chunk) decode as rgba8888, everything else
 * as rgb888. Encoding writes 8-bit RGB or RGBA matching the grid.
 */
class PRISM_IMAGE_EXPORT png_codec {
public:
    static constexpr std::string_view name = "png";
    static constexpr image_format format = image_format::png;
    static constexpr std::string_view extensions[] = {".png"};

    /**
     * Check if data appears to be a PNG file.
     * @param data Raw file data
     * @return true if the signature matches PNG format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PNG image data to a surface.
     * @param data Raw file data
     * @param surf Destination surface (untouched on failure)
     * @param options Decode options
     * @return Result with success/error status
     */
    [[nodiscard]] static result decode(std::span<const std::uint8_t> data,
                                       surface& surf,
                                       const decode_options& options = {});

    /**
     * Encode a grid to PNG format.
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

#endif // PRISM_IMAGE_CODECS_PNG_HPP_

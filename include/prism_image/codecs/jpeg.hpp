#ifndef PRISM_IMAGE_CODECS_JPEG_HPP_
#define PRISM_IMAGE_CODECS_JPEG_HPP_

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
// JPEG Codec
// ============================================================================

/**
 * JPEG image (lossy, no alpha). Decodes as rgb888. Encoding flattens
 * alpha onto options.background and honours options.quality.
 */
class PRISM_IMAGE_EXPORT jpeg_codec {
public:
    static constexpr std::string_view name = "jpeg";
    static constexpr image_format format = image_format::jpeg;
    static constexpr std::string_view extensions[] = {".jpg", ".jpeg", ".jpe", ".jfif"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static result decode(std::span<const std::uint8_t> data,
                                       surface& surf,
                                       const decode_options& options = {});

    [[nodiscard]] static result encode(const pixel_grid& grid,
                                       std::vector<std::uint8_t>& out,
                                       const encode_options& options = {});
};

} // namespace prism_image

#endif // PRISM_IMAGE_CODECS_JPEG_HPP_

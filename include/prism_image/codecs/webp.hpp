#ifndef PRISM_IMAGE_CODECS_WEBP_HPP_
#define PRISM_IMAGE_CODECS_WEBP_HPP_

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
// WEBP Codec
// ============================================================================

/**
 * WEBP image. Still images only; animated files are rejected.
 * Sources with an alpha channel decode as rgba8888. Encoding is lossy at
 * options.quality unless options.lossless is set.
 */
class PRISM_IMAGE_EXPORT webp_codec {
public:
    static constexpr std::string_view name = "webp";
    static constexpr image_format format = image_format::webp;
    static constexpr std::string_view extensions[] = {".webp"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static result decode(std::span<const std::uint8_t> data,
                                       surface& surf,
                                       const decode_options& options = {});

    [[nodiscard]] static result encode(const pixel_grid& grid,
                                       std::vector<std::uint8_t>& out,
                                       const encode_options& options = {});
};

} // namespace prism_image

#endif // PRISM_IMAGE_CODECS_WEBP_HPP_

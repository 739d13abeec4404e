#ifndef PRISM_IMAGE_PIPELINE_HPP_
#define PRISM_IMAGE_PIPELINE_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/operation.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace prism_image {

struct pipeline_options {
    engine_limits limits;
    encode_options encode;
};

/**
 * Bytes in, bytes out: validate the request, decode, apply the operation and
 * encode the result.
 *
 * The operation and its parameters are checked before the input is decoded,
 * so a malformed request never costs a decode.
 *
 * @param data Encoded input image (format detected from content)
 * @param operation Catalog operation name
 * @param raw Untyped operation parameters
 * @param output_format Format of the returned bytes
 * @param out Receives the encoded result (replaced on success only)
 * @param options Limits and encoder settings
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result transform_image(std::span<const std::uint8_t> data,
                                                        std::string_view operation,
                                                        const raw_params& raw,
                                                        image_format output_format,
                                                        std::vector<std::uint8_t>& out,
                                                        const pipeline_options& options = {});

} // namespace prism_image

#endif // PRISM_IMAGE_PIPELINE_HPP_

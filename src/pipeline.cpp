#include <prism_image/pipeline.hpp>
#include <prism_image/codec.hpp>
#include <prism_image/pixel_grid.hpp>

#include <utility>

namespace prism_image {

result transform_image(std::span<const std::uint8_t> data,
                       std::string_view operation,
                       const raw_params& raw,
                       image_format output_format,
                       std::vector<std::uint8_t>& out,
                       const pipeline_options& options) {
    transform_request request;
    auto res = validate(operation, raw, request);
    if (!res) return res;

    pixel_grid source;
    decode_options decode_opts;
    decode_opts.limits = options.limits;
    res = decode(data, source, decode_opts);
    if (!res) return res;

    pixel_grid transformed;
    res = apply(source, transformed, request, options.limits);
    if (!res) return res;

    std::vector<std::uint8_t> encoded;
    res = encode(transformed, output_format, encoded, options.encode);
    if (!res) return res;

    out = std::move(encoded);
    return result::success();
}

} // namespace prism_image

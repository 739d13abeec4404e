#ifndef PRISM_IMAGE_PRISM_IMAGE_HPP_
#define PRISM_IMAGE_PRISM_IMAGE_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/surface.hpp>
#include <prism_image/pixel_grid.hpp>
#include <prism_image/codec.hpp>
#include <prism_image/codecs/png.hpp>
#include <prism_image/codecs/jpeg.hpp>
#include <prism_image/codecs/webp.hpp>
#include <prism_image/codecs/bmp.hpp>
#include <prism_image/color.hpp>
#include <prism_image/geometry.hpp>
#include <prism_image/filters.hpp>
#include <prism_image/operation.hpp>
#include <prism_image/pipeline.hpp>

namespace prism_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:      pixel, image_format, error_code, result, option structs
//   - pixel_grid.hpp: pixel_grid, check_limits
//   - codec.hpp:      codec, codec_registry, detect_format, decode, encode
//   - color.hpp, geometry.hpp, filters.hpp: the transform catalog
//   - operation.hpp:  operations, validate, apply
//   - pipeline.hpp:   transform_image

} // namespace prism_image

#endif // PRISM_IMAGE_PRISM_IMAGE_HPP_

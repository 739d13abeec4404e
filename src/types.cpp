#include <prism_image/types.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace prism_image {

const char* to_string(error_code err) noexcept {
    switch (err) {
        case error_code::none:                    return "none";
        case error_code::unsupported_format:      return "unsupported_format";
        case error_code::corrupt_input:           return "corrupt_input";
        case error_code::unknown_operation:       return "unknown_operation";
        case error_code::invalid_parameter:       return "invalid_parameter";
        case error_code::resource_limit_exceeded: return "resource_limit_exceeded";
        case error_code::encode_failed:           return "encode_failed";
        case error_code::internal_error:          return "internal_error";
    }
    return "unknown";
}

const char* to_string(image_format fmt) noexcept {
    switch (fmt) {
        case image_format::png:  return "png";
        case image_format::jpeg: return "jpeg";
        case image_format::webp: return "webp";
        case image_format::bmp:  return "bmp";
    }
    return "unknown";
}

std::optional<image_format> parse_image_format(std::string_view name) noexcept {
    if (!name.empty() && name.front() == '.') {
        name.remove_prefix(1);
    }
    if (name.size() > 4) {
        return std::nullopt;
    }

    char lower[5] = {};
    std::transform(name.begin(), name.end(), lower, [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    const std::string_view key(lower, name.size());

    if (key == "png") return image_format::png;
    if (key == "jpg" || key == "jpeg") return image_format::jpeg;
    if (key == "webp") return image_format::webp;
    if (key == "bmp") return image_format::bmp;
    return std::nullopt;
}

} // namespace prism_image

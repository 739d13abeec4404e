#include <prism_image/codec.hpp>
#include <prism_image/codecs/png.hpp>
#include <prism_image/codecs/jpeg.hpp>
#include <prism_image/codecs/webp.hpp>
#include <prism_image/codecs/bmp.hpp>

#include <string>

namespace prism_image {

// ============================================================================
// Codec Wrappers
// ============================================================================

namespace {

// Adapts a codec class with static members to the codec interface
template <typename Codec>
class codec_impl final : public codec {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Codec::name;
    }

    [[nodiscard]] image_format format() const noexcept override {
        return Codec::format;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return Codec::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return Codec::sniff(data);
    }

    [[nodiscard]] result decode(std::span<const std::uint8_t> data,
                                surface& surf,
                                const decode_options& options) const override {
        return Codec::decode(data, surf, options);
    }

    [[nodiscard]] result encode(const pixel_grid& grid,
                                std::vector<std::uint8_t>& out,
                                const encode_options& options) const override {
        return Codec::encode(grid, out, options);
    }
};

} // namespace

// ============================================================================
// Codec Registry Implementation
// ============================================================================

const codec_registry& codec_registry::builtin() {
    static const codec_registry registry;
    return registry;
}

codec_registry::codec_registry() {
    register_builtin_codecs();
}

codec_registry::~codec_registry() = default;
codec_registry::codec_registry(codec_registry&&) noexcept = default;
codec_registry& codec_registry::operator=(codec_registry&&) noexcept = default;

void codec_registry::register_builtin_codecs() {
    codecs_.push_back(std::make_unique<codec_impl<png_codec>>());
    codecs_.push_back(std::make_unique<codec_impl<jpeg_codec>>());
    codecs_.push_back(std::make_unique<codec_impl<webp_codec>>());
    codecs_.push_back(std::make_unique<codec_impl<bmp_codec>>());
}

void codec_registry::register_codec(std::unique_ptr<codec> c) {
    if (c) {
        codecs_.push_back(std::move(c));
    }
}

const codec* codec_registry::find_codec(std::span<const std::uint8_t> data) const {
    for (const auto& c : codecs_) {
        if (c->sniff(data)) {
            return c.get();
        }
    }
    return nullptr;
}

const codec* codec_registry::find_codec(std::string_view name) const {
    for (const auto& c : codecs_) {
        if (c->name() == name) {
            return c.get();
        }
    }
    return nullptr;
}

const codec* codec_registry::find_codec(image_format format) const {
    for (const auto& c : codecs_) {
        if (c->format() == format) {
            return c.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Convenience Functions
// ============================================================================

std::optional<image_format> detect_format(std::span<const std::uint8_t> data) {
    const auto* c = codec_registry::builtin().find_codec(data);
    if (!c) {
        return std::nullopt;
    }
    return c->format();
}

result decode(std::span<const std::uint8_t> data,
              surface& surf,
              const decode_options& options) {
    if (data.empty()) {
        return result::failure(error_code::unsupported_format, "Input is empty");
    }
    const auto* c = codec_registry::builtin().find_codec(data);
    if (!c) {
        return result::failure(error_code::unsupported_format, "Unknown image format");
    }
    return c->decode(data, surf, options);
}

result decode(std::span<const std::uint8_t> data,
              surface& surf,
              std::string_view codec_name,
              const decode_options& options) {
    const auto* c = codec_registry::builtin().find_codec(codec_name);
    if (!c) {
        return result::failure(error_code::unsupported_format,
            std::string("Unknown codec: ") + std::string(codec_name));
    }
    return c->decode(data, surf, options);
}

result encode(const pixel_grid& grid,
              image_format format,
              std::vector<std::uint8_t>& out,
              const encode_options& options) {
    const auto* c = codec_registry::builtin().find_codec(format);
    if (!c) {
        return result::failure(error_code::unsupported_format,
            std::string("No encoder for ") + to_string(format));
    }
    return c->encode(grid, out, options);
}

} // namespace prism_image

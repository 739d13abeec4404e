#ifndef PRISM_IMAGE_CODEC_HPP_
#define PRISM_IMAGE_CODEC_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/surface.hpp>
#include <prism_image/pixel_grid.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace prism_image {

// ============================================================================
// Codec Interface
// ============================================================================

/**
 * Abstract base class for image codecs.
 * Used by the codec registry for runtime polymorphism.
 * Implementations must be stateless so one instance can serve many threads.
 */
class PRISM_IMAGE_EXPORT codec {
public:
    virtual ~codec() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual image_format format() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool sniff(std::span<const std::uint8_t> data) const noexcept = 0;
    [[nodiscard]] virtual result decode(std::span<const std::uint8_t> data,
                                        surface& surf,
                                        const decode_options& options) const = 0;
    [[nodiscard]] virtual result encode(const pixel_grid& grid,
                                        std::vector<std::uint8_t>& out,
                                        const encode_options& options) const = 0;
};

// ============================================================================
// Codec Registry
// ============================================================================

/**
 * Registry for image codecs.
 * Built-in codecs (PNG, JPEG, WEBP, BMP) are registered on construction.
 */
class PRISM_IMAGE_EXPORT codec_registry {
public:
    codec_registry();
    ~codec_registry();

    codec_registry(const codec_registry&) = delete;
    codec_registry& operator=(const codec_registry&) = delete;
    codec_registry(codec_registry&&) noexcept;
    codec_registry& operator=(codec_registry&&) noexcept;

    /**
     * Shared registry holding only the built-in codecs.
     * It is never modified after construction, so it is safe to use from any
     * thread. Build a registry of your own to add codecs.
     */
    [[nodiscard]] static const codec_registry& builtin();

    /**
     * Register a codec. Codecs registered later lose sniffing ties.
     * @param c Unique pointer to codec (ownership transferred)
     */
    void register_codec(std::unique_ptr<codec> c);

    /**
     * Find codec by sniffing data.
     * @param data Raw file data
     * @return Pointer to codec if found, nullptr otherwise
     */
    [[nodiscard]] const codec* find_codec(std::span<const std::uint8_t> data) const;

    /**
     * Find codec by name (e.g., "png").
     */
    [[nodiscard]] const codec* find_codec(std::string_view name) const;

    /**
     * Find the first codec writing the given format.
     */
    [[nodiscard]] const codec* find_codec(image_format format) const;

    [[nodiscard]] std::size_t codec_count() const noexcept {
        return codecs_.size();
    }

    [[nodiscard]] const codec* codec_at(std::size_t index) const noexcept {
        return index < codecs_.size() ? codecs_[index].get() : nullptr;
    }

private:
    void register_builtin_codecs();

    std::vector<std::unique_ptr<codec>> codecs_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/**
 * Identify the container format from the data itself (never a file name).
 * @return Format, or std::nullopt if no built-in codec recognises the data
 */
[[nodiscard]] PRISM_IMAGE_EXPORT std::optional<image_format> detect_format(std::span<const std::uint8_t> data);

/**
 * Decode image data to a surface (auto-detect format).
 * @param data Raw file data
 * @param surf Destination surface
 * @param options Decode options
 * @return unsupported_format if no codec recognises the data, corrupt_input
 *         if the matching codec cannot parse it
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});

/**
 * Decode image data to a surface (explicit codec).
 * @param data Raw file data
 * @param surf Destination surface
 * @param codec_name Name of codec to use
 * @param options Decode options
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               std::string_view codec_name,
                                               const decode_options& options = {});

/**
 * Encode a grid into the requested format.
 * @param grid Source grid
 * @param format Output format
 * @param out Receives the encoded bytes (replaced on success only)
 * @param options Encode options
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result encode(const pixel_grid& grid,
                                               image_format format,
                                               std::vector<std::uint8_t>& out,
                                               const encode_options& options = {});

} // namespace prism_image

#endif // PRISM_IMAGE_CODEC_HPP_

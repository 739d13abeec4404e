#include <prism_image/codecs/bmp.hpp>
#include "byte_io.hpp"
#include "codec_helpers.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace prism_image {

namespace {

// Compression methods
constexpr std::uint32_t BI_RGB = 0;
constexpr std::uint32_t BI_RLE8 = 1;
constexpr std::uint32_t BI_RLE4 = 2;
constexpr std::uint32_t BI_BITFIELDS = 3;
constexpr std::uint32_t BI_ALPHABITFIELDS = 6;

// BMP signature: "BM"
constexpr std::uint8_t BMP_SIGNATURE[] = {'B', 'M'};

constexpr std::size_t FILE_HEADER_SIZE = 14;
constexpr std::uint32_t CORE_HEADER_SIZE = 12;   // OS/2 1.x BITMAPCOREHEADER
constexpr std::uint32_t INFO_HEADER_SIZE = 40;   // BITMAPINFOHEADER
constexpr std::uint32_t V2_HEADER_SIZE = 52;     // adds RGB masks
constexpr std::uint32_t V3_HEADER_SIZE = 56;     // adds alpha mask

// 96 DPI expressed in pixels per metre
constexpr std::int32_t DEFAULT_PIXELS_PER_METRE = 3779;

struct channel_mask {
    std::uint32_t mask = 0;
    int shift = 0;
    int bits = 0;
};

struct bmp_info {
    int width = 0;
    int height = 0;
    int bits_per_pixel = 0;
    std::uint32_t compression = BI_RGB;
    std::uint32_t colors_used = 0;
    std::uint32_t data_offset = 0;
    std::uint32_t header_size = 0;  // Info header size (not including file header)
    std::size_t palette_offset = 0;
    int palette_entry_size = 4;  // 3 for OS/2 1.x, 4 otherwise
    bool top_down = false;

    channel_mask red;
    channel_mask green;
    channel_mask blue;
    channel_mask alpha;
};

// Count trailing zero bits
int count_zero_bits(std::uint32_t v) {
    if (v == 0) return 32;
    int count = 0;
    while ((v & 1) == 0) {
        count++;
        v >>= 1;
    }
    return count;
}

// Count bits set in mask
int count_mask_bits(std::uint32_t v) {
    int count = 0;
    while (v) {
        if (v & 1) count++;
        v >>= 1;
    }
    return count;
}

channel_mask make_mask(std::uint32_t mask) {
    channel_mask m;
    m.mask = mask;
    m.shift = count_zero_bits(mask);
    m.bits = count_mask_bits(mask);
    return m;
}

// Scale a masked component to 8 bits
std::uint8_t extract_component(std::uint32_t value, const channel_mask& m) {
    if (m.mask == 0 || m.bits == 0) {
        return 0;
    }
    const std::uint32_t v = (value & m.mask) >> m.shift;
    if (m.bits >= 8) {
        return static_cast<std::uint8_t>(v >> (m.bits - 8));
    }
    const std::uint32_t max = (1u << m.bits) - 1;
    return static_cast<std::uint8_t>((v * 255 + max / 2) / max);
}

result corrupt(std::string msg) {
    return result::failure(error_code::corrupt_input, std::move(msg));
}

result parse_header(std::span<const std::uint8_t> data, bmp_info& info) {
    if (data.size() < FILE_HEADER_SIZE + CORE_HEADER_SIZE) {
        return corrupt("BMP file is truncated");
    }

    const std::uint8_t* p = data.data();
    info.data_offset = read_le32(p + 10);
    info.header_size = read_le32(p + 14);

    if (info.header_size > data.size() - FILE_HEADER_SIZE) {
        return corrupt("BMP info header is truncated");
    }

    const std::uint8_t* h = p + FILE_HEADER_SIZE;

    if (info.header_size == CORE_HEADER_SIZE) {
        // OS/2 1.x: 16-bit dimensions, 3-byte palette entries
        info.width = read_le16(h + 4);
        info.height = read_le16(h + 6);
        if (read_le16(h + 8) != 1) {
            return corrupt("BMP plane count must be 1");
        }
        info.bits_per_pixel = read_le16(h + 10);
        info.palette_entry_size = 3;
    } else if (info.header_size >= INFO_HEADER_SIZE) {
        info.width = read_le32_signed(h + 4);
        const std::int32_t height = read_le32_signed(h + 8);
        if (height == std::numeric_limits<std::int32_t>::min()) {
            return corrupt("BMP height is out of range");
        }
        info.top_down = height < 0;
        info.height = height < 0 ? -height : height;
        if (read_le16(h + 12) != 1) {
            return corrupt("BMP plane count must be 1");
        }
        info.bits_per_pixel = read_le16(h + 14);
        info.compression = read_le32(h + 16);
        info.colors_used = read_le32(h + 32);
    } else {
        return result::failure(error_code::unsupported_format,
            "Unsupported BMP header size " + std::to_string(info.header_size));
    }

    info.palette_offset = FILE_HEADER_SIZE + info.header_size;

    if (info.compression == BI_RLE8 || info.compression == BI_RLE4) {
        return result::failure(error_code::unsupported_format,
            "RLE compressed BMP images are not supported");
    }
    if (info.compression != BI_RGB && info.compression != BI_BITFIELDS &&
        info.compression != BI_ALPHABITFIELDS) {
        return result::failure(error_code::unsupported_format,
            "Unsupported BMP compression " + std::to_string(info.compression));
    }

    switch (info.bits_per_pixel) {
        case 1: case 4: case 8: case 16: case 24: case 32:
            break;
        default:
            return corrupt("Invalid BMP bit depth " + std::to_string(info.bits_per_pixel));
    }

    if (info.compression != BI_RGB) {
        if (info.bits_per_pixel != 16 && info.bits_per_pixel != 32) {
            return corrupt("BMP bitfields require 16 or 32 bits per pixel");
        }

        // Masks live inside V2+ headers, or right after a plain info header
        std::size_t mask_offset = FILE_HEADER_SIZE + INFO_HEADER_SIZE;
        const bool has_alpha_mask = info.header_size >= V3_HEADER_SIZE ||
                                    info.compression == BI_ALPHABITFIELDS;
        const std::size_t mask_bytes = has_alpha_mask ? 16 : 12;
        if (mask_offset + mask_bytes > data.size()) {
            return corrupt("BMP bitfield masks are truncated");
        }

        info.red = make_mask(read_le32(p + mask_offset));
        info.green = make_mask(read_le32(p + mask_offset + 4));
        info.blue = make_mask(read_le32(p + mask_offset + 8));
        if (has_alpha_mask) {
            info.alpha = make_mask(read_le32(p + mask_offset + 12));
        }
        if (info.header_size < V2_HEADER_SIZE) {
            info.palette_offset += mask_bytes;
        }
    } else if (info.bits_per_pixel == 16) {
        // Default 16-bit layout is X1R5G5B5
        info.red = make_mask(0x7C00);
        info.green = make_mask(0x03E0);
        info.blue = make_mask(0x001F);
    }

    if (info.bits_per_pixel <= 8) {
        const std::uint32_t max_colors = 1u << info.bits_per_pixel;
        if (info.colors_used == 0 || info.colors_used > max_colors) {
            info.colors_used = max_colors;
        }
    }

    return result::success();
}

// Build the palette as RGB triplets, tolerating a short palette
std::vector<std::uint8_t> read_palette(std::span<const std::uint8_t> data, const bmp_info& info) {
    std::vector<std::uint8_t> palette(static_cast<std::size_t>(info.colors_used) * 3, 0);
    const std::size_t end = std::min<std::size_t>(info.data_offset, data.size());
    for (std::uint32_t i = 0; i < info.colors_used; ++i) {
        const std::size_t entry = info.palette_offset + i * static_cast<std::size_t>(info.palette_entry_size);
        if (entry + 3 > end) {
            break;
        }
        // Stored as BGR(X)
        palette[i * 3 + 0] = data[entry + 2];
        palette[i * 3 + 1] = data[entry + 1];
        palette[i * 3 + 2] = data[entry + 0];
    }
    return palette;
}

} // namespace

// ============================================================================
// BMP Decoder
// ============================================================================

bool bmp_codec::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < sizeof(BMP_SIGNATURE)) {
        return false;
    }
    return data[0] == BMP_SIGNATURE[0] && data[1] == BMP_SIGNATURE[1];
}

result bmp_codec::decode(std::span<const std::uint8_t> data,
                         surface& surf,
                         const decode_options& options) {
    if (!sniff(data)) {
        return result::failure(error_code::unsupported_format, "Not a valid BMP file");
    }

    bmp_info info;
    auto parsed = parse_header(data, info);
    if (!parsed) return parsed;

    const bool alpha = info.alpha.mask != 0;
    const pixel_format format = alpha ? pixel_format::rgba8888 : pixel_format::rgb888;

    auto check = validate_dimensions(info.width, info.height, format, options);
    if (!check) return check;

    const std::size_t stride = row_stride_4byte(info.width, info.bits_per_pixel);
    const auto height = static_cast<std::size_t>(info.height);
    if (info.data_offset < info.palette_offset || info.data_offset > data.size() ||
        stride > (data.size() - info.data_offset) / height) {
        return corrupt("BMP pixel data is truncated");
    }

    const std::vector<std::uint8_t> palette = read_palette(data, info);
    const std::size_t bpp = bytes_per_pixel(format);
    const std::size_t row_bytes = static_cast<std::size_t>(info.width) * bpp;
    std::vector<std::uint8_t> pixels(row_bytes * height);

    for (std::size_t y = 0; y < height; ++y) {
        const std::size_t src_row = info.top_down ? y : height - 1 - y;
        const std::uint8_t* row = data.data() + info.data_offset + src_row * stride;
        std::uint8_t* dst = pixels.data() + y * row_bytes;

        for (int x = 0; x < info.width; ++x, dst += bpp) {
            switch (info.bits_per_pixel) {
                case 1:
                case 4:
                case 8: {
                    const std::size_t idx = extract_pixel(row, x, info.bits_per_pixel);
                    if (idx < info.colors_used) {
                        std::memcpy(dst, palette.data() + idx * 3, 3);
                    } else {
                        // Missing palette entry - use black
                        std::memset(dst, 0, 3);
                    }
                    break;
                }
                case 16: {
                    const std::uint32_t v = read_le16(row + static_cast<std::size_t>(x) * 2);
                    dst[0] = extract_component(v, info.red);
                    dst[1] = extract_component(v, info.green);
                    dst[2] = extract_component(v, info.blue);
                    if (alpha) dst[3] = extract_component(v, info.alpha);
                    break;
                }
                case 24: {
                    const std::uint8_t* s = row + static_cast<std::size_t>(x) * 3;
                    dst[0] = s[2];
                    dst[1] = s[1];
                    dst[2] = s[0];
                    break;
                }
                case 32: {
                    const std::uint8_t* s = row + static_cast<std::size_t>(x) * 4;
                    if (info.compression == BI_RGB) {
                        // Fourth byte is padding for BI_RGB
                        dst[0] = s[2];
                        dst[1] = s[1];
                        dst[2] = s[0];
                    } else {
                        const std::uint32_t v = read_le32(s);
                        dst[0] = extract_component(v, info.red);
                        dst[1] = extract_component(v, info.green);
                        dst[2] = extract_component(v, info.blue);
                        if (alpha) dst[3] = extract_component(v, info.alpha);
                    }
                    break;
                }
                default:
                    break;
            }
        }
    }

    if (!surf.set_size(info.width, info.height, format)) {
        return result::failure(error_code::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, pixels.data(), row_bytes, info.height);

    return result::success();
}

// ============================================================================
// BMP Encoder
// ============================================================================

result bmp_codec::encode(const pixel_grid& grid,
                         std::vector<std::uint8_t>& out,
                         const encode_options& options) {
    auto check = validate_encode_input(grid, options);
    if (!check) return check;

    const std::size_t stride = row_stride_4byte(grid.width(), 24);
    const auto height = static_cast<std::size_t>(grid.height());
    const std::size_t header_bytes = FILE_HEADER_SIZE + INFO_HEADER_SIZE;
    if (stride > (std::numeric_limits<std::uint32_t>::max() - header_bytes) / height) {
        return result::failure(error_code::encode_failed, "Image is too large for BMP");
    }
    const std::size_t image_bytes = stride * height;

    const auto rgb = flatten_to_rgb(grid, options.background);
    const std::size_t row_bytes = static_cast<std::size_t>(grid.width()) * 3;

    std::vector<std::uint8_t> bmp;
    bmp.reserve(header_bytes + image_bytes);

    // BITMAPFILEHEADER
    bmp.push_back(BMP_SIGNATURE[0]);
    bmp.push_back(BMP_SIGNATURE[1]);
    write_le32(bmp, static_cast<std::uint32_t>(header_bytes + image_bytes));
    write_le32(bmp, 0);  // reserved
    write_le32(bmp, static_cast<std::uint32_t>(header_bytes));

    // BITMAPINFOHEADER, bottom-up rows
    write_le32(bmp, INFO_HEADER_SIZE);
    write_le32(bmp, static_cast<std::uint32_t>(grid.width()));
    write_le32(bmp, static_cast<std::uint32_t>(grid.height()));
    write_le16(bmp, 1);   // planes
    write_le16(bmp, 24);  // bits per pixel
    write_le32(bmp, BI_RGB);
    write_le32(bmp, static_cast<std::uint32_t>(image_bytes));
    write_le32(bmp, static_cast<std::uint32_t>(DEFAULT_PIXELS_PER_METRE));
    write_le32(bmp, static_cast<std::uint32_t>(DEFAULT_PIXELS_PER_METRE));
    write_le32(bmp, 0);  // colors used
    write_le32(bmp, 0);  // important colors

    for (std::size_t y = 0; y < height; ++y) {
        const std::uint8_t* row = rgb.data() + (height - 1 - y) * row_bytes;
        for (std::size_t i = 0; i < row_bytes; i += 3) {
            bmp.push_back(row[i + 2]);
            bmp.push_back(row[i + 1]);
            bmp.push_back(row[i + 0]);
        }
        bmp.insert(bmp.end(), stride - row_bytes, 0);
    }

    out = std::move(bmp);
    return result::success();
}

} // namespace prism_image

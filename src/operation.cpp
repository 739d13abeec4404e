#include <prism_image/operation.hpp>
#include <prism_image/color.hpp>
#include <prism_image/filters.hpp>
#include <prism_image/geometry.hpp>
#include "transform_helpers.hpp"

#include <loguru.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <system_error>

namespace prism_image {

// ============================================================================
// Parameter Values
// ============================================================================

void param_values::set(std::string_view name, param_value value) {
    values_.insert_or_assign(std::string(name), value);
}

bool param_values::contains(std::string_view name) const {
    return values_.find(name) != values_.end();
}

int param_values::get_int(std::string_view name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) {
        return 0;
    }
    if (const auto* v = std::get_if<int>(&it->second)) {
        return *v;
    }
    return static_cast<int>(std::get<double>(it->second));
}

double param_values::get_real(std::string_view name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) {
        return 0.0;
    }
    if (const auto* v = std::get_if<double>(&it->second)) {
        return *v;
    }
    return static_cast<double>(std::get<int>(it->second));
}

namespace {

constexpr double INT_MIN_D = static_cast<double>(std::numeric_limits<int>::min());
constexpr double INT_MAX_D = static_cast<double>(std::numeric_limits<int>::max());

// ============================================================================
// Parameter Tables
// ============================================================================

constexpr param_spec ADD_COLOR_PARAMS[] = {
    {"dr", "r", param_type::integer, INT_MIN_D, INT_MAX_D, 0, false, 0.0, "Red delta"},
    {"dg", "g", param_type::integer, INT_MIN_D, INT_MAX_D, 0, false, 0.0, "Green delta"},
    {"db", "b", param_type::integer, INT_MIN_D, INT_MAX_D, 0, false, 0.0, "Blue delta"},
};

constexpr param_spec SHIFT_PARAMS[] = {
    {"amount", {}, param_type::integer, INT_MIN_D, INT_MAX_D, 0, false, 0.0, "Value added to the channel"},
};

constexpr param_spec BRIGHTNESS_PARAMS[] = {
    {"factor", {}, param_type::real, 0.0, MAX_BRIGHTNESS_FACTOR, 0, false, 1.0, "Channel multiplier"},
};

constexpr param_spec ROTATE_PARAMS[] = {
    {"degrees", {}, param_type::integer, INT_MIN_D, INT_MAX_D, 90, false, 90.0,
     "Multiple of 90, positive is clockwise"},
};

constexpr param_spec TILE_PARAMS[] = {
    {"size", {}, param_type::integer, 1.0, MAX_TILE_SIZE, 0, false, 1.0, "Repetitions per axis"},
};

constexpr param_spec RESIZE_PARAMS[] = {
    {"width", "resize_width", param_type::integer, 1.0, INT_MAX_D, 0, true, 0.0, "Target width"},
    {"height", "resize_height", param_type::integer, 1.0, INT_MAX_D, 0, true, 0.0, "Target height"},
};

constexpr param_spec BLUR_PARAMS[] = {
    {"radius", "amount", param_type::integer, 1.0, MAX_BLUR_RADIUS, 0, false, 1.0, "Window radius"},
};

constexpr param_spec PIXELATE_PARAMS[] = {
    {"block", {}, param_type::integer, 1.0, MAX_BLOCK_SIZE, 0, false, 8.0, "Cell size"},
};

constexpr param_spec CHECKERBOARD_PARAMS[] = {
    {"size", {}, param_type::integer, 1.0, MAX_BLOCK_SIZE, 0, false, 8.0, "Tile size"},
};

// ============================================================================
// Operation Adapters
// ============================================================================

result run_add_color(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return add_color(src, dst, p.get_int("dr"), p.get_int("dg"), p.get_int("db"));
}

result run_red_shift(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return red_shift(src, dst, p.get_int("amount"));
}

result run_green_shift(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return green_shift(src, dst, p.get_int("amount"));
}

result run_blue_shift(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return blue_shift(src, dst, p.get_int("amount"));
}

result run_shift_brightness(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return shift_brightness(src, dst, p.get_real("factor"));
}

result run_make_monochrome(const pixel_grid& src, pixel_grid& dst, const param_values&, const engine_limits&) {
    return make_monochrome(src, dst);
}

result run_negative(const pixel_grid& src, pixel_grid& dst, const param_values&, const engine_limits&) {
    return negative(src, dst);
}

result run_sepia(const pixel_grid& src, pixel_grid& dst, const param_values&, const engine_limits&) {
    return sepia(src, dst);
}

result run_mirror_horizontal(const pixel_grid& src, pixel_grid& dst, const param_values&, const engine_limits&) {
    return mirror_horizontal(src, dst);
}

result run_mirror_vertical(const pixel_grid& src, pixel_grid& dst, const param_values&, const engine_limits&) {
    return mirror_vertical(src, dst);
}

result run_rotate(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return rotate(src, dst, p.get_int("degrees"));
}

result run_tile(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits& limits) {
    return tile(src, dst, p.get_int("size"), limits);
}

result run_resize(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits& limits) {
    return resize(src, dst, p.get_int("width"), p.get_int("height"), limits);
}

result run_blur(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return blur(src, dst, p.get_int("radius"));
}

result run_pixelate(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return pixelate(src, dst, p.get_int("block"));
}

result run_checkerboard(const pixel_grid& src, pixel_grid& dst, const param_values& p, const engine_limits&) {
    return checkerboard(src, dst, p.get_int("size"));
}

// ============================================================================
// Output Shapes
// ============================================================================

void same_shape(const pixel_grid& src, const param_values&, std::int64_t& w, std::int64_t& h) {
    w = src.width();
    h = src.height();
}

void rotate_shape(const pixel_grid& src, const param_values& p, std::int64_t& w, std::int64_t& h) {
    const bool swap = (p.get_int("degrees") / 90) % 2 != 0;
    w = swap ? src.height() : src.width();
    h = swap ? src.width() : src.height();
}

void tile_shape(const pixel_grid& src, const param_values& p, std::int64_t& w, std::int64_t& h) {
    w = static_cast<std::int64_t>(src.width()) * p.get_int("size");
    h = static_cast<std::int64_t>(src.height()) * p.get_int("size");
}

void resize_shape(const pixel_grid&, const param_values& p, std::int64_t& w, std::int64_t& h) {
    w = p.get_int("width");
    h = p.get_int("height");
}

// ============================================================================
// Catalog
// ============================================================================

constexpr operation_info OPERATIONS[] = {
    {"add_color", "Add a signed delta to each colour channel", ADD_COLOR_PARAMS, run_add_color, same_shape},
    {"red_shift", "Add an amount to the red channel", SHIFT_PARAMS, run_red_shift, same_shape},
    {"green_shift", "Add an amount to the green channel", SHIFT_PARAMS, run_green_shift, same_shape},
    {"blue_shift", "Add an amount to the blue channel", SHIFT_PARAMS, run_blue_shift, same_shape},
    {"shift_brightness", "Multiply every channel by a factor", BRIGHTNESS_PARAMS, run_shift_brightness, same_shape},
    {"make_monochrome", "Convert to grey using luma weights", {}, run_make_monochrome, same_shape},
    {"negative", "Invert every colour channel", {}, run_negative, same_shape},
    {"sepia", "Apply a sepia tone", {}, run_sepia, same_shape},
    {"mirror_horizontal", "Reverse each row", {}, run_mirror_horizontal, same_shape},
    {"mirror_vertical", "Reverse the row order", {}, run_mirror_vertical, same_shape},
    {"rotate", "Rotate in quarter turns", ROTATE_PARAMS, run_rotate, rotate_shape},
    {"tile", "Repeat the image size x size times", TILE_PARAMS, run_tile, tile_shape},
    {"resize", "Nearest-neighbour resample", RESIZE_PARAMS, run_resize, resize_shape},
    {"blur", "Box blur with clamped edges", BLUR_PARAMS, run_blur, same_shape},
    {"pixelate", "Average non-overlapping cells", PIXELATE_PARAMS, run_pixelate, same_shape},
    {"checkerboard", "Darken and brighten alternating tiles", CHECKERBOARD_PARAMS, run_checkerboard, same_shape},
};

// ============================================================================
// Coercion
// ============================================================================

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

bool parse_number(std::string_view text, double& value) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            return false;
        }
    }
    if (text.empty()) {
        return false;
    }

    // Integers first so large values do not lose precision
    std::int64_t integer = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), integer);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
        value = static_cast<double>(integer);
        return true;
    }

    double real = 0.0;
    auto [rptr, rec] = std::from_chars(text.data(), text.data() + text.size(), real);
    if (rec != std::errc() || rptr != text.data() + text.size() || !std::isfinite(real)) {
        return false;
    }
    value = real;
    return true;
}

result invalid(std::string_view op, std::string msg) {
    return result::failure(error_code::invalid_parameter, std::string(op) + ": " + msg);
}

result coerce(std::string_view op, const param_spec& spec, std::string_view key,
              std::string_view text, param_values& values) {
    double number = 0.0;
    if (!parse_number(text, number)) {
        return invalid(op, std::string(key) + " is not a number: '" + std::string(text) + "'");
    }

    if (number < spec.min || number > spec.max) {
        return invalid(op, std::string(key) + " is out of range: " + std::string(trim(text)));
    }

    if (spec.type == param_type::real) {
        values.set(spec.name, number);
        return result::success();
    }

    if (std::floor(number) != number) {
        return invalid(op, std::string(key) + " must be an integer, got " + std::string(trim(text)));
    }
    const int integer = static_cast<int>(number);
    if (spec.step > 0 && integer % spec.step != 0) {
        return invalid(op, std::string(key) + " must be a multiple of " + std::to_string(spec.step) +
                           ", got " + std::to_string(integer));
    }
    values.set(spec.name, integer);
    return result::success();
}

const param_spec* find_param(const operation_info& op, std::string_view key) {
    for (const auto& spec : op.params) {
        if (spec.name == key || (!spec.alias.empty() && spec.alias == key)) {
            return &spec;
        }
    }
    return nullptr;
}

result log_rejection(std::string_view name, result res) {
    LOG_F(1, "Rejected %.*s: %s (%s)", static_cast<int>(name.size()), name.data(),
          res.message.c_str(), to_string(res.error));
    return res;
}

} // namespace

// ============================================================================
// Catalog Lookup
// ============================================================================

std::span<const operation_info> operations() noexcept {
    return OPERATIONS;
}

const operation_info* find_operation(std::string_view name) noexcept {
    for (const auto& op : OPERATIONS) {
        if (op.name == name) {
            return &op;
        }
    }
    return nullptr;
}

// ============================================================================
// Dispatch
// ============================================================================

result validate(std::string_view name, const raw_params& raw, transform_request& request) {
    const operation_info* op = find_operation(name);
    if (!op) {
        return log_rejection(name, result::failure(error_code::unknown_operation,
            "Unknown operation '" + std::string(name) + "'"));
    }

    param_values values;
    for (const auto& [key, text] : raw) {
        const param_spec* spec = find_param(*op, key);
        if (!spec) {
            return log_rejection(name, invalid(op->name, "unexpected parameter '" + key + "'"));
        }
        if (values.contains(spec->name)) {
            return log_rejection(name, invalid(op->name, "parameter '" + std::string(spec->name) +
                                                         "' given more than once"));
        }
        auto res = coerce(op->name, *spec, key, text, values);
        if (!res) {
            return log_rejection(name, std::move(res));
        }
    }

    for (const auto& spec : op->params) {
        if (values.contains(spec.name)) {
            continue;
        }
        if (spec.required) {
            return log_rejection(name, invalid(op->name, "missing required parameter '" +
                                                         std::string(spec.name) + "'"));
        }
        if (spec.type == param_type::real) {
            values.set(spec.name, spec.default_value);
        } else {
            values.set(spec.name, static_cast<int>(spec.default_value));
        }
    }

    request.operation = op;
    request.params = std::move(values);
    return result::success();
}

result apply(const pixel_grid& src, pixel_grid& dst, const transform_request& request,
             const engine_limits& limits) {
    if (!request.operation || !request.operation->run) {
        return result::failure(error_code::unknown_operation, "Request has no operation");
    }
    const operation_info& op = *request.operation;

    auto check = check_source(src, std::string(op.name).c_str());
    if (!check) return log_rejection(op.name, std::move(check));

    std::int64_t out_w = 0;
    std::int64_t out_h = 0;
    op.output_shape(src, request.params, out_w, out_h);
    check = check_limits(out_w, out_h, src.format(), limits);
    if (!check) return log_rejection(op.name, std::move(check));

    LOG_F(1, "Applying %.*s to %dx%d grid -> %lldx%lld", static_cast<int>(op.name.size()),
          op.name.data(), src.width(), src.height(),
          static_cast<long long>(out_w), static_cast<long long>(out_h));

    auto res = op.run(src, dst, request.params, limits);
    if (!res) {
        return log_rejection(op.name, std::move(res));
    }
    return res;
}

result apply(const pixel_grid& src, pixel_grid& dst, std::string_view name,
             const raw_params& raw, const engine_limits& limits) {
    transform_request request;
    auto res = validate(name, raw, request);
    if (!res) return res;
    return apply(src, dst, request, limits);
}

} // namespace prism_image

#ifndef PRISM_IMAGE_OPERATION_HPP_
#define PRISM_IMAGE_OPERATION_HPP_

#include <prism_image/prism_image_export.h>
#include <prism_image/types.hpp>
#include <prism_image/pixel_grid.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace prism_image {

// ============================================================================
// Parameters
// ============================================================================

/**
 * Untyped request parameters, keyed by name. Values are text exactly as a
 * form field or command line would carry them.
 */
using raw_params = std::map<std::string, std::string, std::less<>>;

enum class param_type {
    integer,
    real
};

struct param_spec {
    std::string_view name;
    std::string_view alias;     // Alternate key accepted for name (may be empty)
    param_type type = param_type::integer;
    double min = 0.0;
    double max = 0.0;
    int step = 0;               // Integer values must be a multiple of step (0 = any)
    bool required = false;
    double default_value = 0.0; // Used when the parameter is absent and not required
    std::string_view description;
};

using param_value = std::variant<int, double>;

/**
 * Coerced, range-checked parameter values of one request.
 */
class PRISM_IMAGE_EXPORT param_values {
public:
    void set(std::string_view name, param_value value);

    [[nodiscard]] bool contains(std::string_view name) const;

    /**
     * Integer parameter value, or 0 if absent.
     */
    [[nodiscard]] int get_int(std::string_view name) const;

    /**
     * Real parameter value (integers are widened), or 0.0 if absent.
     */
    [[nodiscard]] double get_real(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
    std::map<std::string, param_value, std::less<>> values_;
};

// ============================================================================
// Operation Catalog
// ============================================================================

using operation_fn = result (*)(const pixel_grid& src, pixel_grid& dst,
                                const param_values& params, const engine_limits& limits);

// Output dimensions the operation will produce for src
using shape_fn = void (*)(const pixel_grid& src, const param_values& params,
                          std::int64_t& width, std::int64_t& height);

struct operation_info {
    std::string_view name;
    std::string_view description;
    std::span<const param_spec> params;
    operation_fn run = nullptr;
    shape_fn output_shape = nullptr;
};

/**
 * All operations, in a stable order.
 */
[[nodiscard]] PRISM_IMAGE_EXPORT std::span<const operation_info> operations() noexcept;

/**
 * Look up an operation by name.
 * @return Pointer into the catalog, or nullptr if the name is unknown
 */
[[nodiscard]] PRISM_IMAGE_EXPORT const operation_info* find_operation(std::string_view name) noexcept;

// ============================================================================
// Dispatch
// ============================================================================

/**
 * A validated request: an operation plus its typed parameters.
 * Built by validate() for a single apply() call.
 */
struct transform_request {
    const operation_info* operation = nullptr;
    param_values params;
};

/**
 * Resolve an operation name and coerce its parameters.
 *
 * Integer parameters accept base-10 integers and decimals with an integral
 * value ("90.0"); real parameters accept any finite decimal. Absent optional
 * parameters take their defaults.
 *
 * @return unknown_operation for an unknown name; invalid_parameter for an
 *         unexpected key, a missing required value, unparsable text or a
 *         value outside its range
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result validate(std::string_view name,
                                                 const raw_params& raw,
                                                 transform_request& request);

/**
 * Run a validated request. src is never modified; dst receives a new grid
 * on success and is left untouched on failure.
 * @return resource_limit_exceeded if the output grid would exceed limits
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result apply(const pixel_grid& src,
                                              pixel_grid& dst,
                                              const transform_request& request,
                                              const engine_limits& limits = {});

/**
 * validate() followed by apply().
 */
[[nodiscard]] PRISM_IMAGE_EXPORT result apply(const pixel_grid& src,
                                              pixel_grid& dst,
                                              std::string_view name,
                                              const raw_params& raw,
                                              const engine_limits& limits = {});

} // namespace prism_image

#endif // PRISM_IMAGE_OPERATION_HPP_

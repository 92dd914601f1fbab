#include "request.h"

#include "cli_parse.h"

#include <algorithm>
#include <cmath>

namespace gang::core {

bool validate_request(const LayoutRequest& request, const RequestLimits& limits, Error& error) {
    if (request.designs.empty()) {
        return fail(error, ErrorCode::InvalidQuantity, "no designs given");
    }
    for (const DesignRequest& design : request.designs) {
        if (design.quantity < limits.min_quantity || design.quantity > limits.max_quantity) {
            return fail(error, ErrorCode::InvalidQuantity,
                        "quantity for '" + design.path + "' must be between "
                            + std::to_string(limits.min_quantity) + " and " + std::to_string(limits.max_quantity));
        }
    }

    if (!limits.allowed_widths_inches.empty()) {
        const bool allowed = std::any_of(limits.allowed_widths_inches.begin(), limits.allowed_widths_inches.end(),
                                         [&](double width) {
                                             return std::abs(width - request.width_inches) <= 1e-9;
                                         });
        if (!allowed) {
            std::string choices;
            for (double width : limits.allowed_widths_inches) {
                if (!choices.empty()) {
                    choices += ", ";
                }
                choices += format_number(width);
            }
            return fail(error, ErrorCode::InvalidConstraint,
                        "sheet width " + format_number(request.width_inches) + "in is not one of: " + choices);
        }
    } else if (!(request.width_inches > 0.0)) {
        return fail(error, ErrorCode::InvalidConstraint, "sheet width must be positive");
    }

    if (!(request.max_length_inches >= limits.min_length_inches)
        || !(request.max_length_inches <= limits.max_length_inches)) {
        return fail(error, ErrorCode::InvalidConstraint,
                    "maximum length must be between " + format_number(limits.min_length_inches) + " and "
                        + format_number(limits.max_length_inches) + " inches");
    }
    if (!(request.dpi > 0.0)) {
        return fail(error, ErrorCode::InvalidConstraint, "raster resolution must be positive");
    }
    if (!validate_tier_table(request.tiers, error)) {
        return false;
    }
    return validate_constraints(build_constraints(request), error);
}

SheetConstraints build_constraints(const LayoutRequest& request) {
    SheetConstraints constraints;
    constraints.width = inches_to_points(request.width_inches);
    constraints.max_height = inches_to_points(request.max_length_inches);
    constraints.margin = inches_to_points(request.margin_inches);
    constraints.spacing = inches_to_points(request.spacing_inches);
    constraints.length_step = inches_to_points(request.length_step_inches);
    return constraints;
}

} // namespace gang::core

#pragma once

#include "errors.h"
#include "layout.h"
#include "pricing.h"
#include "units.h"

#include <string>
#include <vector>

namespace gang::core {

struct DesignRequest {
    std::string path;
    int quantity = 0;
};

// What a customer asks for, in inches.
struct LayoutRequest {
    std::vector<DesignRequest> designs;
    double width_inches = 22.0;
    double max_length_inches = 200.0;
    double margin_inches = 0.125;
    double spacing_inches = 0.5;
    double length_step_inches = 1.0;
    double dpi = k_default_raster_dpi;
    bool rotate = false;
    PricingPolicy pricing = PricingPolicy::FirstTierAtLeast;
    std::vector<CostTier> tiers = default_tier_table();
};

struct RequestLimits {
    std::vector<double> allowed_widths_inches = {22.0, 30.0};
    double min_length_inches = 12.0;
    double max_length_inches = 200.0;
    int min_quantity = 1;
    int max_quantity = 10000;
};

bool validate_request(const LayoutRequest& request, const RequestLimits& limits, Error& error);

SheetConstraints build_constraints(const LayoutRequest& request);

} // namespace gang::core

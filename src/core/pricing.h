#pragma once

#include "errors.h"
#include "layout.h"

#include <string>
#include <vector>

namespace gang::core {

struct CostTier {
    double threshold_inches = 0.0;
    double price = 0.0;
};

// FirstTierAtLeast bills the first tier covering the length.
// RoundToFoot rounds the length up to a multiple of 12 inches first and
// prefers a tier with exactly that threshold.
enum class PricingPolicy { FirstTierAtLeast, RoundToFoot };

struct SheetReport {
    Sheet sheet;
    double length_inches = 0.0;
    double price = 0.0;
};

std::vector<CostTier> default_tier_table();

bool validate_tier_table(const std::vector<CostTier>& tiers, Error& error);

// "12:5.28,24:10.56,..." in ascending threshold order.
bool parse_tier_table(const std::string& value, std::vector<CostTier>& out, Error& error);
std::string format_tier_table(const std::vector<CostTier>& tiers);

bool parse_pricing_policy(const std::string& value, PricingPolicy& out);
const char* pricing_policy_name(PricingPolicy policy);

// Saturates at the last tier; tiers must be non-empty and validated.
double price_for(const std::vector<CostTier>& tiers, double length_inches, PricingPolicy policy);

std::vector<SheetReport> price_sheets(std::vector<Sheet> sheets,
                                      const std::vector<CostTier>& tiers,
                                      PricingPolicy policy);

double total_price(const std::vector<SheetReport>& reports);

} // namespace gang::core

#include "pricing.h"

#include "cli_parse.h"
#include "units.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace gang::core {

namespace {

constexpr double k_foot_inches = 12.0;
constexpr double k_length_tolerance = 1e-9;

const CostTier* first_tier_at_least(const std::vector<CostTier>& tiers, double length_inches) {
    for (const CostTier& tier : tiers) {
        if (length_inches <= tier.threshold_inches + k_length_tolerance) {
            return &tier;
        }
    }
    return nullptr;
}

} // namespace

std::vector<CostTier> default_tier_table() {
    return {
        {12.0, 5.28},
        {24.0, 10.56},
        {36.0, 15.84},
        {48.0, 21.12},
        {60.0, 26.40},
        {80.0, 35.20},
        {100.0, 44.00},
        {120.0, 49.28},
        {140.0, 56.32},
        {160.0, 61.60},
        {180.0, 68.64},
        {200.0, 75.68},
    };
}

bool validate_tier_table(const std::vector<CostTier>& tiers, Error& error) {
    if (tiers.empty()) {
        return fail(error, ErrorCode::InvalidConstraint, "price table has no tiers");
    }
    for (size_t i = 0; i < tiers.size(); ++i) {
        const CostTier& tier = tiers[i];
        if (!std::isfinite(tier.threshold_inches) || tier.threshold_inches <= 0.0) {
            return fail(error, ErrorCode::InvalidConstraint,
                        "tier " + std::to_string(i + 1) + " has a non-positive length");
        }
        if (!std::isfinite(tier.price) || tier.price < 0.0) {
            return fail(error, ErrorCode::InvalidConstraint,
                        "tier " + std::to_string(i + 1) + " has a negative price");
        }
        if (i > 0 && tier.threshold_inches <= tiers[i - 1].threshold_inches) {
            return fail(error, ErrorCode::InvalidConstraint,
                        "tier lengths must be strictly increasing (" + format_number(tiers[i - 1].threshold_inches)
                            + " then " + format_number(tier.threshold_inches) + ")");
        }
    }
    return true;
}

bool parse_tier_table(const std::string& value, std::vector<CostTier>& out, Error& error) {
    std::vector<CostTier> tiers;
    std::istringstream input(value);
    std::string entry;
    while (std::getline(input, entry, ',')) {
        entry = trim_copy(entry);
        const size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            return fail(error, ErrorCode::InvalidConstraint, "tier '" + entry + "' is not LENGTH:PRICE");
        }
        CostTier tier;
        if (!parse_double(trim_copy(entry.substr(0, colon)), tier.threshold_inches)
            || !parse_double(trim_copy(entry.substr(colon + 1)), tier.price)) {
            return fail(error, ErrorCode::InvalidConstraint, "tier '" + entry + "' has a non-numeric field");
        }
        tiers.push_back(tier);
    }
    if (!validate_tier_table(tiers, error)) {
        return false;
    }
    out = std::move(tiers);
    return true;
}

std::string format_tier_table(const std::vector<CostTier>& tiers) {
    std::string result;
    for (const CostTier& tier : tiers) {
        if (!result.empty()) {
            result += ",";
        }
        result += format_number(tier.threshold_inches) + ":" + format_number(tier.price);
    }
    return result;
}

bool parse_pricing_policy(const std::string& value, PricingPolicy& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "first-tier") {
        out = PricingPolicy::FirstTierAtLeast;
        return true;
    }
    if (lower == "round-foot") {
        out = PricingPolicy::RoundToFoot;
        return true;
    }
    return false;
}

const char* pricing_policy_name(PricingPolicy policy) {
    return policy == PricingPolicy::RoundToFoot ? "round-foot" : "first-tier";
}

double price_for(const std::vector<CostTier>& tiers, double length_inches, PricingPolicy policy) {
    if (tiers.empty()) {
        return 0.0;
    }
    double lookup = length_inches;
    if (policy == PricingPolicy::RoundToFoot) {
        lookup = std::ceil(length_inches / k_foot_inches - k_length_tolerance) * k_foot_inches;
        for (const CostTier& tier : tiers) {
            if (std::abs(tier.threshold_inches - lookup) <= k_length_tolerance) {
                return tier.price;
            }
        }
    }
    if (const CostTier* tier = first_tier_at_least(tiers, lookup)) {
        return tier->price;
    }
    return tiers.back().price;
}

std::vector<SheetReport> price_sheets(std::vector<Sheet> sheets,
                                      const std::vector<CostTier>& tiers,
                                      PricingPolicy policy) {
    std::vector<SheetReport> reports;
    reports.reserve(sheets.size());
    for (Sheet& sheet : sheets) {
        SheetReport report;
        report.length_inches = points_to_inches(sheet.height);
        report.price = price_for(tiers, report.length_inches, policy);
        report.sheet = std::move(sheet);
        reports.push_back(std::move(report));
    }
    return reports;
}

double total_price(const std::vector<SheetReport>& reports) {
    double total = 0.0;
    for (const SheetReport& report : reports) {
        total += report.price;
    }
    return total;
}

} // namespace gang::core

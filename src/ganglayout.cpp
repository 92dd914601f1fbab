// ganglayout.cpp
// MIT License (c) 2026 Pedro

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/asset.h"
#include "core/cli_parse.h"
#include "core/errors.h"
#include "core/layout.h"
#include "core/layout_parser.h"
#include "core/paginate.h"
#include "core/pricing.h"
#include "core/profiles.h"
#include "core/request.h"
#include "core/units.h"

namespace fs = std::filesystem;
using namespace gang::core;

namespace {

constexpr int k_exit_invalid_input = 1;
constexpr int k_exit_internal_error = 2;

int report_error(const Error& error) {
    std::cerr << "Error: " << error.message << "\n";
    if (is_internal_error(error.code)) {
        std::cerr << "Internal failure (" << error_code_name(error.code) << "); please report it\n";
        return k_exit_internal_error;
    }
    return k_exit_invalid_input;
}

void print_usage() {
    std::cout << "Usage: ganglayout [OPTIONS] <asset>...\n"
              << "\n"
              << "Lay out copies of PDF or raster designs on gang sheets and write the\n"
              << "layout text to stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --quantity N           Copies of every positional asset\n"
              << "  --design PATH N        Add a design with its own copy count\n"
              << "  --width IN             Sheet width in inches (default: 22)\n"
              << "  --max-length IN        Longest sheet in inches (default: 200)\n"
              << "  --margin IN            Safe margin in inches (default: 0.125)\n"
              << "  --spacing IN           Gap between copies in inches (default: 0.5)\n"
              << "  --length-step IN       Sheet length rounding step in inches (default: 1)\n"
              << "  --rotate               Turn every copy 90 degrees\n"
              << "  --dpi N                Resolution assumed for raster images (default: 300)\n"
              << "  --pricing POLICY       first-tier or round-foot (default: first-tier)\n"
              << "  --tiers LIST           Price table, e.g. 12:5.28,24:10.56\n"
              << "  --profile NAME         Load defaults from a profile\n"
              << "  --profiles-config PATH Profile file to read\n"
              << "  --verbose              Trace every sheet and placement on stderr\n"
              << "  --help, -h             Show this help message\n";
}

std::string inches(double points) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << points_to_inches(points);
    return out.str();
}

} // namespace

int main(int argc, char** argv) {
    LayoutRequest request;
    RequestLimits limits;
    std::vector<std::string> asset_paths;
    std::vector<DesignRequest> explicit_designs;
    std::string requested_profile_name;
    std::string profiles_config_path;
    bool verbose = false;

    std::optional<int> quantity_override;
    std::optional<double> width_override;
    std::optional<double> max_length_override;
    std::optional<double> margin_override;
    std::optional<double> spacing_override;
    std::optional<double> length_step_override;
    std::optional<double> dpi_override;
    std::optional<PricingPolicy> pricing_override;
    std::optional<std::vector<CostTier>> tiers_override;
    bool rotate_override = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--quantity" && i + 1 < argc) {
            std::string value = argv[++i];
            int parsed = 0;
            if (!parse_positive_int(value, parsed)) {
                std::cerr << "Invalid quantity: " << value << "\n";
                return k_exit_invalid_input;
            }
            quantity_override = parsed;
        } else if (arg == "--design" && i + 2 < argc) {
            DesignRequest design;
            design.path = argv[++i];
            std::string value = argv[++i];
            if (!parse_positive_int(value, design.quantity)) {
                std::cerr << "Invalid quantity for " << design.path << ": " << value << "\n";
                return k_exit_invalid_input;
            }
            explicit_designs.push_back(std::move(design));
        } else if ((arg == "--width" || arg == "--max-length" || arg == "--length-step" || arg == "--dpi")
                   && i + 1 < argc) {
            std::string value = argv[++i];
            double parsed = 0.0;
            if (!parse_positive_double(value, parsed)) {
                std::cerr << "Invalid " << arg.substr(2) << " value: " << value << "\n";
                return k_exit_invalid_input;
            }
            if (arg == "--width") {
                width_override = parsed;
            } else if (arg == "--max-length") {
                max_length_override = parsed;
            } else if (arg == "--length-step") {
                length_step_override = parsed;
            } else {
                dpi_override = parsed;
            }
        } else if ((arg == "--margin" || arg == "--spacing") && i + 1 < argc) {
            std::string value = argv[++i];
            double parsed = 0.0;
            if (!parse_non_negative_double(value, parsed)) {
                std::cerr << "Invalid " << arg.substr(2) << " value: " << value << "\n";
                return k_exit_invalid_input;
            }
            if (arg == "--margin") {
                margin_override = parsed;
            } else {
                spacing_override = parsed;
            }
        } else if (arg == "--rotate") {
            rotate_override = true;
        } else if (arg == "--pricing" && i + 1 < argc) {
            std::string value = argv[++i];
            PricingPolicy parsed = PricingPolicy::FirstTierAtLeast;
            if (!parse_pricing_policy(value, parsed)) {
                std::cerr << "Invalid pricing policy: " << value << "\n";
                return k_exit_invalid_input;
            }
            pricing_override = parsed;
        } else if (arg == "--tiers" && i + 1 < argc) {
            std::vector<CostTier> parsed;
            Error error;
            if (!parse_tier_table(argv[++i], parsed, error)) {
                return report_error(error);
            }
            tiers_override = std::move(parsed);
        } else if (arg == "--profile" && i + 1 < argc) {
            requested_profile_name = argv[++i];
        } else if (arg == "--profiles-config" && i + 1 < argc) {
            profiles_config_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return k_exit_invalid_input;
        } else {
            asset_paths.push_back(arg);
        }
    }

    std::optional<int> profile_quantity;
    bool rotate = rotate_override;
    if (!requested_profile_name.empty()) {
        fs::path exec_dir;
        std::error_code ec;
        fs::path exec_path(argv[0]);
        if (exec_path.is_relative()) {
            exec_path = fs::current_path(ec) / exec_path;
        }
        exec_dir = exec_path.parent_path();

        std::vector<ProfileDefinition> profiles;
        std::vector<std::string> tried_candidates;
        bool loaded_profile_file = false;
        for (const fs::path& candidate : profile_config_candidates(profiles_config_path, exec_dir)) {
            const bool exists = fs::exists(candidate, ec);
            if (ec || !exists) {
                tried_candidates.push_back(candidate.string());
                continue;
            }
            std::string config_error;
            if (!load_profiles_config_from_file(candidate, profiles, config_error)) {
                std::cerr << "Failed to load profile config (" << candidate << "): " << config_error << "\n";
                return k_exit_invalid_input;
            }
            loaded_profile_file = true;
            break;
        }
        if (!loaded_profile_file) {
            std::cerr << "Failed to load profile config. Tried:";
            for (const std::string& candidate : tried_candidates) {
                std::cerr << " " << candidate;
            }
            std::cerr << "\n";
            return k_exit_invalid_input;
        }

        const ProfileDefinition* profile = find_profile(profiles, requested_profile_name);
        if (profile == nullptr) {
            std::string available;
            for (size_t idx = 0; idx < profiles.size(); ++idx) {
                if (idx > 0) {
                    available += ", ";
                }
                available += profiles[idx].name;
            }
            std::cerr << "Invalid profile '" << requested_profile_name << "'. Available profiles: "
                      << available << "\n";
            return k_exit_invalid_input;
        }

        request.width_inches = profile->width.value_or(request.width_inches);
        request.max_length_inches = profile->max_length.value_or(request.max_length_inches);
        request.margin_inches = profile->margin.value_or(request.margin_inches);
        request.spacing_inches = profile->spacing.value_or(request.spacing_inches);
        request.length_step_inches = profile->length_step.value_or(request.length_step_inches);
        request.dpi = profile->dpi.value_or(request.dpi);
        request.pricing = profile->pricing.value_or(request.pricing);
        if (profile->tiers) {
            request.tiers = *profile->tiers;
        }
        if (profile->allowed_widths) {
            limits.allowed_widths_inches = *profile->allowed_widths;
        }
        if (!rotate_override && profile->rotate) {
            rotate = *profile->rotate;
        }
        profile_quantity = profile->quantity;
    }

    request.width_inches = width_override.value_or(request.width_inches);
    request.max_length_inches = max_length_override.value_or(request.max_length_inches);
    request.margin_inches = margin_override.value_or(request.margin_inches);
    request.spacing_inches = spacing_override.value_or(request.spacing_inches);
    request.length_step_inches = length_step_override.value_or(request.length_step_inches);
    request.dpi = dpi_override.value_or(request.dpi);
    request.pricing = pricing_override.value_or(request.pricing);
    if (tiers_override) {
        request.tiers = *tiers_override;
    }
    request.rotate = rotate;

    const std::optional<int> quantity = quantity_override ? quantity_override : profile_quantity;
    if (!asset_paths.empty() && !quantity) {
        std::cerr << "Error: --quantity is required for positional assets\n";
        return k_exit_invalid_input;
    }
    for (const std::string& path : asset_paths) {
        request.designs.push_back(DesignRequest{path, *quantity});
    }
    for (DesignRequest& design : explicit_designs) {
        request.designs.push_back(std::move(design));
    }

    Error error;
    if (!validate_request(request, limits, error)) {
        return report_error(error);
    }
    const SheetConstraints constraints = build_constraints(request);

    // Each distinct file is read and measured once.
    std::unordered_map<std::string, AssetFootprint> resolved;
    std::vector<Design> designs;
    designs.reserve(request.designs.size());
    for (const DesignRequest& wanted : request.designs) {
        auto it = resolved.find(wanted.path);
        if (it == resolved.end()) {
            AssetFootprint footprint;
            if (!resolve_asset_file(wanted.path, false, request.dpi, footprint, error)) {
                return report_error(error);
            }
            it = resolved.emplace(wanted.path, footprint).first;
            if (verbose) {
                std::cerr << "Asset " << wanted.path << ": " << asset_kind_name(footprint.kind) << " "
                          << inches(footprint.base_width) << "x" << inches(footprint.base_height) << "in\n";
            }
        }
        Design design;
        design.name = wanted.path;
        design.footprint = it->second;
        design.requested_copies = wanted.quantity;
        designs.push_back(std::move(design));
    }

    if (verbose) {
        std::cerr << "Sheet " << format_number(request.width_inches) << "in wide, up to "
                  << format_number(request.max_length_inches) << "in long, margin "
                  << format_number(request.margin_inches) << "in, spacing "
                  << format_number(request.spacing_inches) << "in, rotate " << (rotate ? "yes" : "no") << "\n";
        std::cerr << "Price tiers " << format_tier_table(request.tiers) << "\n";
    }

    SheetObserver observer;
    if (verbose) {
        observer = [&designs](size_t index, const PackResult& result, size_t remaining_after) {
            const Sheet& sheet = result.sheet;
            std::cerr << "Sheet " << (index + 1) << " (" << pack_mode_name(result.mode) << "): "
                      << result.consumed << " placed, " << remaining_after << " left, length "
                      << inches(sheet.height) << "in\n";
            for (const Placement& p : sheet.placements) {
                std::cerr << "  " << designs[p.design].name << " at X:" << inches(p.x) << " Y:" << inches(p.y)
                          << (p.rotated ? " rotated" : "") << "\n";
            }
        };
    }

    std::vector<Sheet> sheets;
    if (!generate_layout(designs, constraints, rotate, sheets, error, observer)) {
        return report_error(error);
    }

    const size_t placed = count_placements(sheets);
    LayoutDocument document;
    document.designs = std::move(designs);
    document.sheets = price_sheets(std::move(sheets), request.tiers, request.pricing);
    document.total_price = total_price(document.sheets);

    std::cout << build_layout_text(document);

    if (verbose) {
        std::cerr << placed << " copies on " << document.sheets.size() << " sheet(s), "
                  << pricing_policy_name(request.pricing) << " pricing, total " << std::fixed << std::setprecision(2) << document.total_price << "\n";
    }
    return 0;
}

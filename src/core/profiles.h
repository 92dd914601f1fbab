#pragma once

#include "pricing.h"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#ifndef GANG_GLOBAL_PROFILE_CONFIG
#define GANG_GLOBAL_PROFILE_CONFIG "/usr/local/share/gang/gangprofiles.cfg"
#endif

namespace gang::core {

constexpr const char* k_profiles_config_filename = "gangprofiles.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/gang/gangprofiles.cfg";
constexpr const char* k_global_profiles_config_path = GANG_GLOBAL_PROFILE_CONFIG;

// Values left unset fall back to the command line or built-in defaults.
struct ProfileDefinition {
    std::string name;
    std::optional<double> width;
    std::optional<double> max_length;
    std::optional<double> margin;
    std::optional<double> spacing;
    std::optional<double> length_step;
    std::optional<double> dpi;
    std::optional<bool> rotate;
    std::optional<int> quantity;
    std::optional<PricingPolicy> pricing;
    std::optional<std::vector<CostTier>> tiers;
    std::optional<std::vector<double>> allowed_widths;
};

bool parse_profiles_config(std::istream& input,
                           std::vector<ProfileDefinition>& out,
                           std::string& error);

bool load_profiles_config_from_file(const std::filesystem::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error);

std::optional<std::filesystem::path> resolve_user_profiles_config_path();

// Explicit path first; otherwise user config, next to the executable, global.
std::vector<std::filesystem::path> profile_config_candidates(const std::string& explicit_path,
                                                             const std::filesystem::path& exec_dir);

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name);

} // namespace gang::core

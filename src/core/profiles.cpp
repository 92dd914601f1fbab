#include "profiles.h"

#include "cli_parse.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace gang::core {

namespace {

bool parse_width_list(const std::string& value, std::vector<double>& out) {
    std::vector<double> widths;
    std::istringstream input(value);
    std::string token;
    while (std::getline(input, token, ',')) {
        double width = 0.0;
        if (!parse_positive_double(trim_copy(token), width)) {
            return false;
        }
        widths.push_back(width);
    }
    if (widths.empty()) {
        return false;
    }
    out = std::move(widths);
    return true;
}

} // namespace

bool parse_profiles_config(std::istream& input,
                           std::vector<ProfileDefinition>& out,
                           std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header at line " + std::to_string(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "' at line " + std::to_string(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name at line " + std::to_string(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header at line " +
                        std::to_string(line_number);
                return false;
            }
            if (seen_names.find(name) != seen_names.end()) {
                error = "duplicate profile '" + name + "' at line " + std::to_string(line_number);
                return false;
            }
            seen_names.insert(name);
            ProfileDefinition def;
            def.name = name;
            current = def;
            continue;
        }

        if (!current) {
            error = "entry outside of profile section at line " + std::to_string(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "' at line " + std::to_string(line_number);
            return false;
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key at line " + std::to_string(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }

        const std::string at_line = " at line " + std::to_string(line_number);
        std::string lower_key = to_lower_copy(key);
        if (lower_key == "width") {
            double parsed = 0.0;
            if (!parse_positive_double(value, parsed)) {
                error = "invalid width '" + value + "'" + at_line;
                return false;
            }
            current->width = parsed;
        } else if (lower_key == "max_length") {
            double parsed = 0.0;
            if (!parse_positive_double(value, parsed)) {
                error = "invalid max_length '" + value + "'" + at_line;
                return false;
            }
            current->max_length = parsed;
        } else if (lower_key == "margin") {
            double parsed = 0.0;
            if (!parse_non_negative_double(value, parsed)) {
                error = "invalid margin '" + value + "'" + at_line;
                return false;
            }
            current->margin = parsed;
        } else if (lower_key == "spacing") {
            double parsed = 0.0;
            if (!parse_non_negative_double(value, parsed)) {
                error = "invalid spacing '" + value + "'" + at_line;
                return false;
            }
            current->spacing = parsed;
        } else if (lower_key == "length_step") {
            double parsed = 0.0;
            if (!parse_positive_double(value, parsed)) {
                error = "invalid length_step '" + value + "'" + at_line;
                return false;
            }
            current->length_step = parsed;
        } else if (lower_key == "dpi") {
            double parsed = 0.0;
            if (!parse_positive_double(value, parsed)) {
                error = "invalid dpi '" + value + "'" + at_line;
                return false;
            }
            current->dpi = parsed;
        } else if (lower_key == "rotate") {
            bool parsed = false;
            if (!parse_bool_value(value, parsed)) {
                error = "invalid rotate '" + value + "'" + at_line;
                return false;
            }
            current->rotate = parsed;
        } else if (lower_key == "quantity") {
            int parsed = 0;
            if (!parse_positive_int(value, parsed)) {
                error = "invalid quantity '" + value + "'" + at_line;
                return false;
            }
            current->quantity = parsed;
        } else if (lower_key == "pricing") {
            PricingPolicy parsed = PricingPolicy::FirstTierAtLeast;
            if (!parse_pricing_policy(value, parsed)) {
                error = "invalid pricing '" + value + "'" + at_line;
                return false;
            }
            current->pricing = parsed;
        } else if (lower_key == "tiers") {
            std::vector<CostTier> parsed;
            Error tier_error;
            if (!parse_tier_table(value, parsed, tier_error)) {
                error = "invalid tiers: " + tier_error.message + at_line;
                return false;
            }
            current->tiers = std::move(parsed);
        } else if (lower_key == "allowed_widths") {
            std::vector<double> parsed;
            if (!parse_width_list(value, parsed)) {
                error = "invalid allowed_widths '" + value + "'" + at_line;
                return false;
            }
            current->allowed_widths = std::move(parsed);
        } else {
            error = "unknown key '" + key + "'" + at_line;
            return false;
        }
    }

    if (current) {
        out.push_back(*current);
    }

    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_profiles_config(input, out, error);
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::vector<fs::path> profile_config_candidates(const std::string& explicit_path, const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        fs::path candidate(explicit_path);
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (candidate.is_relative() && !ec && !cwd.empty()) {
            candidate = cwd / candidate;
        }
        candidates.push_back(std::move(candidate));
        return candidates;
    }
    if (std::optional<fs::path> user_config = resolve_user_profiles_config_path()) {
        candidates.push_back(*user_config);
    }
    if (!exec_dir.empty()) {
        candidates.push_back(exec_dir / k_profiles_config_filename);
    }
    candidates.push_back(fs::path(k_global_profiles_config_path));
    return candidates;
}

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name) {
    for (const ProfileDefinition& profile : profiles) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

} // namespace gang::core

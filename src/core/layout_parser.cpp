#include "layout_parser.h"

#include "cli_parse.h"

#include <cctype>
#include <cmath>
#include <sstream>
#include <string_view>
#include <utility>

namespace gang::core {

namespace {

constexpr double k_bounds_tolerance = 1e-3;

std::vector<std::string> split_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream tail(text);
    std::string token;
    while (tail >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string pair_text(double a, double b) {
    return format_number(a) + "," + format_number(b);
}

bool parse_index(const std::string& text, int& out) {
    if (text == "0") {
        out = 0;
        return true;
    }
    return parse_positive_int(text, out);
}

bool parse_grid_cell(const std::string& text, int& row, int& col) {
    const size_t comma = text.find(',');
    if (comma == std::string::npos) {
        return false;
    }
    return parse_index(text.substr(0, comma), row) && parse_index(text.substr(comma + 1), col);
}

bool parse_version_line(const std::string& line, int& version) {
    std::istringstream iss(line);
    std::string tag;
    std::string value;
    std::string extra;
    if (!(iss >> tag >> value) || tag != "gang") {
        return false;
    }
    if (!parse_positive_int(value, version)) {
        return false;
    }
    return !(iss >> extra);
}

bool parse_total_line(const std::string& line, double& total) {
    std::istringstream iss(line);
    std::string tag;
    std::string value;
    std::string extra;
    if (!(iss >> tag >> value) || tag != "total") {
        return false;
    }
    if (!parse_non_negative_double(value, total)) {
        return false;
    }
    return !(iss >> extra);
}

} // namespace

std::string build_layout_text(const LayoutDocument& document) {
    std::ostringstream output;
    output << "gang " << k_layout_format_version << "\n";
    for (const Design& design : document.designs) {
        output << "asset " << to_quoted(design.name) << " "
               << asset_kind_name(design.footprint.kind) << " "
               << pair_text(design.footprint.base_width, design.footprint.base_height)
               << " copies " << design.requested_copies;
        if (design.footprint.rotated) {
            output << " rotated";
        }
        output << "\n";
    }
    for (const SheetReport& report : document.sheets) {
        output << "sheet " << pair_text(report.sheet.width, report.sheet.height)
               << " length " << format_number(report.length_inches)
               << " price " << format_number(report.price) << "\n";
        for (const Placement& p : report.sheet.placements) {
            output << "tile " << p.design << " "
                   << pair_text(p.x, p.y) << " "
                   << pair_text(p.width, p.height) << " "
                   << p.row << "," << p.col;
            if (p.rotated) {
                output << " rotated";
            }
            output << "\n";
        }
    }
    output << "total " << format_number(document.total_price) << "\n";
    return output.str();
}

bool parse_asset_line(const std::string& line, Design& out, std::string& error) {
    constexpr std::string_view prefix = "asset";
    if (!line.starts_with(prefix)) {
        error = "line does not start with asset";
        return false;
    }

    size_t pos = prefix.size();
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
        ++pos;
    }
    if (pos >= line.size() || line[pos] != '"') {
        error = "asset path must be quoted";
        return false;
    }

    Design parsed;
    if (!parse_quoted(line, pos, parsed.name, error)) {
        return false;
    }

    std::vector<std::string> tokens = split_tokens(line.substr(pos));
    if (!tokens.empty() && tokens.back() == "rotated") {
        parsed.footprint.rotated = true;
        tokens.pop_back();
    }
    if (tokens.size() != 4 || tokens[2] != "copies") {
        error = "asset line must contain kind, size and copies";
        return false;
    }
    if (!parse_asset_kind(tokens[0], parsed.footprint.kind)) {
        error = "unknown asset kind '" + tokens[0] + "'";
        return false;
    }
    if (!parse_double_pair(tokens[1], parsed.footprint.base_width, parsed.footprint.base_height)
        || parsed.footprint.base_width <= 0.0 || parsed.footprint.base_height <= 0.0) {
        error = "invalid asset size '" + tokens[1] + "'";
        return false;
    }
    if (!parse_positive_int(tokens[3], parsed.requested_copies)) {
        error = "invalid copy count '" + tokens[3] + "'";
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool parse_sheet_line(const std::string& line, SheetReport& out, std::string& error) {
    std::vector<std::string> tokens = split_tokens(line);
    if (tokens.size() != 6 || tokens[0] != "sheet" || tokens[2] != "length" || tokens[4] != "price") {
        error = "sheet line must be: sheet W,H length L price P";
        return false;
    }
    SheetReport parsed;
    if (!parse_double_pair(tokens[1], parsed.sheet.width, parsed.sheet.height)
        || parsed.sheet.width <= 0.0 || parsed.sheet.height <= 0.0) {
        error = "invalid sheet size '" + tokens[1] + "'";
        return false;
    }
    if (!parse_positive_double(tokens[3], parsed.length_inches)) {
        error = "invalid sheet length '" + tokens[3] + "'";
        return false;
    }
    if (!parse_non_negative_double(tokens[5], parsed.price)) {
        error = "invalid sheet price '" + tokens[5] + "'";
        return false;
    }
    out = std::move(parsed);
    return true;
}

bool parse_tile_line(const std::string& line, Placement& out, std::string& error) {
    std::vector<std::string> tokens = split_tokens(line);
    if (tokens.empty() || tokens[0] != "tile") {
        error = "line does not start with tile";
        return false;
    }
    bool rotated = false;
    if (tokens.back() == "rotated") {
        rotated = true;
        tokens.pop_back();
    }
    if (tokens.size() != 5) {
        error = "tile line must be: tile INDEX X,Y W,H ROW,COL [rotated]";
        return false;
    }

    int index = 0;
    if (!parse_index(tokens[1], index)) {
        error = "invalid design index '" + tokens[1] + "'";
        return false;
    }

    Placement parsed;
    parsed.design = static_cast<size_t>(index);
    parsed.rotated = rotated;
    if (!parse_double_pair(tokens[2], parsed.x, parsed.y)) {
        error = "invalid tile position '" + tokens[2] + "'";
        return false;
    }
    if (!parse_double_pair(tokens[3], parsed.width, parsed.height)
        || parsed.width <= 0.0 || parsed.height <= 0.0) {
        error = "invalid tile size '" + tokens[3] + "'";
        return false;
    }
    parsed.anchor_x = rotated ? parsed.x + parsed.width : parsed.x;
    parsed.anchor_y = parsed.y;
    if (!parse_grid_cell(tokens[4], parsed.row, parsed.col)) {
        error = "invalid tile cell '" + tokens[4] + "'";
        return false;
    }
    out = parsed;
    return true;
}

bool parse_layout(std::istream& in, LayoutDocument& out, Error& error) {
    LayoutDocument parsed;
    bool has_version = false;
    bool has_total = false;
    std::string line;
    size_t line_number = 0;

    auto invalid = [&](const std::string& message) {
        return fail(error, ErrorCode::InvalidManifest, message + " at line " + std::to_string(line_number));
    };

    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }

        std::string line_error;
        if (line.starts_with("gang")) {
            int version = 0;
            if (has_version || !parse_version_line(line, version)) {
                return invalid("Invalid header line");
            }
            if (version != k_layout_format_version) {
                return invalid("Unsupported layout version " + std::to_string(version));
            }
            has_version = true;
        } else if (line.starts_with("asset")) {
            if (!parsed.sheets.empty()) {
                return invalid("Asset declared after the first sheet");
            }
            Design design;
            if (!parse_asset_line(line, design, line_error)) {
                return invalid("Invalid asset line: " + line_error);
            }
            parsed.designs.push_back(std::move(design));
        } else if (line.starts_with("sheet")) {
            SheetReport report;
            if (!parse_sheet_line(line, report, line_error)) {
                return invalid("Invalid sheet line: " + line_error);
            }
            parsed.sheets.push_back(std::move(report));
        } else if (line.starts_with("tile")) {
            if (parsed.sheets.empty()) {
                return invalid("Tile before any sheet");
            }
            Placement placement;
            if (!parse_tile_line(line, placement, line_error)) {
                return invalid("Invalid tile line: " + line_error);
            }
            parsed.sheets.back().sheet.placements.push_back(placement);
        } else if (line.starts_with("total")) {
            if (has_total || !parse_total_line(line, parsed.total_price)) {
                return invalid("Invalid total line");
            }
            has_total = true;
        } else {
            return invalid("Unknown line: " + line);
        }
    }

    if (!has_version) {
        return fail(error, ErrorCode::InvalidManifest, "Missing 'gang' header line");
    }
    if (!has_total) {
        parsed.total_price = total_price(parsed.sheets);
    }
    if (!validate_layout_document(parsed, error)) {
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool validate_layout_document(const LayoutDocument& document, Error& error) {
    for (size_t s = 0; s < document.sheets.size(); ++s) {
        const Sheet& sheet = document.sheets[s].sheet;
        for (const Placement& p : sheet.placements) {
            const std::string where = " on sheet " + std::to_string(s + 1);
            if (p.design >= document.designs.size()) {
                return fail(error, ErrorCode::InvalidManifest,
                            "Tile refers to unknown asset " + std::to_string(p.design) + where);
            }
            const AssetFootprint& fp = document.designs[p.design].footprint;
            const double expected_w = p.rotated ? fp.base_height : fp.base_width;
            const double expected_h = p.rotated ? fp.base_width : fp.base_height;
            if (std::abs(expected_w - p.width) > k_bounds_tolerance
                || std::abs(expected_h - p.height) > k_bounds_tolerance) {
                return fail(error, ErrorCode::InvalidManifest,
                            "Tile size does not match asset '" + document.designs[p.design].name + "'" + where);
            }
            if (p.x < -k_bounds_tolerance || p.y < -k_bounds_tolerance
                || p.x + p.width > sheet.width + k_bounds_tolerance
                || p.y + p.height > sheet.height + k_bounds_tolerance) {
                return fail(error, ErrorCode::InvalidManifest,
                            "Tile out of sheet bounds: " + document.designs[p.design].name + where);
            }
        }
    }
    return true;
}

} // namespace gang::core

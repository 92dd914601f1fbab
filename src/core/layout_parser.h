#pragma once

#include "errors.h"
#include "layout.h"
#include "pricing.h"

#include <istream>
#include <string>
#include <vector>

namespace gang::core {

constexpr int k_layout_format_version = 1;

// Text handed from ganglayout to gangpack. Lengths are in points; a tile
// ends with its row,col cell and an optional "rotated".
//
//   gang 1
//   asset "front.png" raster 288,144 copies 50
//   sheet 1584,2376 length 33 price 15.84
//   tile 0 9,2214 288,144 0,0
//   tile 0 333,2214 288,144 0,1
//   total 15.84
struct LayoutDocument {
    std::vector<Design> designs;
    std::vector<SheetReport> sheets;
    double total_price = 0.0;
};

std::string build_layout_text(const LayoutDocument& document);

bool parse_asset_line(const std::string& line, Design& out, std::string& error);
bool parse_sheet_line(const std::string& line, SheetReport& out, std::string& error);
bool parse_tile_line(const std::string& line, Placement& out, std::string& error);
bool parse_layout(std::istream& in, LayoutDocument& out, Error& error);

// Every tile must reference a known design and stay on its sheet.
bool validate_layout_document(const LayoutDocument& document, Error& error);

} // namespace gang::core

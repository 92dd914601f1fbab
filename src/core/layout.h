#pragma once

#include "asset.h"
#include "errors.h"
#include "units.h"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace gang::core {

// All lengths in points.
struct SheetConstraints {
    double width = 0.0;
    double max_height = 0.0;
    double margin = 0.0;
    double spacing = 0.0;
    double length_step = k_points_per_inch;
};

struct Design {
    std::string name;
    AssetFootprint footprint;
    int requested_copies = 0;
};

// Design indices, each repeated requested_copies times, in design order.
struct CopyQueue {
    std::vector<size_t> items;
    size_t cursor = 0;

    bool empty() const { return cursor >= items.size(); }
    size_t remaining_count() const { return empty() ? 0 : items.size() - cursor; }
    std::span<const size_t> remaining() const;
    void advance(size_t count);
};

// (x, y) is the bottom-left of the oriented cell. The anchor is where the
// unrotated asset's bottom-left goes before the renderer turns it 90 degrees
// counter-clockwise about that point, hence x + oriented width when rotated.
// row/col are grid indices in uniform mode and shelf/slot indices in shelf
// mode; the layout text carries both.
struct Placement {
    size_t design = 0;
    int row = 0;
    int col = 0;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    bool rotated = false;
    double anchor_x = 0.0;
    double anchor_y = 0.0;
};

struct Sheet {
    double width = 0.0;
    double height = 0.0;
    std::vector<Placement> placements;
};

enum class PackMode { Uniform, Shelf };

struct PackResult {
    bool has_sheet = false;
    PackMode mode = PackMode::Uniform;
    Sheet sheet;
    size_t consumed = 0;
};

const char* pack_mode_name(PackMode mode);

bool validate_constraints(const SheetConstraints& constraints, Error& error);

CopyQueue build_copy_queue(const std::vector<Design>& designs);

int columns_per_row(const SheetConstraints& constraints, double tile_width);
int rows_per_sheet(const SheetConstraints& constraints, double tile_height);

// Rounds up to a whole number of length steps, never past max_height.
double round_up_length(double raw_height, double step, double max_height);

Placement make_placement(size_t design, const AssetFootprint& footprint, double x, double y);

PackMode select_pack_mode(const std::vector<Design>& designs, std::span<const size_t> remaining);

bool pack_one_sheet(const std::vector<Design>& designs,
                    std::span<const size_t> remaining,
                    const SheetConstraints& constraints,
                    PackResult& out,
                    Error& error);

// True when the placed rectangle lies inside the sheet's margins.
bool placement_within_margins(const Placement& placement, const Sheet& sheet, double margin);

} // namespace gang::core

#include "layout.h"

#include "cli_parse.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace gang::core {

namespace {

int floor_to_count(double value) {
    const double floored = std::floor(value + k_geometry_epsilon);
    if (floored <= 0.0) {
        return 0;
    }
    if (floored >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(floored);
}

std::string inches_text(double points) {
    return format_number(std::round(points_to_inches(points) * 1000.0) / 1000.0) + "in";
}

bool check_fits_alone(const Design& design, const SheetConstraints& constraints, Error& error) {
    const double usable_width = constraints.width - 2.0 * constraints.margin;
    const double usable_height = constraints.max_height - 2.0 * constraints.margin;
    const double w = design.footprint.oriented_width();
    const double h = design.footprint.oriented_height();
    if (w > usable_width + k_geometry_epsilon) {
        return fail(error, ErrorCode::AssetTooWide,
                    "design '" + design.name + "' is " + inches_text(w) + " wide but only "
                        + inches_text(usable_width) + " fit between the margins");
    }
    if (h > usable_height + k_geometry_epsilon) {
        return fail(error, ErrorCode::AssetTooTall,
                    "design '" + design.name + "' is " + inches_text(h) + " tall but a sheet holds at most "
                        + inches_text(usable_height) + " between the margins");
    }
    return true;
}

bool pack_uniform(const std::vector<Design>& designs,
                  std::span<const size_t> remaining,
                  const SheetConstraints& constraints,
                  PackResult& out,
                  Error& error) {
    const Design& first = designs[remaining.front()];
    const double tile_w = first.footprint.oriented_width();
    const double tile_h = first.footprint.oriented_height();

    const int cols = columns_per_row(constraints, tile_w);
    if (cols < 1) {
        if (!check_fits_alone(first, constraints, error)) {
            return false;
        }
        return fail(error, ErrorCode::AssetTooWide, "design '" + first.name + "' leaves no room for one column");
    }
    const int max_rows = rows_per_sheet(constraints, tile_h);
    if (max_rows < 1) {
        if (!check_fits_alone(first, constraints, error)) {
            return false;
        }
        return fail(error, ErrorCode::AssetTooTall, "design '" + first.name + "' leaves no room for one row");
    }

    const size_t count = remaining.size();
    const size_t cols_z = static_cast<size_t>(cols);
    const size_t rows_needed = (count + cols_z - 1) / cols_z;
    const size_t rows = std::min(rows_needed, static_cast<size_t>(max_rows));
    const size_t consumed = std::min(count, rows * cols_z);

    const double raw_height = static_cast<double>(rows) * tile_h
        + static_cast<double>(rows - 1) * constraints.spacing
        + 2.0 * constraints.margin;

    Sheet sheet;
    sheet.width = constraints.width;
    sheet.height = round_up_length(raw_height, constraints.length_step, constraints.max_height);
    sheet.placements.reserve(consumed);

    for (size_t i = 0; i < consumed; ++i) {
        const size_t row = i / cols_z;
        const size_t col = i % cols_z;
        const double x = constraints.margin + static_cast<double>(col) * (tile_w + constraints.spacing);
        const double y = constraints.margin + static_cast<double>(rows - 1 - row) * (tile_h + constraints.spacing);
        Placement p = make_placement(remaining[i], designs[remaining[i]].footprint, x, y);
        p.row = static_cast<int>(row);
        p.col = static_cast<int>(col);
        sheet.placements.push_back(p);
    }

    out.has_sheet = true;
    out.mode = PackMode::Uniform;
    out.sheet = std::move(sheet);
    out.consumed = consumed;
    return true;
}

bool pack_shelf(const std::vector<Design>& designs,
                std::span<const size_t> remaining,
                const SheetConstraints& constraints,
                PackResult& out,
                Error& error) {
    const double margin = constraints.margin;
    const double right_edge = constraints.width - margin;
    const double top = constraints.max_height;

    double x = margin;
    double y = top - margin;
    double row_height = 0.0;
    double lowest_y = top;
    int shelf = 0;
    int slot = 0;

    Sheet sheet;
    sheet.width = constraints.width;

    for (size_t idx : remaining) {
        const Design& design = designs[idx];
        if (!check_fits_alone(design, constraints, error)) {
            return false;
        }
        const double w = design.footprint.oriented_width();
        const double h = design.footprint.oriented_height();

        if (x + w > right_edge + k_geometry_epsilon) {
            x = margin;
            y -= row_height + constraints.spacing;
            row_height = 0.0;
            ++shelf;
            slot = 0;
        }
        if (y - h < margin - k_geometry_epsilon) {
            break;
        }

        Placement p = make_placement(idx, design.footprint, x, y - h);
        p.row = shelf;
        p.col = slot++;
        sheet.placements.push_back(p);

        x += w + constraints.spacing;
        row_height = std::max(row_height, h);
        lowest_y = std::min(lowest_y, y - h);
    }

    out.has_sheet = !sheet.placements.empty();
    out.mode = PackMode::Shelf;
    out.consumed = sheet.placements.size();
    if (!out.has_sheet) {
        out.sheet = Sheet{};
        return true;
    }

    const double used_height = top - lowest_y + margin;
    sheet.height = round_up_length(used_height, constraints.length_step, constraints.max_height);

    // Placements were made against the full-length sheet; move them down so
    // that the cropped sheet keeps the top margin.
    const double shift = top - sheet.height;
    for (Placement& p : sheet.placements) {
        p.y -= shift;
        p.anchor_y -= shift;
    }
    out.sheet = std::move(sheet);
    return true;
}

} // namespace

std::span<const size_t> CopyQueue::remaining() const {
    if (empty()) {
        return {};
    }
    return std::span<const size_t>(items).subspan(cursor);
}

void CopyQueue::advance(size_t count) {
    cursor = std::min(items.size(), cursor + count);
}

const char* pack_mode_name(PackMode mode) {
    return mode == PackMode::Uniform ? "uniform" : "shelf";
}

bool validate_constraints(const SheetConstraints& constraints, Error& error) {
    if (!std::isfinite(constraints.width) || constraints.width <= 0.0) {
        return fail(error, ErrorCode::InvalidConstraint, "sheet width must be positive");
    }
    if (!std::isfinite(constraints.max_height) || constraints.max_height <= 0.0) {
        return fail(error, ErrorCode::InvalidConstraint, "maximum sheet length must be positive");
    }
    if (!std::isfinite(constraints.margin) || constraints.margin < 0.0) {
        return fail(error, ErrorCode::InvalidConstraint, "margin must not be negative");
    }
    if (!std::isfinite(constraints.spacing) || constraints.spacing < 0.0) {
        return fail(error, ErrorCode::InvalidConstraint, "spacing must not be negative");
    }
    if (!std::isfinite(constraints.length_step) || constraints.length_step <= 0.0) {
        return fail(error, ErrorCode::InvalidConstraint, "length step must be positive");
    }
    if (constraints.width <= 2.0 * constraints.margin) {
        return fail(error, ErrorCode::InvalidConstraint, "margins leave no printable width");
    }
    return true;
}

CopyQueue build_copy_queue(const std::vector<Design>& designs) {
    CopyQueue queue;
    size_t total = 0;
    for (const Design& design : designs) {
        total += static_cast<size_t>(std::max(design.requested_copies, 0));
    }
    queue.items.reserve(total);
    for (size_t i = 0; i < designs.size(); ++i) {
        for (int copy = 0; copy < designs[i].requested_copies; ++copy) {
            queue.items.push_back(i);
        }
    }
    return queue;
}

int columns_per_row(const SheetConstraints& constraints, double tile_width) {
    if (!(tile_width > 0.0)) {
        return 0;
    }
    return floor_to_count((constraints.width - 2.0 * constraints.margin + constraints.spacing)
                          / (tile_width + constraints.spacing));
}

int rows_per_sheet(const SheetConstraints& constraints, double tile_height) {
    if (!(tile_height > 0.0)) {
        return 0;
    }
    return floor_to_count((constraints.max_height - 2.0 * constraints.margin + constraints.spacing)
                          / (tile_height + constraints.spacing));
}

double round_up_length(double raw_height, double step, double max_height) {
    if (!(step > 0.0)) {
        return std::min(raw_height, max_height);
    }
    const double steps = std::ceil(raw_height / step - 1e-9);
    return std::min(steps * step, max_height);
}

Placement make_placement(size_t design, const AssetFootprint& footprint, double x, double y) {
    Placement p;
    p.design = design;
    p.x = x;
    p.y = y;
    p.width = footprint.oriented_width();
    p.height = footprint.oriented_height();
    p.rotated = footprint.rotated;
    p.anchor_x = footprint.rotated ? x + p.width : x;
    p.anchor_y = y;
    return p;
}

PackMode select_pack_mode(const std::vector<Design>& designs, std::span<const size_t> remaining) {
    if (remaining.empty()) {
        return PackMode::Uniform;
    }
    const AssetFootprint& first = designs[remaining.front()].footprint;
    const bool uniform = std::all_of(remaining.begin(), remaining.end(), [&](size_t idx) {
        return designs[idx].footprint.same_shape(first);
    });
    return uniform ? PackMode::Uniform : PackMode::Shelf;
}

bool pack_one_sheet(const std::vector<Design>& designs,
                    std::span<const size_t> remaining,
                    const SheetConstraints& constraints,
                    PackResult& out,
                    Error& error) {
    out = PackResult{};
    if (!validate_constraints(constraints, error)) {
        return false;
    }
    if (remaining.empty()) {
        return true;
    }
    for (size_t idx : remaining) {
        if (idx >= designs.size()) {
            return fail(error, ErrorCode::PackingStalled, "copy queue refers to an unknown design");
        }
    }

    if (select_pack_mode(designs, remaining) == PackMode::Uniform) {
        return pack_uniform(designs, remaining, constraints, out, error);
    }
    return pack_shelf(designs, remaining, constraints, out, error);
}

bool placement_within_margins(const Placement& placement, const Sheet& sheet, double margin) {
    constexpr double tolerance = 1e-6;
    return placement.x >= margin - tolerance
        && placement.y >= margin - tolerance
        && placement.x + placement.width <= sheet.width - margin + tolerance
        && placement.y + placement.height <= sheet.height - margin + tolerance;
}

} // namespace gang::core

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include "core/layout.h"
#include "test_helpers.h"

#include <vector>

using namespace gang::core;
using gang::test::make_design;
using gang::test::standard_constraints;

namespace {

SheetConstraints small_constraints(double width, double max_height) {
    SheetConstraints constraints;
    constraints.width = width;
    constraints.max_height = max_height;
    constraints.margin = 10.0;
    constraints.spacing = 10.0;
    constraints.length_step = 1.0;
    return constraints;
}

Design points_design(const char* name, double width, double height, int copies) {
    Design design;
    design.name = name;
    design.footprint.base_width = width;
    design.footprint.base_height = height;
    design.requested_copies = copies;
    return design;
}

} // namespace

DOCTEST_TEST_CASE("grid counts follow sheet geometry") {
    const SheetConstraints constraints = standard_constraints();
    DOCTEST_CHECK(columns_per_row(constraints, inches_to_points(4.0)) == 4);
    DOCTEST_CHECK(columns_per_row(constraints, inches_to_points(2.0)) == 8);
    DOCTEST_CHECK(rows_per_sheet(constraints, inches_to_points(2.0)) == 80);
    DOCTEST_CHECK(columns_per_row(constraints, inches_to_points(23.0)) == 0);
    DOCTEST_CHECK(columns_per_row(constraints, 0.0) == 0);
}

DOCTEST_TEST_CASE("length rounds up to step and caps") {
    DOCTEST_CHECK(round_up_length(2322.0, 72.0, 14400.0) == doctest::Approx(2376.0));
    DOCTEST_CHECK(round_up_length(2376.0, 72.0, 14400.0) == doctest::Approx(2376.0));
    DOCTEST_CHECK(round_up_length(14382.0, 72.0, 14400.0) == doctest::Approx(14400.0));
    DOCTEST_CHECK(round_up_length(14399.0, 864.0, 14400.0) == doctest::Approx(14400.0));
}

DOCTEST_TEST_CASE("uniform sheet for fifty copies") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 50)};
    const CopyQueue queue = build_copy_queue(designs);
    DOCTEST_REQUIRE(queue.remaining_count() == 50);

    PackResult result;
    Error error;
    DOCTEST_REQUIRE(pack_one_sheet(designs, queue.remaining(), standard_constraints(), result, error));
    DOCTEST_CHECK(result.has_sheet);
    DOCTEST_CHECK(result.mode == PackMode::Uniform);
    DOCTEST_CHECK(result.consumed == 50);
    DOCTEST_CHECK(result.sheet.width == doctest::Approx(1584.0));
    // 13 rows of 2in with 12 gaps and two margins is 32.25in.
    DOCTEST_CHECK(result.sheet.height == doctest::Approx(inches_to_points(33.0)));

    const Placement& first = result.sheet.placements.front();
    DOCTEST_CHECK(first.row == 0);
    DOCTEST_CHECK(first.col == 0);
    DOCTEST_CHECK(first.x == doctest::Approx(9.0));
    DOCTEST_CHECK(first.y == doctest::Approx(9.0 + 12.0 * 180.0));

    const Placement& last = result.sheet.placements.back();
    DOCTEST_CHECK(last.row == 12);
    DOCTEST_CHECK(last.col == 1);
    DOCTEST_CHECK(last.y == doctest::Approx(9.0));
    DOCTEST_CHECK(last.x == doctest::Approx(9.0 + 324.0));

    for (const Placement& p : result.sheet.placements) {
        DOCTEST_CHECK(placement_within_margins(p, result.sheet, 9.0));
        DOCTEST_CHECK_FALSE(p.rotated);
        DOCTEST_CHECK(p.anchor_x == doctest::Approx(p.x));
    }
}

DOCTEST_TEST_CASE("rotated tiles anchor on the right edge") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 6)};
    designs[0].footprint.rotated = true;
    const CopyQueue queue = build_copy_queue(designs);

    PackResult result;
    Error error;
    DOCTEST_REQUIRE(pack_one_sheet(designs, queue.remaining(), standard_constraints(), result, error));
    DOCTEST_REQUIRE(result.sheet.placements.size() == 6);
    for (const Placement& p : result.sheet.placements) {
        DOCTEST_CHECK(p.rotated);
        DOCTEST_CHECK(p.width == doctest::Approx(144.0));
        DOCTEST_CHECK(p.height == doctest::Approx(288.0));
        DOCTEST_CHECK(p.anchor_x == doctest::Approx(p.x + 144.0));
        DOCTEST_CHECK(p.anchor_y == doctest::Approx(p.y));
    }
    // Eight 2in columns fit, so six copies share one row.
    DOCTEST_CHECK(result.sheet.placements.back().row == 0);
    DOCTEST_CHECK(result.sheet.placements.back().col == 5);
}

DOCTEST_TEST_CASE("mixed shapes use shelves and keep the top margin") {
    std::vector<Design> designs = {
        points_design("wide", 100.0, 50.0, 2),
        points_design("tall", 100.0, 80.0, 2),
    };
    const CopyQueue queue = build_copy_queue(designs);
    const SheetConstraints constraints = small_constraints(300.0, 1000.0);
    DOCTEST_CHECK(select_pack_mode(designs, queue.remaining()) == PackMode::Shelf);

    PackResult result;
    Error error;
    DOCTEST_REQUIRE(pack_one_sheet(designs, queue.remaining(), constraints, result, error));
    DOCTEST_CHECK(result.mode == PackMode::Shelf);
    DOCTEST_REQUIRE(result.consumed == 4);
    DOCTEST_CHECK(result.sheet.height == doctest::Approx(160.0));

    const std::vector<Placement>& placed = result.sheet.placements;
    DOCTEST_CHECK(placed[0].row == 0);
    DOCTEST_CHECK(placed[1].col == 1);
    DOCTEST_CHECK(placed[2].row == 1);
    DOCTEST_CHECK(placed[2].col == 0);
    DOCTEST_CHECK(placed[0].x == doctest::Approx(10.0));
    DOCTEST_CHECK(placed[1].x == doctest::Approx(120.0));
    DOCTEST_CHECK(placed[0].y + placed[0].height == doctest::Approx(150.0));
    DOCTEST_CHECK(placed[2].y == doctest::Approx(10.0));
    for (const Placement& p : placed) {
        DOCTEST_CHECK(placement_within_margins(p, result.sheet, constraints.margin));
    }
}

DOCTEST_TEST_CASE("turned tiles on shelves keep their anchors after the crop") {
    std::vector<Design> designs = {
        points_design("wide", 100.0, 50.0, 2),
        points_design("tall", 60.0, 80.0, 2),
    };
    for (Design& design : designs) {
        design.footprint.rotated = true;
    }
    const CopyQueue queue = build_copy_queue(designs);
    const SheetConstraints constraints = small_constraints(300.0, 1000.0);
    DOCTEST_CHECK(select_pack_mode(designs, queue.remaining()) == PackMode::Shelf);

    PackResult result;
    Error error;
    DOCTEST_REQUIRE(pack_one_sheet(designs, queue.remaining(), constraints, result, error));
    DOCTEST_CHECK(result.mode == PackMode::Shelf);
    DOCTEST_REQUIRE(result.consumed == 4);
    // Shelf 0 is 100 tall (turned "wide"), shelf 1 is 60 tall.
    DOCTEST_CHECK(result.sheet.height == doctest::Approx(190.0));

    const std::vector<Placement>& placed = result.sheet.placements;
    for (const Placement& p : placed) {
        DOCTEST_CHECK(p.rotated);
        DOCTEST_CHECK(p.anchor_x == doctest::Approx(p.x + p.width));
        DOCTEST_CHECK(p.anchor_y == doctest::Approx(p.y));
        DOCTEST_CHECK(placement_within_margins(p, result.sheet, constraints.margin));
    }
    DOCTEST_CHECK(placed[0].width == doctest::Approx(50.0));
    DOCTEST_CHECK(placed[0].y == doctest::Approx(80.0));
    DOCTEST_CHECK(placed[2].x == doctest::Approx(130.0));
    DOCTEST_CHECK(placed[2].width == doctest::Approx(80.0));
    DOCTEST_CHECK(placed[2].anchor_x == doctest::Approx(210.0));
    DOCTEST_CHECK(placed[2].y + placed[2].height == doctest::Approx(180.0));
    DOCTEST_CHECK(placed[3].row == 1);
    DOCTEST_CHECK(placed[3].col == 0);
    DOCTEST_CHECK(placed[3].y == doctest::Approx(10.0));
    DOCTEST_CHECK(placed[3].anchor_y == doctest::Approx(10.0));
}

DOCTEST_TEST_CASE("shelf stops when the next shelf does not fit") {
    std::vector<Design> designs = {
        points_design("square", 100.0, 100.0, 2),
        points_design("strip", 50.0, 100.0, 2),
    };
    const CopyQueue queue = build_copy_queue(designs);

    PackResult result;
    Error error;
    DOCTEST_REQUIRE(pack_one_sheet(designs, queue.remaining(), small_constraints(300.0, 200.0), result, error));
    DOCTEST_CHECK(result.consumed == 3);
    DOCTEST_CHECK(result.sheet.height == doctest::Approx(120.0));
}

DOCTEST_TEST_CASE("asset wider than printable area is rejected") {
    std::vector<Design> designs = {make_design("banner.png", 23.0, 2.0, 1)};
    const CopyQueue queue = build_copy_queue(designs);

    PackResult result;
    Error error;
    DOCTEST_CHECK_FALSE(pack_one_sheet(designs, queue.remaining(), standard_constraints(), result, error));
    DOCTEST_CHECK(error.code == ErrorCode::AssetTooWide);
    DOCTEST_CHECK(error.message.find("banner.png") != std::string::npos);
    DOCTEST_CHECK_FALSE(result.has_sheet);
}

DOCTEST_TEST_CASE("asset longer than sheet is rejected") {
    std::vector<Design> designs = {make_design("pole.png", 1.0, 201.0, 1)};
    const CopyQueue queue = build_copy_queue(designs);

    PackResult result;
    Error error;
    DOCTEST_CHECK_FALSE(pack_one_sheet(designs, queue.remaining(), standard_constraints(), result, error));
    DOCTEST_CHECK(error.code == ErrorCode::AssetTooTall);
}

DOCTEST_TEST_CASE("oversized asset in mixed queue is rejected") {
    std::vector<Design> designs = {
        make_design("badge.png", 4.0, 2.0, 3),
        make_design("banner.png", 23.0, 2.0, 1),
    };
    const CopyQueue queue = build_copy_queue(designs);

    PackResult result;
    Error error;
    DOCTEST_CHECK_FALSE(pack_one_sheet(designs, queue.remaining(), standard_constraints(), result, error));
    DOCTEST_CHECK(error.code == ErrorCode::AssetTooWide);
}

DOCTEST_TEST_CASE("empty queue yields no sheet") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 1)};
    PackResult result;
    Error error;
    DOCTEST_CHECK(pack_one_sheet(designs, {}, standard_constraints(), result, error));
    DOCTEST_CHECK_FALSE(result.has_sheet);
    DOCTEST_CHECK(result.consumed == 0);
}

DOCTEST_TEST_CASE("bad constraints are rejected") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 1)};
    const CopyQueue queue = build_copy_queue(designs);
    PackResult result;
    Error error;

    SheetConstraints no_width = standard_constraints();
    no_width.margin = inches_to_points(11.0);
    DOCTEST_CHECK_FALSE(pack_one_sheet(designs, queue.remaining(), no_width, result, error));
    DOCTEST_CHECK(error.code == ErrorCode::InvalidConstraint);

    SheetConstraints negative_spacing = standard_constraints();
    negative_spacing.spacing = -1.0;
    DOCTEST_CHECK_FALSE(validate_constraints(negative_spacing, error));
    DOCTEST_CHECK(error.code == ErrorCode::InvalidConstraint);
}

DOCTEST_TEST_CASE("more copies never shorten a sheet") {
    const SheetConstraints constraints = standard_constraints();
    double previous = 0.0;
    for (int copies = 1; copies <= 400; copies += 7) {
        std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, copies)};
        const CopyQueue queue = build_copy_queue(designs);
        PackResult result;
        Error error;
        DOCTEST_REQUIRE(pack_one_sheet(designs, queue.remaining(), constraints, result, error));
        DOCTEST_CHECK(result.sheet.height >= previous);
        DOCTEST_CHECK(result.sheet.height <= constraints.max_height);
        previous = result.sheet.height;
    }
}

DOCTEST_TEST_CASE("copy queue advances and clamps") {
    std::vector<Design> designs = {
        make_design("a.png", 1.0, 1.0, 2),
        make_design("b.png", 1.0, 1.0, 1),
    };
    CopyQueue queue = build_copy_queue(designs);
    DOCTEST_REQUIRE(queue.items.size() == 3);
    DOCTEST_CHECK(queue.items[0] == 0);
    DOCTEST_CHECK(queue.items[2] == 1);

    queue.advance(2);
    DOCTEST_CHECK(queue.remaining_count() == 1);
    DOCTEST_CHECK(queue.remaining().front() == 1);
    queue.advance(5);
    DOCTEST_CHECK(queue.empty());
    DOCTEST_CHECK(queue.remaining().empty());
}

DOCTEST_TEST_CASE("square sheets give the same grid after a quarter turn") {
    SheetConstraints constraints = standard_constraints();
    constraints.max_height = constraints.width;

    AssetFootprint footprint;
    footprint.base_width = inches_to_points(4.0);
    footprint.base_height = inches_to_points(2.0);
    AssetFootprint turned = footprint;
    turned.rotated = true;

    DOCTEST_CHECK(columns_per_row(constraints, turned.oriented_width())
                  == rows_per_sheet(constraints, footprint.oriented_height()));
    DOCTEST_CHECK(rows_per_sheet(constraints, turned.oriented_height())
                  == columns_per_row(constraints, footprint.oriented_width()));
}

DOCTEST_TEST_CASE("rounded lengths cover the raw length") {
    for (double raw = 1.0; raw < 14400.0; raw += 97.3) {
        const double rounded = round_up_length(raw, 72.0, 14400.0);
        DOCTEST_CHECK(rounded >= raw);
        DOCTEST_CHECK(rounded <= 14400.0);
        DOCTEST_CHECK(rounded - raw < 72.0);
    }
}

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include "core/paginate.h"
#include "test_helpers.h"

#include <span>
#include <string>
#include <vector>

using namespace gang::core;
using gang::test::make_design;
using gang::test::standard_constraints;

DOCTEST_TEST_CASE("fifty copies fit on one sheet") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 50)};
    std::vector<Sheet> sheets;
    Error error;
    DOCTEST_REQUIRE(generate_layout(designs, standard_constraints(), false, sheets, error));
    DOCTEST_REQUIRE(sheets.size() == 1);
    DOCTEST_CHECK(sheets[0].placements.size() == 50);
    DOCTEST_CHECK(points_to_inches(sheets[0].height) == doctest::Approx(33.0));
}

DOCTEST_TEST_CASE("large orders fill full sheets before a shorter last one") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 5000)};
    std::vector<Sheet> sheets;
    std::vector<size_t> remaining_after;
    Error error;
    auto observer = [&](size_t index, const PackResult& result, size_t remaining) {
        DOCTEST_CHECK(index == remaining_after.size());
        DOCTEST_CHECK(result.mode == PackMode::Uniform);
        remaining_after.push_back(remaining);
    };
    DOCTEST_REQUIRE(generate_layout(designs, standard_constraints(), false, sheets, error, observer));

    // 4 columns by 80 rows per 200in sheet.
    DOCTEST_REQUIRE(sheets.size() == 16);
    for (size_t i = 0; i + 1 < sheets.size(); ++i) {
        DOCTEST_CHECK(sheets[i].placements.size() == 320);
        DOCTEST_CHECK(points_to_inches(sheets[i].height) == doctest::Approx(200.0));
    }
    DOCTEST_CHECK(sheets.back().placements.size() == 200);
    DOCTEST_CHECK(points_to_inches(sheets.back().height) == doctest::Approx(125.0));
    DOCTEST_CHECK(count_placements(sheets) == 5000);

    DOCTEST_REQUIRE(remaining_after.size() == 16);
    DOCTEST_CHECK(remaining_after.front() == 4680);
    DOCTEST_CHECK(remaining_after.back() == 0);
}

DOCTEST_TEST_CASE("rotation swaps the footprint of every tile") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 12)};
    std::vector<Sheet> sheets;
    Error error;
    DOCTEST_REQUIRE(generate_layout(designs, standard_constraints(), true, sheets, error));
    DOCTEST_CHECK(designs[0].footprint.rotated);
    DOCTEST_REQUIRE(sheets.size() == 1);
    for (const Placement& p : sheets[0].placements) {
        DOCTEST_CHECK(p.rotated);
        DOCTEST_CHECK(p.width == doctest::Approx(inches_to_points(2.0)));
        DOCTEST_CHECK(p.height == doctest::Approx(inches_to_points(4.0)));
        DOCTEST_CHECK(p.anchor_x == doctest::Approx(p.x + p.width));
    }
}

DOCTEST_TEST_CASE("too wide asset produces no sheets") {
    std::vector<Design> designs = {make_design("banner.png", 23.0, 2.0, 3)};
    std::vector<Sheet> sheets;
    Error error;
    DOCTEST_CHECK_FALSE(generate_layout(designs, standard_constraints(), false, sheets, error));
    DOCTEST_CHECK(error.code == ErrorCode::AssetTooWide);
    DOCTEST_CHECK(sheets.empty());
    DOCTEST_CHECK_FALSE(is_internal_error(error.code));
}

DOCTEST_TEST_CASE("every copy of every design is placed exactly once") {
    std::vector<Design> designs = {
        make_design("badge.png", 4.0, 2.0, 130),
        make_design("square.png", 3.0, 3.0, 95),
        make_design("strip.png", 10.0, 1.5, 40),
    };
    std::vector<Sheet> sheets;
    Error error;
    DOCTEST_REQUIRE(generate_layout(designs, standard_constraints(), false, sheets, error));

    std::vector<int> placed(designs.size(), 0);
    const double margin = standard_constraints().margin;
    for (const Sheet& sheet : sheets) {
        DOCTEST_CHECK_FALSE(sheet.placements.empty());
        DOCTEST_CHECK(sheet.height <= standard_constraints().max_height);
        for (const Placement& p : sheet.placements) {
            DOCTEST_REQUIRE(p.design < designs.size());
            ++placed[p.design];
            DOCTEST_CHECK(placement_within_margins(p, sheet, margin));
        }
    }
    for (size_t i = 0; i < designs.size(); ++i) {
        DOCTEST_CHECK(placed[i] == designs[i].requested_copies);
    }
}

DOCTEST_TEST_CASE("same input gives the same layout") {
    std::vector<Design> first_designs = {
        make_design("badge.png", 4.0, 2.0, 70),
        make_design("square.png", 3.0, 3.0, 33),
    };
    std::vector<Design> second_designs = first_designs;
    std::vector<Sheet> first;
    std::vector<Sheet> second;
    Error error;
    DOCTEST_REQUIRE(generate_layout(first_designs, standard_constraints(), false, first, error));
    DOCTEST_REQUIRE(generate_layout(second_designs, standard_constraints(), false, second, error));

    DOCTEST_REQUIRE(first.size() == second.size());
    for (size_t s = 0; s < first.size(); ++s) {
        DOCTEST_CHECK(first[s].height == second[s].height);
        DOCTEST_REQUIRE(first[s].placements.size() == second[s].placements.size());
        for (size_t i = 0; i < first[s].placements.size(); ++i) {
            const Placement& a = first[s].placements[i];
            const Placement& b = second[s].placements[i];
            DOCTEST_CHECK(a.design == b.design);
            DOCTEST_CHECK(a.x == b.x);
            DOCTEST_CHECK(a.y == b.y);
        }
    }
}

DOCTEST_TEST_CASE("requests without copies are rejected") {
    std::vector<Sheet> sheets;
    Error error;

    std::vector<Design> none;
    DOCTEST_CHECK_FALSE(generate_layout(none, standard_constraints(), false, sheets, error));
    DOCTEST_CHECK(error.code == ErrorCode::InvalidQuantity);

    std::vector<Design> zero = {make_design("badge.png", 4.0, 2.0, 0)};
    DOCTEST_CHECK_FALSE(generate_layout(zero, standard_constraints(), false, sheets, error));
    DOCTEST_CHECK(error.code == ErrorCode::InvalidQuantity);
}

DOCTEST_TEST_CASE("queue with an unknown design stalls") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 1)};
    CopyQueue queue;
    queue.items = {0, 7};
    std::vector<Sheet> sheets;
    Error error;
    DOCTEST_CHECK_FALSE(paginate(designs, queue, standard_constraints(), sheets, error));
    DOCTEST_CHECK(error.code == ErrorCode::PackingStalled);
    DOCTEST_CHECK(is_internal_error(error.code));
}

DOCTEST_TEST_CASE("packer that consumes nothing stalls") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 3)};
    CopyQueue queue = build_copy_queue(designs);
    int calls = 0;
    const SheetPacker idle = [&calls](const std::vector<Design>&, std::span<const size_t>, const SheetConstraints&,
                                      PackResult& out, Error&) {
        ++calls;
        out = PackResult{};
        out.has_sheet = true;
        out.consumed = 0;
        return true;
    };
    std::vector<Sheet> sheets;
    Error error;
    DOCTEST_CHECK_FALSE(paginate(designs, queue, standard_constraints(), sheets, error, {}, idle));
    DOCTEST_CHECK(error.code == ErrorCode::PackingStalled);
    DOCTEST_CHECK(error.message.find("3 copies left on sheet 1") != std::string::npos);
    DOCTEST_CHECK(calls == 1);
    DOCTEST_CHECK(queue.remaining_count() == 3);
    DOCTEST_CHECK(sheets.empty());
}

DOCTEST_TEST_CASE("packer that returns no sheet stalls after earlier progress") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 3)};
    CopyQueue queue = build_copy_queue(designs);
    const SheetPacker one_then_none = [](const std::vector<Design>& all, std::span<const size_t> remaining,
                                         const SheetConstraints& constraints, PackResult& out, Error& error) {
        if (remaining.size() < 3) {
            out = PackResult{};
            return true;
        }
        return pack_one_sheet(all, remaining.first(1), constraints, out, error);
    };
    std::vector<Sheet> sheets;
    size_t observed = 0;
    Error error;
    DOCTEST_CHECK_FALSE(paginate(designs, queue, standard_constraints(), sheets, error,
                                 [&observed](size_t, const PackResult&, size_t) { ++observed; }, one_then_none));
    DOCTEST_CHECK(error.code == ErrorCode::PackingStalled);
    DOCTEST_CHECK(error.message.find("on sheet 2") != std::string::npos);
    DOCTEST_CHECK(observed == 1);
}

DOCTEST_TEST_CASE("empty queue paginates to nothing") {
    std::vector<Design> designs = {make_design("badge.png", 4.0, 2.0, 1)};
    CopyQueue queue;
    std::vector<Sheet> sheets(1);
    Error error;
    DOCTEST_CHECK(paginate(designs, queue, standard_constraints(), sheets, error));
    DOCTEST_CHECK(sheets.empty());
}

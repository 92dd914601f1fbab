#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include "core/cli_parse.h"
#include "core/layout_parser.h"
#include "core/paginate.h"
#include "test_helpers.h"

#include <sstream>
#include <string>
#include <vector>

using namespace gang::core;
using gang::test::make_design;
using gang::test::standard_constraints;

namespace {

bool parse_text(const std::string& text, LayoutDocument& out, Error& error) {
    std::istringstream input(text);
    return parse_layout(input, out, error);
}

} // namespace

DOCTEST_TEST_CASE("generated layouts read back unchanged") {
    std::vector<Design> designs = {
        make_design("art/front logo.png", 4.0, 2.0, 9),
        make_design("back.pdf", 3.0, 3.0, 4),
    };
    designs[1].footprint.kind = AssetKind::Vector;
    std::vector<Sheet> sheets;
    Error error;
    DOCTEST_REQUIRE(generate_layout(designs, standard_constraints(), true, sheets, error));

    LayoutDocument document;
    document.designs = designs;
    document.sheets = price_sheets(sheets, default_tier_table(), PricingPolicy::FirstTierAtLeast);
    document.total_price = total_price(document.sheets);
    const std::string text = build_layout_text(document);
    DOCTEST_CHECK(text.rfind("gang 1\nasset \"art/front logo.png\" raster 288,144 copies 9 rotated\n", 0) == 0);

    LayoutDocument parsed;
    DOCTEST_REQUIRE(parse_text(text, parsed, error));
    DOCTEST_REQUIRE(parsed.designs.size() == 2);
    DOCTEST_CHECK(parsed.designs[0].name == "art/front logo.png");
    DOCTEST_CHECK(parsed.designs[1].footprint.kind == AssetKind::Vector);
    DOCTEST_REQUIRE(parsed.sheets.size() == document.sheets.size());
    DOCTEST_CHECK(parsed.total_price == doctest::Approx(document.total_price));

    const Sheet& written = document.sheets[0].sheet;
    const Sheet& reread = parsed.sheets[0].sheet;
    DOCTEST_CHECK(reread.height == doctest::Approx(written.height));
    DOCTEST_REQUIRE(reread.placements.size() == written.placements.size());
    for (size_t i = 0; i < written.placements.size(); ++i) {
        DOCTEST_CHECK(reread.placements[i].design == written.placements[i].design);
        DOCTEST_CHECK(reread.placements[i].x == doctest::Approx(written.placements[i].x));
        DOCTEST_CHECK(reread.placements[i].anchor_x == doctest::Approx(written.placements[i].anchor_x));
        DOCTEST_CHECK(reread.placements[i].row == written.placements[i].row);
        DOCTEST_CHECK(reread.placements[i].col == written.placements[i].col);
        DOCTEST_CHECK(reread.placements[i].rotated);
    }
}

DOCTEST_TEST_CASE("comments and blank lines are skipped") {
    const std::string text =
        "# made by hand\n"
        "gang 1\n"
        "\n"
        "asset \"a.png\" raster 72,36 copies 1\n"
        "sheet 1584,864 length 12 price 5.28\r\n"
        "tile 0 9,819 72,36 0,0\n";
    LayoutDocument parsed;
    Error error;
    DOCTEST_REQUIRE(parse_text(text, parsed, error));
    DOCTEST_CHECK(parsed.total_price == doctest::Approx(5.28));
    DOCTEST_REQUIRE(parsed.sheets.size() == 1);
    DOCTEST_CHECK(parsed.sheets[0].sheet.placements.size() == 1);
}

DOCTEST_TEST_CASE("broken layouts name the failing line") {
    LayoutDocument parsed;
    Error error;

    DOCTEST_CHECK_FALSE(parse_text("asset \"a.png\" raster 72,36 copies 1\n", parsed, error));
    DOCTEST_CHECK(error.code == ErrorCode::InvalidManifest);
    DOCTEST_CHECK(error.message.find("header") != std::string::npos);

    DOCTEST_CHECK_FALSE(parse_text("gang 2\n", parsed, error));
    DOCTEST_CHECK(error.message.find("version") != std::string::npos);

    DOCTEST_CHECK_FALSE(parse_text("gang 1\nasset \"a.png\" raster 72,36 copies 1\ntile 0 9,9 72,36 0,0\n",
                                   parsed, error));
    DOCTEST_CHECK(error.message.find("line 3") != std::string::npos);

    DOCTEST_CHECK_FALSE(parse_text("gang 1\nasset a.png raster 72,36 copies 1\n", parsed, error));
    DOCTEST_CHECK(error.message.find("line 2") != std::string::npos);

    DOCTEST_CHECK_FALSE(parse_text("gang 1\nbanner\n", parsed, error));
    DOCTEST_CHECK(error.message.find("Unknown line") != std::string::npos);
}

DOCTEST_TEST_CASE("tiles must match their asset and sheet") {
    LayoutDocument parsed;
    Error error;
    const std::string header = "gang 1\nasset \"a.png\" raster 72,36 copies 1\nsheet 1584,864 length 12 price 5.28\n";

    DOCTEST_CHECK_FALSE(parse_text(header + "tile 1 9,9 72,36 0,0\n", parsed, error));
    DOCTEST_CHECK(error.message.find("unknown asset") != std::string::npos);

    DOCTEST_CHECK_FALSE(parse_text(header + "tile 0 9,9 36,72 0,0\n", parsed, error));
    DOCTEST_CHECK(error.message.find("size") != std::string::npos);

    DOCTEST_CHECK(parse_text(header + "tile 0 9,9 36,72 0,0 rotated\n", parsed, error));

    DOCTEST_CHECK_FALSE(parse_text(header + "tile 0 1550,9 72,36 0,0\n", parsed, error));
    DOCTEST_CHECK(error.message.find("bounds") != std::string::npos);
}

DOCTEST_TEST_CASE("tile lines carry the rotation anchor") {
    Placement placement;
    std::string error;
    DOCTEST_REQUIRE(parse_tile_line("tile 3 9,63 144,288 2,1 rotated", placement, error));
    DOCTEST_CHECK(placement.design == 3);
    DOCTEST_CHECK(placement.rotated);
    DOCTEST_CHECK(placement.anchor_x == doctest::Approx(153.0));
    DOCTEST_CHECK(placement.anchor_y == doctest::Approx(63.0));
    DOCTEST_CHECK(placement.row == 2);
    DOCTEST_CHECK(placement.col == 1);

    DOCTEST_CHECK_FALSE(parse_tile_line("tile -1 9,63 144,288 0,0", placement, error));
    DOCTEST_CHECK_FALSE(parse_tile_line("tile 0 9;63 144,288 0,0", placement, error));
    DOCTEST_CHECK_FALSE(parse_tile_line("tile 0 9,63 144,288", placement, error));
    DOCTEST_CHECK_FALSE(parse_tile_line("tile 0 9,63 144,288 -1,0", placement, error));
}

DOCTEST_TEST_CASE("asset names with line breaks survive the layout text") {
    std::vector<Design> designs = {make_design("two\nlines \"quoted\"\\x.png", 1.0, 1.0, 1)};
    LayoutDocument document;
    document.designs = designs;
    const std::string text = build_layout_text(document);
    DOCTEST_CHECK(text.find("asset \"two\\nlines \\\"quoted\\\"\\\\x.png\" raster") != std::string::npos);

    LayoutDocument parsed;
    Error error;
    DOCTEST_REQUIRE(parse_text(text, parsed, error));
    DOCTEST_REQUIRE(parsed.designs.size() == 1);
    DOCTEST_CHECK(parsed.designs[0].name == designs[0].name);

    std::string name;
    size_t pos = 0;
    std::string quote_error;
    DOCTEST_REQUIRE(parse_quoted("\"C:\\art\\logo.png\"", pos, name, quote_error));
    DOCTEST_CHECK(name == "C:\\art\\logo.png");
}

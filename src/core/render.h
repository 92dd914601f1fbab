#pragma once

#include "asset.h"
#include "errors.h"
#include "layout.h"
#include "pdf_source.h"
#include "pricing.h"

#include <cairo.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gang::core {

constexpr size_t NUM_CHANNELS = 4;
constexpr int MAX_CHANNEL_VALUE = 255;

// Straight (not premultiplied) RGBA pixels.
struct DesignImage {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> rgba;

    bool empty() const { return rgba.empty(); }
};

// What it takes to draw one design: decoded pixels for a raster design,
// the file itself for a vector design.
struct DesignSource {
    AssetKind kind = AssetKind::Raster;
    DesignImage image;
    std::vector<unsigned char> pdf;
};

struct PreviewOptions {
    double dpi = 50.0;
    bool frame_lines = false;
    int line_width = 1;
    std::array<unsigned char, 4> line_color = {255, 0, 0, 255};
};

// Reads every design once. Relative names are resolved against base_dir
// when it is not empty.
bool load_design_sources(const std::vector<Design>& designs,
                         const std::filesystem::path& base_dir,
                         std::vector<DesignSource>& out,
                         Error& error);

// gangsheet_<width>x<length>.<ext>; repeats get _2, _3, ...
std::vector<std::string> sheet_file_names(const std::vector<SheetReport>& sheets, const std::string& extension);

// Maps design space (points, y-down, unrotated) into sheet space (points,
// y-down). This is the layout's [0 W -H 0 anchor_x anchor_y] quarter turn,
// or [W 0 0 H anchor_x anchor_y] for upright tiles, seen from cairo.
cairo_matrix_t tile_matrix(const Placement& placement, double sheet_height);

// Draws sheets onto any cairo context whose user space is sheet points,
// y-down. Raster surfaces and opened PDF pages are kept for the painter's
// lifetime, so a multi-page document embeds each design once.
class SheetPainter {
public:
    SheetPainter(const std::vector<Design>& designs, const std::vector<DesignSource>& sources);
    ~SheetPainter();
    SheetPainter(const SheetPainter&) = delete;
    SheetPainter& operator=(const SheetPainter&) = delete;

    bool paint(cairo_t* cr, const Sheet& sheet, Error& error);

private:
    bool paint_raster(cairo_t* cr, size_t design, double base_width, double base_height, Error& error);
    bool paint_vector(cairo_t* cr, size_t design, double base_width, double base_height, Error& error);

    const std::vector<Design>& designs_;
    const std::vector<DesignSource>& sources_;
    std::map<size_t, cairo_surface_t*> surfaces_;
    std::map<size_t, std::unique_ptr<PdfSource>> pages_;
};

bool render_sheet_rgba(const Sheet& sheet,
                       const std::vector<Design>& designs,
                       const std::vector<DesignSource>& sources,
                       const PreviewOptions& options,
                       DesignImage& out,
                       Error& error);

bool render_sheet_png(const Sheet& sheet,
                      const std::vector<Design>& designs,
                      const std::vector<DesignSource>& sources,
                      const PreviewOptions& options,
                      std::string& out,
                      Error& error);

} // namespace gang::core

#include "render.h"

#include "cli_parse.h"
#include "units.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace gang::core {

namespace {

constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;
constexpr int k_max_preview_side = 30000;

bool cairo_failed(cairo_status_t status, const std::string& what, Error& error) {
    if (status == CAIRO_STATUS_SUCCESS) {
        return false;
    }
    fail(error, ErrorCode::Render, what + ": " + cairo_status_to_string(status));
    return true;
}

unsigned char premultiply(unsigned char channel, unsigned char alpha) {
    return static_cast<unsigned char>((channel * alpha + MAX_CHANNEL_VALUE / 2) / MAX_CHANNEL_VALUE);
}

unsigned char unpremultiply(unsigned char channel, unsigned char alpha) {
    const int value = (channel * MAX_CHANNEL_VALUE + alpha / 2) / alpha;
    return static_cast<unsigned char>(value > MAX_CHANNEL_VALUE ? MAX_CHANNEL_VALUE : value);
}

// cairo wants native-endian premultiplied ARGB.
cairo_surface_t* create_image_surface(const DesignImage& image, Error& error) {
    cairo_surface_t* surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, image.width, image.height);
    if (cairo_failed(cairo_surface_status(surface), "cannot allocate image surface", error)) {
        cairo_surface_destroy(surface);
        return nullptr;
    }
    cairo_surface_flush(surface);
    unsigned char* data = cairo_image_surface_get_data(surface);
    const int stride = cairo_image_surface_get_stride(surface);
    for (int y = 0; y < image.height; ++y) {
        auto* row = reinterpret_cast<uint32_t*>(data + static_cast<size_t>(y) * static_cast<size_t>(stride));
        for (int x = 0; x < image.width; ++x) {
            const unsigned char* px = image.rgba.data()
                + (static_cast<size_t>(y) * static_cast<size_t>(image.width) + static_cast<size_t>(x)) * NUM_CHANNELS;
            const unsigned char a = px[CHANNEL_A];
            row[x] = (static_cast<uint32_t>(a) << 24)
                | (static_cast<uint32_t>(premultiply(px[CHANNEL_R], a)) << 16)
                | (static_cast<uint32_t>(premultiply(px[CHANNEL_G], a)) << 8)
                | static_cast<uint32_t>(premultiply(px[CHANNEL_B], a));
        }
    }
    cairo_surface_mark_dirty(surface);
    return surface;
}

void copy_surface_pixels(cairo_surface_t* surface, DesignImage& out) {
    cairo_surface_flush(surface);
    const unsigned char* data = cairo_image_surface_get_data(surface);
    const int stride = cairo_image_surface_get_stride(surface);
    out.width = cairo_image_surface_get_width(surface);
    out.height = cairo_image_surface_get_height(surface);
    out.rgba.assign(static_cast<size_t>(out.width) * static_cast<size_t>(out.height) * NUM_CHANNELS, 0);
    for (int y = 0; y < out.height; ++y) {
        const auto* row = reinterpret_cast<const uint32_t*>(data + static_cast<size_t>(y) * static_cast<size_t>(stride));
        for (int x = 0; x < out.width; ++x) {
            const uint32_t argb = row[x];
            const auto a = static_cast<unsigned char>(argb >> 24);
            if (a == 0) {
                continue;
            }
            unsigned char* px = out.rgba.data()
                + (static_cast<size_t>(y) * static_cast<size_t>(out.width) + static_cast<size_t>(x)) * NUM_CHANNELS;
            px[CHANNEL_R] = unpremultiply(static_cast<unsigned char>(argb >> 16), a);
            px[CHANNEL_G] = unpremultiply(static_cast<unsigned char>(argb >> 8), a);
            px[CHANNEL_B] = unpremultiply(static_cast<unsigned char>(argb), a);
            px[CHANNEL_A] = a;
        }
    }
}

// Strokes stay inside their tile.
void outline_tiles(cairo_t* cr, const Sheet& sheet, double line_width, const std::array<unsigned char, 4>& color) {
    if (!(line_width > 0.0)) {
        return;
    }
    cairo_save(cr);
    cairo_set_source_rgba(cr, color[0] / 255.0, color[1] / 255.0, color[2] / 255.0, color[3] / 255.0);
    cairo_set_line_width(cr, line_width);
    for (const Placement& p : sheet.placements) {
        if (p.width <= line_width || p.height <= line_width) {
            continue;
        }
        cairo_rectangle(cr, p.x + line_width / 2.0, sheet.height - p.y - p.height + line_width / 2.0,
                        p.width - line_width, p.height - line_width);
        cairo_stroke(cr);
    }
    cairo_restore(cr);
}

} // namespace

bool load_design_sources(const std::vector<Design>& designs,
                         const fs::path& base_dir,
                         std::vector<DesignSource>& out,
                         Error& error) {
    std::vector<DesignSource> sources(designs.size());
    for (size_t i = 0; i < designs.size(); ++i) {
        fs::path path(designs[i].name);
        if (path.is_relative() && !base_dir.empty()) {
            path = base_dir / path;
        }
        std::vector<unsigned char> bytes;
        if (!read_file_bytes(path, bytes, error)) {
            return false;
        }

        DesignSource& source = sources[i];
        source.kind = designs[i].footprint.kind;
        if (source.kind == AssetKind::Vector) {
            PdfSource page;
            if (!page.open(bytes.data(), bytes.size(), error)) {
                error.message = path.string() + ": " + error.message;
                return false;
            }
            source.pdf = std::move(bytes);
            continue;
        }

        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return fail(error, ErrorCode::Io, "image is too large: " + path.string());
        }
        int w = 0;
        int h = 0;
        int channels = 0;
        unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                    &w, &h, &channels, static_cast<int>(NUM_CHANNELS));
        if (!data) {
            return fail(error, ErrorCode::Io, "Failed to load: " + path.string());
        }
        source.image.width = w;
        source.image.height = h;
        source.image.rgba.assign(data, data + static_cast<size_t>(w) * static_cast<size_t>(h) * NUM_CHANNELS);
        stbi_image_free(data);
    }
    out = std::move(sources);
    return true;
}

std::vector<std::string> sheet_file_names(const std::vector<SheetReport>& sheets, const std::string& extension) {
    std::vector<std::string> names;
    names.reserve(sheets.size());
    std::map<std::string, int> seen;
    for (const SheetReport& report : sheets) {
        const std::string stem = "gangsheet_" + format_number(std::round(points_to_inches(report.sheet.width) * 100.0) / 100.0)
            + "x" + format_number(std::round(report.length_inches * 100.0) / 100.0);
        const int count = ++seen[stem];
        if (count == 1) {
            names.push_back(stem + "." + extension);
        } else {
            names.push_back(stem + "_" + std::to_string(count) + "." + extension);
        }
    }
    return names;
}

cairo_matrix_t tile_matrix(const Placement& placement, double sheet_height) {
    cairo_matrix_t matrix;
    if (placement.rotated) {
        // The design's top edge runs up the tile's left side.
        cairo_matrix_init(&matrix, 0.0, -1.0, 1.0, 0.0,
                          placement.anchor_x - placement.width, sheet_height - placement.anchor_y);
    } else {
        cairo_matrix_init(&matrix, 1.0, 0.0, 0.0, 1.0,
                          placement.anchor_x, sheet_height - placement.anchor_y - placement.height);
    }
    return matrix;
}

SheetPainter::SheetPainter(const std::vector<Design>& designs, const std::vector<DesignSource>& sources)
    : designs_(designs), sources_(sources) {}

SheetPainter::~SheetPainter() {
    for (auto& [design, surface] : surfaces_) {
        cairo_surface_destroy(surface);
    }
}

bool SheetPainter::paint(cairo_t* cr, const Sheet& sheet, Error& error) {
    for (const Placement& p : sheet.placements) {
        if (p.design >= designs_.size() || p.design >= sources_.size()) {
            return fail(error, ErrorCode::Render, "tile refers to an unknown design");
        }
        const double base_width = p.rotated ? p.height : p.width;
        const double base_height = p.rotated ? p.width : p.height;

        cairo_save(cr);
        const cairo_matrix_t matrix = tile_matrix(p, sheet.height);
        cairo_transform(cr, &matrix);
        cairo_rectangle(cr, 0.0, 0.0, base_width, base_height);
        cairo_clip(cr);
        const bool painted = sources_[p.design].kind == AssetKind::Vector
            ? paint_vector(cr, p.design, base_width, base_height, error)
            : paint_raster(cr, p.design, base_width, base_height, error);
        cairo_restore(cr);
        if (!painted) {
            return false;
        }
    }
    return !cairo_failed(cairo_status(cr), "cannot draw sheet", error);
}

bool SheetPainter::paint_raster(cairo_t* cr, size_t design, double base_width, double base_height, Error& error) {
    const DesignImage& image = sources_[design].image;
    if (image.empty()) {
        return fail(error, ErrorCode::Render, "no pixels loaded for '" + designs_[design].name + "'");
    }
    auto it = surfaces_.find(design);
    if (it == surfaces_.end()) {
        cairo_surface_t* surface = create_image_surface(image, error);
        if (!surface) {
            return false;
        }
        it = surfaces_.emplace(design, surface).first;
    }
    cairo_scale(cr, base_width / image.width, base_height / image.height);
    cairo_set_source_surface(cr, it->second, 0.0, 0.0);
    cairo_pattern_set_filter(cairo_get_source(cr), CAIRO_FILTER_NEAREST);
    cairo_paint(cr);
    return true;
}

bool SheetPainter::paint_vector(cairo_t* cr, size_t design, double base_width, double base_height, Error& error) {
    auto it = pages_.find(design);
    if (it == pages_.end()) {
        const std::vector<unsigned char>& bytes = sources_[design].pdf;
        auto page = std::make_unique<PdfSource>();
        if (!page->open(bytes.data(), bytes.size(), error)) {
            error = Error{ErrorCode::Render, designs_[design].name + ": " + error.message};
            return false;
        }
        it = pages_.emplace(design, std::move(page)).first;
    }
    double page_width = 0.0;
    double page_height = 0.0;
    it->second->page_size(page_width, page_height);
    if (!(page_width > 0.0) || !(page_height > 0.0)) {
        return fail(error, ErrorCode::Render, "'" + designs_[design].name + "' has an empty page");
    }
    cairo_scale(cr, base_width / page_width, base_height / page_height);
    it->second->render(cr);
    return true;
}

bool render_sheet_rgba(const Sheet& sheet,
                       const std::vector<Design>& designs,
                       const std::vector<DesignSource>& sources,
                       const PreviewOptions& options,
                       DesignImage& out,
                       Error& error) {
    if (!(options.dpi > 0.0)) {
        return fail(error, ErrorCode::InvalidConstraint, "preview resolution must be positive");
    }
    const double scale = options.dpi / k_points_per_inch;
    const double width_px = std::ceil(sheet.width * scale - 1e-9);
    const double height_px = std::ceil(sheet.height * scale - 1e-9);
    if (width_px < 1.0 || height_px < 1.0 || width_px > k_max_preview_side || height_px > k_max_preview_side) {
        return fail(error, ErrorCode::Render, "preview size is out of range; lower the preview dpi");
    }

    cairo_surface_t* surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, static_cast<int>(width_px),
                                                          static_cast<int>(height_px));
    if (cairo_failed(cairo_surface_status(surface), "Sheet preview is too large", error)) {
        cairo_surface_destroy(surface);
        return false;
    }
    cairo_t* cr = cairo_create(surface);
    cairo_scale(cr, scale, scale);

    bool ok = false;
    {
        SheetPainter painter(designs, sources);
        ok = painter.paint(cr, sheet, error);
    }
    if (ok && options.frame_lines) {
        outline_tiles(cr, sheet, options.line_width / scale, options.line_color);
        ok = !cairo_failed(cairo_status(cr), "cannot draw frame lines", error);
    }
    cairo_destroy(cr);

    if (ok) {
        DesignImage canvas;
        copy_surface_pixels(surface, canvas);
        out = std::move(canvas);
    }
    cairo_surface_destroy(surface);
    return ok;
}

bool render_sheet_png(const Sheet& sheet,
                      const std::vector<Design>& designs,
                      const std::vector<DesignSource>& sources,
                      const PreviewOptions& options,
                      std::string& out,
                      Error& error) {
    DesignImage canvas;
    if (!render_sheet_rgba(sheet, designs, sources, options, canvas, error)) {
        return false;
    }

    std::string png;
    auto write_callback = [](void* context, void* data, int size) {
        auto* buffer = static_cast<std::string*>(context);
        buffer->append(static_cast<const char*>(data), static_cast<size_t>(size));
    };
    if (stbi_write_png_to_func(write_callback, &png,
                               canvas.width, canvas.height, static_cast<int>(NUM_CHANNELS),
                               canvas.rgba.data(), canvas.width * static_cast<int>(NUM_CHANNELS)) == 0) {
        return fail(error, ErrorCode::Render, "Failed to write PNG");
    }
    out = std::move(png);
    return true;
}

} // namespace gang::core

#pragma once

#include "errors.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace gang::core {

enum class AssetKind { Vector, Raster };

struct AssetFootprint {
    AssetKind kind = AssetKind::Raster;
    double base_width = 0.0;
    double base_height = 0.0;
    bool rotated = false;

    double oriented_width() const { return rotated ? base_height : base_width; }
    double oriented_height() const { return rotated ? base_width : base_height; }

    // Same oriented rectangle, regardless of kind.
    bool same_shape(const AssetFootprint& other) const;
};

const char* asset_kind_name(AssetKind kind);
bool parse_asset_kind(const std::string& value, AssetKind& out);

// Content sniffing; extensions are not trusted.
bool detect_asset_kind(const unsigned char* data, size_t size, AssetKind& out);

// Size of the single page of a PDF in points: its crop box (the media box
// when absent, inherited through the page tree), turned by /Rotate.
bool read_pdf_page_size(const unsigned char* data, size_t size,
                        double& width, double& height, Error& error);

bool resolve_asset(const std::vector<unsigned char>& bytes,
                   bool rotate,
                   double dpi,
                   AssetFootprint& out,
                   Error& error);

bool read_file_bytes(const std::filesystem::path& path, std::vector<unsigned char>& out, Error& error);

bool resolve_asset_file(const std::filesystem::path& path,
                        bool rotate,
                        double dpi,
                        AssetFootprint& out,
                        Error& error);

} // namespace gang::core

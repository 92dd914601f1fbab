#include "asset.h"

#include "pdf_source.h"
#include "units.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>
#include <utility>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace fs = std::filesystem;

namespace gang::core {

namespace {

constexpr size_t k_pdf_header_search_limit = 1024;
constexpr uintmax_t k_max_asset_file_size = 1000000000; // 1GB

} // namespace

bool AssetFootprint::same_shape(const AssetFootprint& other) const {
    return std::abs(oriented_width() - other.oriented_width()) <= k_geometry_epsilon
        && std::abs(oriented_height() - other.oriented_height()) <= k_geometry_epsilon;
}

const char* asset_kind_name(AssetKind kind) {
    return kind == AssetKind::Vector ? "vector" : "raster";
}

bool parse_asset_kind(const std::string& value, AssetKind& out) {
    if (value == "vector") {
        out = AssetKind::Vector;
        return true;
    }
    if (value == "raster") {
        out = AssetKind::Raster;
        return true;
    }
    return false;
}

bool detect_asset_kind(const unsigned char* data, size_t size, AssetKind& out) {
    if (data == nullptr || size == 0) {
        return false;
    }
    std::string_view head(reinterpret_cast<const char*>(data), std::min(size, k_pdf_header_search_limit));
    if (head.find("%PDF-") != std::string_view::npos) {
        out = AssetKind::Vector;
        return true;
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    int w = 0;
    int h = 0;
    int channels = 0;
    if (stbi_info_from_memory(data, static_cast<int>(size), &w, &h, &channels) != 0) {
        out = AssetKind::Raster;
        return true;
    }
    return false;
}

bool read_pdf_page_size(const unsigned char* data, size_t size,
                        double& width, double& height, Error& error) {
    PdfSource source;
    if (!source.open(data, size, error)) {
        return false;
    }
    const int pages = source.page_count();
    if (pages != 1) {
        return fail(error, ErrorCode::UnsupportedAssetKind,
                    "vector asset has " + std::to_string(pages) + " pages, expected one");
    }
    source.page_size(width, height);
    return true;
}

bool resolve_asset(const std::vector<unsigned char>& bytes,
                   bool rotate,
                   double dpi,
                   AssetFootprint& out,
                   Error& error) {
    AssetKind kind = AssetKind::Raster;
    if (!detect_asset_kind(bytes.data(), bytes.size(), kind)) {
        return fail(error, ErrorCode::UnsupportedAssetKind,
                    "asset is neither a PDF page nor a supported raster image");
    }

    AssetFootprint footprint;
    footprint.kind = kind;
    footprint.rotated = rotate;

    if (kind == AssetKind::Vector) {
        if (!read_pdf_page_size(bytes.data(), bytes.size(), footprint.base_width, footprint.base_height, error)) {
            return false;
        }
    } else {
        if (!(dpi > 0.0)) {
            return fail(error, ErrorCode::InvalidConstraint, "raster resolution must be positive");
        }
        int w = 0;
        int h = 0;
        int channels = 0;
        if (stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()), &w, &h, &channels) == 0) {
            return fail(error, ErrorCode::UnsupportedAssetKind,
                        std::string("unreadable raster header: ") + stbi_failure_reason());
        }
        footprint.base_width = pixels_to_points(static_cast<double>(w), dpi);
        footprint.base_height = pixels_to_points(static_cast<double>(h), dpi);
    }

    if (!(footprint.base_width > 0.0) || !(footprint.base_height > 0.0)) {
        return fail(error, ErrorCode::DegenerateAsset, "asset has a zero or negative dimension");
    }

    out = footprint;
    return true;
}

bool read_file_bytes(const fs::path& path, std::vector<unsigned char>& out, Error& error) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return fail(error, ErrorCode::Io, "not a readable file: " + path.string());
    }
    const uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return fail(error, ErrorCode::Io, "failed to stat '" + path.string() + "': " + ec.message());
    }
    if (size > k_max_asset_file_size) {
        return fail(error, ErrorCode::Io, "file is too large: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return fail(error, ErrorCode::Io, "failed to open '" + path.string() + "'");
    }
    std::vector<unsigned char> bytes(static_cast<size_t>(size));
    if (size > 0 && !input.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size))) {
        return fail(error, ErrorCode::Io, "failed to read '" + path.string() + "'");
    }
    out = std::move(bytes);
    return true;
}

bool resolve_asset_file(const fs::path& path,
                        bool rotate,
                        double dpi,
                        AssetFootprint& out,
                        Error& error) {
    std::vector<unsigned char> bytes;
    if (!read_file_bytes(path, bytes, error)) {
        return false;
    }
    if (!resolve_asset(bytes, rotate, dpi, out, error)) {
        error.message = path.string() + ": " + error.message;
        return false;
    }
    return true;
}

} // namespace gang::core

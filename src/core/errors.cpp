#include "errors.h"

#include <utility>

namespace gang::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "none";
    case ErrorCode::DegenerateAsset:
        return "degenerate asset";
    case ErrorCode::UnsupportedAssetKind:
        return "unsupported asset kind";
    case ErrorCode::AssetTooWide:
        return "asset too wide";
    case ErrorCode::AssetTooTall:
        return "asset too tall";
    case ErrorCode::PackingStalled:
        return "packing stalled";
    case ErrorCode::InvalidQuantity:
        return "invalid quantity";
    case ErrorCode::InvalidConstraint:
        return "invalid constraint";
    case ErrorCode::InvalidManifest:
        return "invalid manifest";
    case ErrorCode::Io:
        return "i/o error";
    case ErrorCode::Render:
        return "render error";
    }
    return "unknown";
}

bool is_internal_error(ErrorCode code) {
    return code == ErrorCode::PackingStalled || code == ErrorCode::Render;
}

bool fail(Error& error, ErrorCode code, std::string message) {
    error.code = code;
    error.message = std::move(message);
    return false;
}

} // namespace gang::core

#pragma once

#include <string>

namespace gang::core {

enum class ErrorCode {
    None,
    DegenerateAsset,
    UnsupportedAssetKind,
    AssetTooWide,
    AssetTooTall,
    PackingStalled,
    InvalidQuantity,
    InvalidConstraint,
    InvalidManifest,
    Io,
    Render,
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;
};

const char* error_code_name(ErrorCode code);

// Internal errors are bugs or rendering failures, not bad input.
bool is_internal_error(ErrorCode code);

// Fills `error` and returns false so call sites can `return fail(...)`.
bool fail(Error& error, ErrorCode code, std::string message);

} // namespace gang::core

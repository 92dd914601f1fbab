#pragma once

#include "errors.h"

#include <cairo.h>
#include <poppler.h>

#include <cstddef>

namespace gang::core {

// First page of an in-memory PDF opened through poppler. Every instance owns
// its own document; poppler documents must not be shared between threads.
class PdfSource {
public:
    PdfSource() = default;
    ~PdfSource();
    PdfSource(const PdfSource&) = delete;
    PdfSource& operator=(const PdfSource&) = delete;

    // Copies the bytes; fails with UnsupportedAssetKind if poppler cannot
    // read a page from them.
    bool open(const unsigned char* data, size_t size, Error& error);

    int page_count() const;

    // Crop box of the first page in points, after its /Rotate.
    void page_size(double& width, double& height) const;

    // Draws the first page with its top-left corner at the user-space
    // origin, one unit per point, y growing downward.
    void render(cairo_t* cr) const;

private:
    void close();

    PopplerDocument* document_ = nullptr;
    PopplerPage* page_ = nullptr;
};

} // namespace gang::core

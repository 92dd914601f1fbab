#pragma once

#include "errors.h"
#include "layout.h"
#include "render.h"

#include <string>
#include <vector>

namespace gang::core {

struct PdfOptions {
    std::string creator = "gangpack";
};

// One page per sheet, drawn through cairo's PDF surface. Raster designs
// become one shared image each; vector designs are drawn from their own PDF
// page by poppler and stay vector.
bool write_pdf_document(const std::vector<const Sheet*>& sheets,
                        const std::vector<Design>& designs,
                        const std::vector<DesignSource>& sources,
                        const PdfOptions& options,
                        std::string& out,
                        Error& error);

} // namespace gang::core

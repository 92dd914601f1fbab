#include "pdf_writer.h"

#include <cairo-pdf.h>

#include <utility>

namespace gang::core {

namespace {

cairo_status_t append_to_string(void* closure, const unsigned char* data, unsigned int length) {
    static_cast<std::string*>(closure)->append(reinterpret_cast<const char*>(data), length);
    return CAIRO_STATUS_SUCCESS;
}

} // namespace

bool write_pdf_document(const std::vector<const Sheet*>& sheets,
                        const std::vector<Design>& designs,
                        const std::vector<DesignSource>& sources,
                        const PdfOptions& options,
                        std::string& out,
                        Error& error) {
    if (sheets.empty()) {
        return fail(error, ErrorCode::Render, "no sheets to write");
    }

    std::string pdf;
    cairo_surface_t* surface = cairo_pdf_surface_create_for_stream(append_to_string, &pdf,
                                                                   sheets.front()->width, sheets.front()->height);
    cairo_status_t status = cairo_surface_status(surface);
    if (status != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surface);
        return fail(error, ErrorCode::Render, std::string("cannot start PDF: ") + cairo_status_to_string(status));
    }
    cairo_pdf_surface_set_metadata(surface, CAIRO_PDF_METADATA_CREATOR, options.creator.c_str());

    cairo_t* cr = cairo_create(surface);
    bool ok = true;
    {
        SheetPainter painter(designs, sources);
        for (const Sheet* sheet : sheets) {
            // Takes effect for the page about to be drawn.
            cairo_pdf_surface_set_size(surface, sheet->width, sheet->height);
            if (!painter.paint(cr, *sheet, error)) {
                ok = false;
                break;
            }
            cairo_show_page(cr);
        }
        cairo_destroy(cr);
        cairo_surface_finish(surface);
    }
    status = cairo_surface_status(surface);
    cairo_surface_destroy(surface);
    if (!ok) {
        return false;
    }
    if (status != CAIRO_STATUS_SUCCESS) {
        return fail(error, ErrorCode::Render, std::string("cannot write PDF: ") + cairo_status_to_string(status));
    }
    out = std::move(pdf);
    return true;
}

} // namespace gang::core

#include "pdf_source.h"

#include <string>

namespace gang::core {

PdfSource::~PdfSource() {
    close();
}

void PdfSource::close() {
    if (page_) {
        g_object_unref(page_);
        page_ = nullptr;
    }
    if (document_) {
        g_object_unref(document_);
        document_ = nullptr;
    }
}

bool PdfSource::open(const unsigned char* data, size_t size, Error& error) {
    close();
    if (data == nullptr || size == 0) {
        return fail(error, ErrorCode::UnsupportedAssetKind, "empty PDF");
    }

    // The document keeps its own reference to the bytes.
    GBytes* bytes = g_bytes_new(data, size);
    GError* poppler_error = nullptr;
    document_ = poppler_document_new_from_bytes(bytes, nullptr, &poppler_error);
    g_bytes_unref(bytes);
    if (!document_) {
        std::string message = poppler_error ? poppler_error->message : "unknown error";
        if (poppler_error) {
            g_error_free(poppler_error);
        }
        return fail(error, ErrorCode::UnsupportedAssetKind, "unreadable PDF: " + message);
    }

    if (poppler_document_get_n_pages(document_) < 1) {
        close();
        return fail(error, ErrorCode::UnsupportedAssetKind, "PDF has no pages");
    }
    page_ = poppler_document_get_page(document_, 0);
    if (!page_) {
        close();
        return fail(error, ErrorCode::UnsupportedAssetKind, "PDF page cannot be read");
    }
    return true;
}

int PdfSource::page_count() const {
    return document_ ? poppler_document_get_n_pages(document_) : 0;
}

void PdfSource::page_size(double& width, double& height) const {
    width = 0.0;
    height = 0.0;
    if (page_) {
        poppler_page_get_size(page_, &width, &height);
    }
}

void PdfSource::render(cairo_t* cr) const {
    if (page_) {
        poppler_page_render_for_printing(page_, cr);
    }
}

} // namespace gang::core

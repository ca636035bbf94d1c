#ifndef OCRLAYER_PDF_H
#define OCRLAYER_PDF_H

#include "ocrlayer_types.h"

#include <fpdfview.h>
#include <cpp/fpdf_scopers.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/*
 * pdfium-facing half of the engine. pdfium is not thread-safe: everything
 * declared here must run on one thread, after ocrlayer_pdf_init().
 */

/* Throws LayerError(MalformedInput) when the bytes do not parse. */
ScopedFPDFDocument open_document(const void* buf, size_t len, const char* password);

/* Serializes the whole document once. Throws std::runtime_error. */
std::vector<uint8_t> save_document(FPDF_DOCUMENT doc, bool incremental);

/* Reads geometry of one page. Throws LayerError(UnsupportedPageStructure). */
Page read_page(FPDF_DOCUMENT doc, int index);

/*
 * Page Content Merger. Appends the layer as a new content section of the
 * page, leaving existing streams and resources untouched. Returns the
 * number of text objects written. Throws LayerError(UnsupportedPageStructure)
 * with the page left as it was.
 */
int merge_layer(FPDF_DOCUMENT doc, const Page& page, const InvisibleLayer& layer);

/* ── text extraction (searchability check) ─────────────────────────── */

struct TextRun {
    int         page_index;
    double      left, bottom, right, top;   /* user space */
    double      font_size;
    std::string text;                       /* UTF-8 */
};

/* Groups extracted characters into runs. Returns false for a bad PDF. */
bool extract_text_runs(const void* buf, size_t len, const char* password,
                       std::vector<TextRun>& out);

#endif

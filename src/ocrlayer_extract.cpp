#include "ocrlayer_pdf.h"

#include <fpdf_text.h>

#include <algorithm>
#include <string>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static void append_codepoint(std::string& s, unsigned int cp) {
    if (cp < 0x80) {
        s += static_cast<char>(cp);
    } else if (cp < 0x800) {
        s += static_cast<char>(0xC0 | (cp >> 6));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        s += static_cast<char>(0xE0 | (cp >> 12));
        s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        s += static_cast<char>(0xF0 | (cp >> 18));
        s += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static bool is_space(unsigned int cp) {
    return cp == ' ' || cp == '\t' || cp == '\r' || cp == '\n';
}

struct CharInfo {
    double font_size;
    double left, bottom, right, top;
    unsigned int codepoint;
    bool after_break;   /* whitespace or generated char before this one */
};

/*
 * Boxes touch or nearly touch. Checked on both axes so that text turned
 * by a page rotation groups the same way as horizontal text.
 */
static bool adjacent(const CharInfo& prev, const CharInfo& cur) {
    double dx = std::max(0.0, std::max(cur.left - prev.right, prev.left - cur.right));
    double dy = std::max(0.0, std::max(cur.bottom - prev.top, prev.bottom - cur.top));
    double limit = prev.font_size * 0.35;
    return dx < limit && dy < limit;
}

/* ── extract one page ───────────────────────────────────────────────── */

static void extract_page(FPDF_DOCUMENT doc, int pi, std::vector<TextRun>& out) {
    ScopedFPDFPage page(FPDF_LoadPage(doc, pi));
    if (!page) return;
    ScopedFPDFTextPage text_page(FPDFText_LoadPage(page.get()));
    if (!text_page) return;

    int char_count = FPDFText_CountChars(text_page.get());
    std::vector<CharInfo> chars;
    chars.reserve(char_count);

    bool pending_break = false;
    for (int ci = 0; ci < char_count; ++ci) {
        unsigned int cp = FPDFText_GetUnicode(text_page.get(), ci);
        /* nothing that cannot be written as UTF-8 */
        if (cp == 0 || cp == 0xFFFE || cp == 0xFFFF || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF))
            continue;
        if (is_space(cp) || FPDFText_IsGenerated(text_page.get(), ci) == 1) {
            pending_break = true;
            continue;
        }

        double left, right, bottom, top;
        if (!FPDFText_GetCharBox(text_page.get(), ci, &left, &right, &bottom, &top)) continue;

        double font_size = FPDFText_GetFontSize(text_page.get(), ci);
        chars.push_back({font_size, left, bottom, right, top, cp, pending_break});
        pending_break = false;
    }

    for (size_t i = 0; i < chars.size(); ) {
        const CharInfo& first = chars[i];
        TextRun run{pi, first.left, first.bottom, first.right, first.top, first.font_size, {}};
        append_codepoint(run.text, first.codepoint);

        size_t j = i + 1;
        while (j < chars.size()) {
            const CharInfo& cur = chars[j];
            if (cur.after_break || !adjacent(chars[j - 1], cur)) break;
            append_codepoint(run.text, cur.codepoint);
            run.left   = std::min(run.left, cur.left);
            run.bottom = std::min(run.bottom, cur.bottom);
            run.right  = std::max(run.right, cur.right);
            run.top    = std::max(run.top, cur.top);
            ++j;
        }

        out.push_back(std::move(run));
        i = j;
    }
}

/* ── public API ─────────────────────────────────────────────────────── */

bool extract_text_runs(const void* buf, size_t len, const char* password,
                       std::vector<TextRun>& out) {
    ScopedFPDFDocument doc(FPDF_LoadMemDocument(buf, static_cast<int>(len), password));
    if (!doc) return false;

    int page_count = FPDF_GetPageCount(doc.get());
    for (int pi = 0; pi < page_count; ++pi)
        extract_page(doc.get(), pi, out);
    return true;
}

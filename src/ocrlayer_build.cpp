#include "ocrlayer_types.h"

#include <string>

/* ── UTF-8 / UTF-16 ─────────────────────────────────────────────────── */

static LayerError bad_utf8(size_t offset) {
    return LayerError(ErrorKind::LayerConstructionFailed,
                      "invalid UTF-8 at byte " + std::to_string(offset));
}

std::u32string utf8_to_codepoints(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        char32_t cp, min_cp;
        size_t extra;
        if (c < 0x80)                { cp = c;        extra = 0; min_cp = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; min_cp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; min_cp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; min_cp = 0x10000; }
        else throw bad_utf8(i);

        if (i + extra >= text.size()) throw bad_utf8(i);
        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) throw bad_utf8(i + k);
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            throw bad_utf8(i);
        out += cp;
        i += extra + 1;
    }
    return out;
}

std::u16string utf8_to_utf16(const std::string& text) {
    std::u16string out;
    for (char32_t cp : utf8_to_codepoints(text)) {
        if (cp < 0x10000) {
            out += static_cast<char16_t>(cp);
        } else {
            cp -= 0x10000;
            out += static_cast<char16_t>(0xD800 | (cp >> 10));
            out += static_cast<char16_t>(0xDC00 | (cp & 0x3FF));
        }
    }
    return out;
}

/* ── build ──────────────────────────────────────────────────────────── */

InvisibleLayer build_layer(int page_index, const std::vector<MappedWord>& words) {
    InvisibleLayer layer;
    layer.page_index = page_index;
    layer.base_font  = kLayerFont;
    layer.placements.reserve(words.size());

    /* OCR order is kept as is; it is the copy order in viewers */
    for (const MappedWord& w : words) {
        if (w.text.empty() || !(w.width > 0) || !(w.height > 0) ||
            !(w.font_size > 0) || !(w.horizontal_scale > 0))
            continue;

        TextPlacement p;
        p.origin           = w.origin;
        p.font_size        = w.font_size;
        p.horizontal_scale = w.horizontal_scale;
        p.rotation         = w.rotation;
        p.render_mode      = kRenderModeInvisible;
        p.text             = w.text;
        p.utf16            = utf8_to_utf16(w.text);
        /* tabs and line breaks have no Helvetica glyph; show them as spaces */
        for (char16_t& ch : p.utf16)
            if (ch >= 0x09 && ch <= 0x0D) ch = u' ';
        layer.placements.push_back(std::move(p));
    }
    return layer;
}

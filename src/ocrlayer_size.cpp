#include "ocrlayer_types.h"

#include <algorithm>
#include <cstdio>
#include <string>

/* ── Helvetica advance widths (AFM, 1/1000 em) ─────────────────────── */

/* U+0020 .. U+007E */
static const unsigned short kAscii[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584,
};

/* U+00A0 .. U+00FF */
static const unsigned short kLatin1[96] = {
    278, 333, 556, 556, 556, 556, 260, 556, 333, 737, 370, 556, 584, 333, 737, 333,
    400, 584, 333, 333, 333, 556, 537, 278, 333, 333, 365, 556, 834, 834, 834, 611,
    667, 667, 667, 667, 667, 667, 1000, 722, 667, 667, 667, 667, 278, 278, 278, 278,
    722, 722, 778, 778, 778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611,
    556, 556, 556, 556, 556, 556, 889, 500, 556, 556, 556, 556, 278, 278, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 584, 611, 556, 556, 556, 556, 500, 556, 500,
};

/* WinAnsi 0x80..0x9F, by Unicode code point */
struct ExtraWidth { char32_t cp; unsigned short width; };
static const ExtraWidth kWinAnsiExtra[] = {
    {0x0152, 1000}, {0x0153, 944}, {0x0160, 667}, {0x0161, 500}, {0x0178, 667},
    {0x017D, 611},  {0x017E, 500}, {0x0192, 556}, {0x02C6, 333}, {0x02DC, 333},
    {0x2013, 556},  {0x2014, 1000}, {0x2018, 222}, {0x2019, 222}, {0x201A, 222},
    {0x201C, 333},  {0x201D, 333}, {0x201E, 333}, {0x2020, 556}, {0x2021, 556},
    {0x2022, 350},  {0x2026, 1000}, {0x2030, 1000}, {0x2039, 333}, {0x203A, 333},
    {0x20AC, 556},  {0x2122, 1000},
};

static int advance_width(char32_t cp) {
    if (cp >= 0x09 && cp <= 0x0D) return kAscii[0];   /* ASCII whitespace as space */
    if (cp >= 0x20 && cp <= 0x7E) return kAscii[cp - 0x20];
    if (cp >= 0xA0 && cp <= 0xFF) return kLatin1[cp - 0xA0];
    for (const auto& e : kWinAnsiExtra)
        if (e.cp == cp) return e.width;
    return -1;
}

/* ── public API ─────────────────────────────────────────────────────── */

double natural_width(const std::string& text, double font_size) {
    long units = 0;
    for (char32_t cp : utf8_to_codepoints(text)) {
        int w = advance_width(cp);
        if (w < 0) {
            char buf[64];
            snprintf(buf, sizeof(buf), "no %s metrics for U+%04X",
                     kLayerFont, static_cast<unsigned>(cp));
            throw LayerError(ErrorKind::LayerConstructionFailed, buf);
        }
        units += w;
    }
    return units * font_size / 1000.0;
}

static bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<GlyphSize> estimate_size(const MappedWord& word, const std::string& text,
                                       const LayerConfig& config) {
    if (blank(text) || !(word.width > 0) || !(word.height > 0))
        return std::nullopt;

    double font_size = std::clamp(word.height * config.calibration,
                                  config.min_font_size, config.max_font_size);

    double natural = natural_width(text, font_size);
    double scale = natural > 0 ? word.width / natural : 1.0;
    scale = std::max(scale, config.min_horizontal_scale);

    return GlyphSize{font_size, scale};
}

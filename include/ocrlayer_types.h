#ifndef OCRLAYER_TYPES_H
#define OCRLAYER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/* ── error taxonomy ────────────────────────────────────────────── */

enum class ErrorKind {
    InvalidPageMetadata,
    UnsupportedPageStructure,
    EmptyDocument,
    MalformedInput,
    LayerConstructionFailed,
};

const char* error_kind_name(ErrorKind kind);

class LayerError : public std::runtime_error {
public:
    LayerError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/* ── configuration (immutable per run) ─────────────────────────── */

struct LayerConfig {
    double   calibration          = 0.85;  /* font size = box height * k */
    double   min_font_size        = 1.0;
    double   max_font_size        = 72.0;
    double   min_horizontal_scale = 0.01;
    bool     strict               = false; /* unsupported page fails the document */
    bool     use_image_area       = false; /* map onto the scan's placement rect */
    bool     incremental_save     = false;
    unsigned workers              = 0;     /* 0 = hardware concurrency */
};

/* Throws std::invalid_argument on bad values or malformed JSON. */
LayerConfig config_from_json(const std::string& text);
void        validate_config(const LayerConfig& config);

/* ── geometry ──────────────────────────────────────────────────── */

struct Point {
    double x, y;
};

struct Rect {
    double left, bottom, right, top;   /* PDF user space */

    double width()  const { return right - left; }
    double height() const { return top - bottom; }
};

/* ── OCR input (read-only to the core) ─────────────────────────── */

struct PixelBox {
    double x, y, width, height;        /* origin top-left, y grows down */
};

struct RecognizedWord {
    std::string text;                  /* UTF-8 */
    PixelBox    box;
    int         page_index;            /* 0-based */
};

struct PageImageMeta {
    double pixel_width;
    double pixel_height;
};

struct PageWords {
    PageImageMeta               meta;
    std::vector<RecognizedWord> words;
};

/* keyed by 0-based page index; absent pages pass through unchanged */
using PerPageWords = std::map<int, PageWords>;

/* Parses the word data document; throws std::invalid_argument. */
PerPageWords words_from_json(const std::string& text);

/* ── document pages ────────────────────────────────────────────── */

struct Page {
    int                 index;         /* 0-based */
    Rect                box;           /* visible box, unrotated user space */
    int                 rotation;      /* 0, 90, 180, 270 (clockwise on display) */
    std::optional<Rect> image_area;    /* first placed image, if any */
    bool                has_layer;     /* already carries OCRLayer objects */

    double width()  const { return box.width(); }
    double height() const { return box.height(); }
};

/* ── mapped / sized words ──────────────────────────────────────── */

struct MappedWord {
    std::string text;
    Point       origin;                /* lower-left of the box as displayed */
    double      width;                 /* along the text direction */
    double      height;                /* across it */
    int         rotation;              /* text direction, degrees ccw */
    double      font_size;
    double      horizontal_scale;
};

struct GlyphSize {
    double font_size;
    double horizontal_scale;
};

/* ── invisible layer ───────────────────────────────────────────── */

struct TextPlacement {
    Point          origin;
    double         font_size;
    double         horizontal_scale;
    int            rotation;
    int            render_mode;        /* always 3 (invisible) */
    std::string    text;
    std::u16string utf16;              /* what gets embedded */

    bool operator==(const TextPlacement& o) const {
        return origin.x == o.origin.x && origin.y == o.origin.y &&
               font_size == o.font_size &&
               horizontal_scale == o.horizontal_scale &&
               rotation == o.rotation && render_mode == o.render_mode &&
               text == o.text && utf16 == o.utf16;
    }
};

struct InvisibleLayer {
    int                        page_index;
    std::string                base_font;  /* built-in, never painted */
    std::vector<TextPlacement> placements;

    bool operator==(const InvisibleLayer& o) const {
        return page_index == o.page_index && base_font == o.base_font &&
               placements == o.placements;
    }
};

constexpr int  kRenderModeInvisible = 3;
constexpr char kLayerFont[]         = "Helvetica";
constexpr char kLayerMark[]         = "OCRLayer";

/* ── result ────────────────────────────────────────────────────── */

struct PageWarning {
    int         page_index;
    int         word_index;            /* -1 for page-level warnings */
    std::string reason;                /* error_kind_name() or "DegenerateWord" */
    std::string message;
};

struct EmbedResult {
    std::vector<uint8_t>     pdf;
    int                      page_count     = 0;
    int                      pages_embedded = 0;
    int                      words_embedded = 0;
    std::vector<PageWarning> warnings;
};

std::string report_json(const EmbedResult& result);

/* ── components ────────────────────────────────────────────────── */

/* Coordinate Mapper */
Point      user_to_display(const Page& page, Point p);
Point      display_to_user(const Page& page, Point p);
MappedWord map_word(const RecognizedWord& word, const PageImageMeta& meta,
                    const Page& page, const LayerConfig& config);

/* Glyph Sizing Estimator */
double                   natural_width(const std::string& text, double font_size);
std::optional<GlyphSize> estimate_size(const MappedWord& word, const std::string& text,
                                       const LayerConfig& config);

/* Invisible Text Layer Builder; both throw LayerConstructionFailed on bad UTF-8 */
std::u32string utf8_to_codepoints(const std::string& text);
std::u16string utf8_to_utf16(const std::string& text);
InvisibleLayer build_layer(int page_index, const std::vector<MappedWord>& words);

/* Document Assembler */
EmbedResult process_document(const void* buf, size_t len, const PerPageWords& words,
                             const LayerConfig& config);

#endif

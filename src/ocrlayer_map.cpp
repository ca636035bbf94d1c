#include "ocrlayer_types.h"

#include <algorithm>
#include <string>

/* ── display space ──────────────────────────────────────────────────── */
/*
 * Display space is the page as a viewer shows it: /Rotate applied
 * (clockwise), origin at the displayed bottom-left. OCR pixel boxes are
 * measured on the displayed page, so mapping goes pixel -> display -> user.
 */

static bool quarter_turn(const Page& page) {
    return page.rotation == 90 || page.rotation == 270;
}

static double display_width(const Page& page) {
    return quarter_turn(page) ? page.height() : page.width();
}

static double display_height(const Page& page) {
    return quarter_turn(page) ? page.width() : page.height();
}

Point user_to_display(const Page& page, Point p) {
    double w = page.width(), h = page.height();
    double u = p.x - page.box.left;
    double v = p.y - page.box.bottom;
    switch (page.rotation) {
        case 90:  return {v, w - u};
        case 180: return {w - u, h - v};
        case 270: return {h - v, u};
        default:  return {u, v};
    }
}

Point display_to_user(const Page& page, Point p) {
    double w = page.width(), h = page.height();
    Point local;
    switch (page.rotation) {
        case 90:  local = {w - p.y, p.x};     break;
        case 180: local = {w - p.x, h - p.y}; break;
        case 270: local = {p.y, h - p.x};     break;
        default:  local = p;                  break;
    }
    return {local.x + page.box.left, local.y + page.box.bottom};
}

/* Display-space rectangle that pixel space is stretched over. */
static Rect target_rect(const Page& page, const LayerConfig& config) {
    Rect full{0, 0, display_width(page), display_height(page)};
    if (!config.use_image_area || !page.image_area) return full;

    const Rect& img = *page.image_area;
    Point a = user_to_display(page, {img.left, img.bottom});
    Point b = user_to_display(page, {img.right, img.top});
    Rect r{std::max(std::min(a.x, b.x), full.left),
           std::max(std::min(a.y, b.y), full.bottom),
           std::min(std::max(a.x, b.x), full.right),
           std::min(std::max(a.y, b.y), full.top)};
    if (r.width() <= 0 || r.height() <= 0) return full;
    return r;
}

/* ── map ────────────────────────────────────────────────────────────── */

MappedWord map_word(const RecognizedWord& word, const PageImageMeta& meta,
                    const Page& page, const LayerConfig& config) {
    if (!(meta.pixel_width > 0) || !(meta.pixel_height > 0)) {
        throw LayerError(ErrorKind::InvalidPageMetadata,
                         "page " + std::to_string(page.index) +
                         ": pixel dimensions must be positive, got " +
                         std::to_string(meta.pixel_width) + "x" +
                         std::to_string(meta.pixel_height));
    }

    Rect target = target_rect(page, config);
    double sx = target.width()  / meta.pixel_width;
    double sy = target.height() / meta.pixel_height;

    const PixelBox& b = word.box;
    double left   = target.left + b.x * sx;
    double right  = left + b.width * sx;
    double bottom = target.top - (b.y + b.height) * sy;
    double top    = bottom + b.height * sy;

    /* OCR rounding can push a box slightly past the page edge */
    double dw = display_width(page), dh = display_height(page);
    left   = std::clamp(left,   0.0, dw);
    right  = std::clamp(right,  0.0, dw);
    bottom = std::clamp(bottom, 0.0, dh);
    top    = std::clamp(top,    0.0, dh);

    MappedWord m;
    m.text             = word.text;
    m.origin           = display_to_user(page, {left, bottom});
    m.width            = right - left;
    m.height           = top - bottom;
    m.rotation         = page.rotation;
    m.font_size        = 0;
    m.horizontal_scale = 1;
    return m;
}

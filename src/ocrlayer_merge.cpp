#include "ocrlayer_pdf.h"

#include <fpdf_edit.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static LayerError unsupported(int index, const std::string& why) {
    return LayerError(ErrorKind::UnsupportedPageStructure,
                      "page " + std::to_string(index) + ": " + why);
}

static bool has_layer_mark(FPDF_PAGEOBJECT obj) {
    static const std::u16string wanted(kLayerMark, kLayerMark + sizeof(kLayerMark) - 1);
    int marks = FPDFPageObj_CountMarks(obj);
    for (int mi = 0; mi < marks; ++mi) {
        FPDF_PAGEOBJECTMARK mark = FPDFPageObj_GetMark(obj, static_cast<unsigned long>(mi));
        if (!mark) continue;
        FPDF_WCHAR name[64] = {};
        unsigned long out_len = 0;
        if (!FPDFPageObjMark_GetName(mark, name, sizeof(name), &out_len)) continue;
        /* out_len counts bytes including the terminator */
        size_t chars = out_len >= 2 ? out_len / 2 - 1 : 0;
        if (std::u16string(name, name + std::min<size_t>(chars, 63)) == wanted)
            return true;
    }
    return false;
}

static bool page_has_layer(FPDF_PAGE page) {
    int count = FPDFPage_CountObjects(page);
    for (int oi = 0; oi < count; ++oi) {
        FPDF_PAGEOBJECT obj = FPDFPage_GetObject(page, oi);
        if (obj && FPDFPageObj_GetType(obj) == FPDF_PAGEOBJ_TEXT && has_layer_mark(obj))
            return true;
    }
    return false;
}

/* cos/sin of a quarter-turn angle, exact */
static void quarter_turn(int degrees, double& c, double& s) {
    switch (((degrees % 360) + 360) % 360) {
        case 90:  c = 0;  s = 1;  break;
        case 180: c = -1; s = 0;  break;
        case 270: c = 0;  s = -1; break;
        default:  c = 1;  s = 0;  break;
    }
}

/* ── page geometry ──────────────────────────────────────────────────── */

Page read_page(FPDF_DOCUMENT doc, int index) {
    ScopedFPDFPage page(FPDF_LoadPage(doc, index));
    if (!page) throw unsupported(index, "cannot be loaded");

    FS_RECTF bbox;
    if (!FPDF_GetPageBoundingBox(page.get(), &bbox))
        throw unsupported(index, "no page bounding box");

    Page p;
    p.index      = index;
    p.box        = {std::min(bbox.left, bbox.right), std::min(bbox.bottom, bbox.top),
                    std::max(bbox.left, bbox.right), std::max(bbox.bottom, bbox.top)};
    p.rotation   = (FPDFPage_GetRotation(page.get()) & 3) * 90;
    p.has_layer  = false;

    if (p.width() <= 0 || p.height() <= 0)
        throw unsupported(index, "empty page box");

    int count = FPDFPage_CountObjects(page.get());
    for (int oi = 0; oi < count; ++oi) {
        FPDF_PAGEOBJECT obj = FPDFPage_GetObject(page.get(), oi);
        if (!obj) continue;
        int type = FPDFPageObj_GetType(obj);
        if (type == FPDF_PAGEOBJ_IMAGE && !p.image_area) {
            float l, b, r, t;
            if (FPDFPageObj_GetBounds(obj, &l, &b, &r, &t))
                p.image_area = Rect{l, b, r, t};
        } else if (type == FPDF_PAGEOBJ_TEXT && !p.has_layer) {
            p.has_layer = has_layer_mark(obj);
        }
    }
    return p;
}

/* ── merge ──────────────────────────────────────────────────────────── */

int merge_layer(FPDF_DOCUMENT doc, const Page& page, const InvisibleLayer& layer) {
    if (layer.placements.empty()) return 0;

    ScopedFPDFPage handle(FPDF_LoadPage(doc, page.index));
    if (!handle) throw unsupported(page.index, "cannot be loaded");

    /*
     * A layer already present means either an input that went through this
     * engine before, or content shared with a page merged earlier in this
     * run. Writing again would duplicate the text in both cases.
     */
    if (page_has_layer(handle.get()))
        throw unsupported(page.index, "content already carries an invisible text layer");

    std::vector<ScopedFPDFPageObject> objects;
    objects.reserve(layer.placements.size());
    for (const TextPlacement& tp : layer.placements) {
        ScopedFPDFPageObject text(FPDFPageObj_NewTextObj(
            doc, layer.base_font.c_str(), static_cast<float>(tp.font_size)));
        if (!text) throw unsupported(page.index, "cannot create text object");

        std::vector<unsigned short> wide(tp.utf16.begin(), tp.utf16.end());
        wide.push_back(0);
        if (!FPDFText_SetText(text.get(), wide.data()))
            throw unsupported(page.index, "cannot set text '" + tp.text + "'");
        if (!FPDFTextObj_SetTextRenderMode(
                text.get(), static_cast<FPDF_TEXT_RENDERMODE>(tp.render_mode)))
            throw unsupported(page.index, "cannot set text render mode");
        if (!FPDFPageObj_AddMark(text.get(), kLayerMark))
            throw unsupported(page.index, "cannot tag text object");

        /* horizontal stretch in text space, then turn and move */
        double c, s;
        quarter_turn(tp.rotation, c, s);
        double h = tp.horizontal_scale;
        FPDFPageObj_Transform(text.get(), h * c, h * s, -s, c, tp.origin.x, tp.origin.y);

        objects.push_back(std::move(text));
    }

    std::vector<FPDF_PAGEOBJECT> inserted;
    inserted.reserve(objects.size());
    for (auto& obj : objects) {
        FPDF_PAGEOBJECT raw = obj.release();
        FPDFPage_InsertObject(handle.get(), raw);
        inserted.push_back(raw);
    }

    /* existing streams are kept; new objects go to an appended stream */
    if (!FPDFPage_GenerateContent(handle.get())) {
        for (FPDF_PAGEOBJECT raw : inserted) {
            if (FPDFPage_RemoveObject(handle.get(), raw))
                FPDFPageObj_Destroy(raw);
        }
        throw unsupported(page.index, "content generation failed");
    }

    spdlog::debug("merge: page {} gained {} invisible text objects",
                  page.index, inserted.size());
    return static_cast<int>(inserted.size());
}

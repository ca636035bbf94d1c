#include "ocrlayer_types.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

using json = nlohmann::json;

/* ── configuration ──────────────────────────────────────────────────── */

void validate_config(const LayerConfig& c) {
    if (!(c.calibration > 0))
        throw std::invalid_argument("calibration must be positive");
    if (!(c.min_font_size > 0) || !(c.max_font_size >= c.min_font_size))
        throw std::invalid_argument("font size bounds must satisfy 0 < min <= max");
    if (!(c.min_horizontal_scale > 0))
        throw std::invalid_argument("min_horizontal_scale must be positive");
}

LayerConfig config_from_json(const std::string& text) {
    LayerConfig c;
    if (text.empty()) return c;
    try {
        json obj = json::parse(text);
        if (!obj.is_object()) throw std::invalid_argument("config must be a JSON object");
        c.calibration          = obj.value("calibration", c.calibration);
        c.min_font_size        = obj.value("min_font_size", c.min_font_size);
        c.max_font_size        = obj.value("max_font_size", c.max_font_size);
        c.min_horizontal_scale = obj.value("min_horizontal_scale", c.min_horizontal_scale);
        c.strict               = obj.value("strict", c.strict);
        c.use_image_area       = obj.value("use_image_area", c.use_image_area);
        c.incremental_save     = obj.value("incremental_save", c.incremental_save);
        c.workers              = obj.value("workers", c.workers);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("config: ") + e.what());
    }
    validate_config(c);
    return c;
}

/* ── word data ──────────────────────────────────────────────────────── */
/*
 * {"pages": [{"page": 0, "pixel_width": 1700, "pixel_height": 2200,
 *             "normalized": false,
 *             "words": [{"text": "Invoice",
 *                        "box": {"x": 100, "y": 50, "width": 200, "height": 40}}]}]}
 *
 * "normalized": true means boxes are fractions of the page (0..1); the
 * pixel dimensions are then ignored.
 */

static RecognizedWord parse_word(const json& w, int page_index) {
    const json& box = w.at("box");
    RecognizedWord rw;
    rw.text       = w.at("text").get<std::string>();
    rw.box.x      = box.at("x").get<double>();
    rw.box.y      = box.at("y").get<double>();
    rw.box.width  = box.at("width").get<double>();
    rw.box.height = box.at("height").get<double>();
    rw.page_index = page_index;
    return rw;
}

PerPageWords words_from_json(const std::string& text) {
    PerPageWords out;
    try {
        json doc = json::parse(text);
        for (const json& p : doc.at("pages")) {
            int index = p.at("page").get<int>();
            if (out.count(index))
                throw std::invalid_argument("duplicate entry for page " + std::to_string(index));

            PageWords pw;
            if (p.value("normalized", false)) {
                pw.meta = {1.0, 1.0};
            } else {
                pw.meta = {p.at("pixel_width").get<double>(),
                           p.at("pixel_height").get<double>()};
            }
            if (p.contains("words")) {
                for (const json& w : p.at("words"))
                    pw.words.push_back(parse_word(w, index));
            }
            out.emplace(index, std::move(pw));
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("word data: ") + e.what());
    }
    return out;
}

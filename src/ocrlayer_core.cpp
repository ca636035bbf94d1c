#include "ocrlayer.h"
#include "ocrlayer_pdf.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

/* ── error names / report ───────────────────────────────────────────── */

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPageMetadata:      return "InvalidPageMetadata";
        case ErrorKind::UnsupportedPageStructure: return "UnsupportedPageStructure";
        case ErrorKind::EmptyDocument:            return "EmptyDocument";
        case ErrorKind::MalformedInput:           return "MalformedInput";
        case ErrorKind::LayerConstructionFailed:  return "LayerConstructionFailed";
    }
    return "Unknown";
}

std::string report_json(const EmbedResult& r) {
    json obj;
    obj["page_count"]     = r.page_count;
    obj["pages_embedded"] = r.pages_embedded;
    obj["words_embedded"] = r.words_embedded;
    obj["warnings"]       = json::array();
    for (const auto& w : r.warnings) {
        json row;
        row["page"]    = w.page_index;
        row["word"]    = w.word_index < 0 ? json(nullptr) : json(w.word_index);
        row["reason"]  = w.reason;
        row["message"] = w.message;
        obj["warnings"].push_back(std::move(row));
    }
    return obj.dump();
}

/* ── result handle ──────────────────────────────────────────────────── */

struct ocrlayer_result {
    EmbedResult result;
    std::string report;
};

static thread_local std::string g_last_error;

static int fail(int code, const std::string& message) {
    g_last_error = message;
    spdlog::error("ocrlayer: {}", message);
    return code;
}

const char* ocrlayer_last_error(void) {
    return g_last_error.c_str();
}

/* ── public C API ───────────────────────────────────────────────────── */

void ocrlayer_pdf_init(void)    { FPDF_InitLibrary(); }
void ocrlayer_pdf_destroy(void) { FPDF_DestroyLibrary(); }

int ocrlayer_embed(const void* buf, size_t len,
                   const char* words_json, const char* config_json,
                   ocrlayer_result** out) {
    if (!out) return fail(OCRLAYER_ERR_INVALID_ARGUMENT, "out must not be NULL");
    *out = nullptr;
    if (!buf || !words_json)
        return fail(OCRLAYER_ERR_INVALID_ARGUMENT, "buf and words_json are required");
    g_last_error.clear();

    try {
        LayerConfig config = config_from_json(config_json ? config_json : "");
        PerPageWords words = words_from_json(words_json);

        auto r    = std::make_unique<ocrlayer_result>();
        r->result = process_document(buf, len, words, config);
        r->report = report_json(r->result);
        *out = r.release();
        return OCRLAYER_OK;
    } catch (const LayerError& e) {
        switch (e.kind()) {
            case ErrorKind::MalformedInput:
                return fail(OCRLAYER_ERR_MALFORMED_INPUT, e.what());
            case ErrorKind::EmptyDocument:
                return fail(OCRLAYER_ERR_EMPTY_DOCUMENT, e.what());
            case ErrorKind::UnsupportedPageStructure:
                return fail(OCRLAYER_ERR_UNSUPPORTED_PAGE, e.what());
            default:
                return fail(OCRLAYER_ERR_INTERNAL, e.what());
        }
    } catch (const std::invalid_argument& e) {
        return fail(OCRLAYER_ERR_INVALID_ARGUMENT, e.what());
    } catch (const std::exception& e) {
        return fail(OCRLAYER_ERR_INTERNAL, e.what());
    }
}

const void* ocrlayer_result_data(const ocrlayer_result* r, size_t* len) {
    if (!r) {
        if (len) *len = 0;
        return nullptr;
    }
    if (len) *len = r->result.pdf.size();
    return r->result.pdf.data();
}

const char* ocrlayer_result_report_json(const ocrlayer_result* r) {
    return r ? r->report.c_str() : nullptr;
}

void ocrlayer_result_free(ocrlayer_result* r) {
    delete r;
}

int ocrlayer_extract_text(const void* buf, size_t len, const char* password,
                          ocrlayer_text_callback cb, void* user_data) {
    if (!buf || !cb)
        return fail(OCRLAYER_ERR_INVALID_ARGUMENT, "buf and cb are required");
    g_last_error.clear();

    try {
        std::vector<TextRun> runs;
        if (!extract_text_runs(buf, len, password, runs))
            return fail(OCRLAYER_ERR_MALFORMED_INPUT, "cannot parse PDF for text extraction");

        for (const TextRun& run : runs) {
            json obj;
            obj["page"]      = run.page_index;
            obj["x"]         = run.left;
            obj["y"]         = run.bottom;
            obj["w"]         = run.right - run.left;
            obj["h"]         = run.top - run.bottom;
            obj["font_size"] = run.font_size;
            obj["text"]      = run.text;

            std::string s = obj.dump(-1, ' ', false, json::error_handler_t::replace);
            int rc = cb(s.c_str(), user_data);
            if (rc != 0) return rc;
        }
        return OCRLAYER_OK;
    } catch (const std::exception& e) {
        return fail(OCRLAYER_ERR_INTERNAL, e.what());
    }
}

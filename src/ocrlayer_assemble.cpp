#include "ocrlayer_pdf.h"

#include <fpdf_save.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/* ── document I/O ───────────────────────────────────────────────────── */

ScopedFPDFDocument open_document(const void* buf, size_t len, const char* password) {
    ScopedFPDFDocument doc(FPDF_LoadMemDocument(buf, static_cast<int>(len), password));
    if (!doc) {
        throw LayerError(ErrorKind::MalformedInput,
                         "cannot parse PDF (pdfium error " +
                         std::to_string(FPDF_GetLastError()) + ")");
    }
    return doc;
}

namespace {

struct MemoryWriter : FPDF_FILEWRITE {
    std::vector<uint8_t> bytes;

    static int write_block(FPDF_FILEWRITE* self, const void* data, unsigned long size) {
        auto* w = static_cast<MemoryWriter*>(self);
        auto* p = static_cast<const uint8_t*>(data);
        w->bytes.insert(w->bytes.end(), p, p + size);
        return 1;
    }

    MemoryWriter() {
        version    = 1;
        WriteBlock = &write_block;
    }
};

}  // namespace

std::vector<uint8_t> save_document(FPDF_DOCUMENT doc, bool incremental) {
    MemoryWriter out;
    if (!FPDF_SaveAsCopy(doc, &out, incremental ? FPDF_INCREMENTAL : FPDF_NO_INCREMENTAL))
        throw std::runtime_error("pdfium failed to serialize the document");
    return std::move(out.bytes);
}

/* ── per-page layer computation (no pdfium, runs on workers) ────────── */

namespace {

struct PageOutcome {
    bool                     has_words = false;
    InvisibleLayer           layer;
    std::vector<PageWarning> warnings;
    std::exception_ptr       fatal;
};

void compute_layer(const Page& page, const PageWords& input, const LayerConfig& config,
                   PageOutcome& out) {
    out.has_words = true;
    std::vector<MappedWord> sized;
    sized.reserve(input.words.size());

    for (size_t wi = 0; wi < input.words.size(); ++wi) {
        const RecognizedWord& word = input.words[wi];
        try {
            MappedWord m = map_word(word, input.meta, page, config);
            std::optional<GlyphSize> size = estimate_size(m, word.text, config);
            if (!size) {
                out.warnings.push_back({page.index, static_cast<int>(wi), "DegenerateWord",
                                        "empty text or zero-area box"});
                continue;
            }
            m.font_size        = size->font_size;
            m.horizontal_scale = size->horizontal_scale;
            sized.push_back(std::move(m));
        } catch (const LayerError& e) {
            /* metadata is page-wide, nothing on this page can be placed */
            if (e.kind() == ErrorKind::InvalidPageMetadata) throw;
            out.warnings.push_back({page.index, static_cast<int>(wi),
                                    error_kind_name(e.kind()), e.what()});
        }
    }
    out.layer = build_layer(page.index, sized);
}

void compute_page(const Page& page, const PageWords& input, const LayerConfig& config,
                  PageOutcome& out) {
    try {
        compute_layer(page, input, config, out);
    } catch (const LayerError& e) {
        out.layer = InvisibleLayer{page.index, kLayerFont, {}};
        out.warnings.push_back({page.index, -1, error_kind_name(e.kind()), e.what()});
        spdlog::warn("assemble: skipping layer, {}", e.what());
    } catch (...) {
        out.fatal = std::current_exception();
    }
}

}  // namespace

/* ── public API ─────────────────────────────────────────────────────── */

EmbedResult process_document(const void* buf, size_t len, const PerPageWords& words,
                             const LayerConfig& config) {
    validate_config(config);

    ScopedFPDFDocument doc = open_document(buf, len, nullptr);
    int page_count = FPDF_GetPageCount(doc.get());
    if (page_count <= 0)
        throw LayerError(ErrorKind::EmptyDocument, "document has no pages");

    EmbedResult result;
    result.page_count = page_count;

    for (const auto& entry : words) {
        if (entry.first < 0 || entry.first >= page_count) {
            result.warnings.push_back({entry.first, -1, "PageOutOfRange",
                                       "word data for a page the document does not have"});
            spdlog::warn("assemble: ignoring word data for page {} of {}",
                         entry.first, page_count);
        }
    }

    /* geometry first: pdfium stays on this thread */
    std::vector<std::optional<Page>> pages(page_count);
    std::vector<PageOutcome> outcomes(page_count);
    std::vector<int> todo;
    for (int pi = 0; pi < page_count; ++pi) {
        auto it = words.find(pi);
        if (it == words.end()) continue;
        try {
            Page page = read_page(doc.get(), pi);
            if (page.has_layer)
                throw LayerError(ErrorKind::UnsupportedPageStructure,
                                 "page " + std::to_string(pi) +
                                 ": already carries an invisible text layer");
            pages[pi] = page;
            todo.push_back(pi);
        } catch (const LayerError& e) {
            if (config.strict) throw;
            outcomes[pi].warnings.push_back({pi, -1, error_kind_name(e.kind()), e.what()});
            spdlog::warn("assemble: skipping layer, {}", e.what());
        }
    }

    /* layers: independent per page, each worker writes only its own slot */
    unsigned workers = config.workers ? config.workers : std::thread::hardware_concurrency();
    workers = std::max(1u, std::min<unsigned>(workers, static_cast<unsigned>(todo.size())));
    std::atomic<size_t> next{0};
    auto run = [&]() {
        for (size_t k = next++; k < todo.size(); k = next++) {
            int pi = todo[k];
            compute_page(*pages[pi], words.at(pi), config, outcomes[pi]);
        }
    };
    if (workers <= 1) {
        run();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (unsigned t = 0; t < workers; ++t) pool.emplace_back(run);
        for (auto& th : pool) th.join();
    }

    /* merge in page order */
    for (int pi = 0; pi < page_count; ++pi) {
        PageOutcome& out = outcomes[pi];
        if (out.fatal) std::rethrow_exception(out.fatal);

        if (out.has_words && !out.layer.placements.empty()) {
            try {
                result.words_embedded += merge_layer(doc.get(), *pages[pi], out.layer);
                result.pages_embedded++;
            } catch (const LayerError& e) {
                if (config.strict) throw;
                out.warnings.push_back({pi, -1, error_kind_name(e.kind()), e.what()});
                spdlog::warn("assemble: skipping layer, {}", e.what());
            }
        }
        for (auto& w : out.warnings) {
            if (w.word_index >= 0)
                spdlog::debug("assemble: page {} word {} skipped: {}",
                              w.page_index, w.word_index, w.message);
            result.warnings.push_back(std::move(w));
        }
    }

    result.pdf = save_document(doc.get(), config.incremental_save);
    spdlog::info("assemble: {} of {} pages embedded, {} words, {} warnings",
                 result.pages_embedded, page_count, result.words_embedded,
                 result.warnings.size());
    return result;
}

#ifndef OCRLAYER_H
#define OCRLAYER_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── library lifecycle ───────────────────────────────────────────── */

/* Initialize / destroy the underlying PDF library. Call once per process. */
void ocrlayer_pdf_init(void);
void ocrlayer_pdf_destroy(void);

/* ── status codes ────────────────────────────────────────────────── */

#define OCRLAYER_OK                    0
#define OCRLAYER_ERR_MALFORMED_INPUT  -1   /* bytes are not a PDF */
#define OCRLAYER_ERR_EMPTY_DOCUMENT   -2   /* PDF has zero pages */
#define OCRLAYER_ERR_INVALID_ARGUMENT -3   /* bad word data or config JSON */
#define OCRLAYER_ERR_UNSUPPORTED_PAGE -4   /* strict mode only */
#define OCRLAYER_ERR_INTERNAL         -5

/* Message for the last failure on the calling thread, "" if none. */
const char* ocrlayer_last_error(void);

/* ── embedding ───────────────────────────────────────────────────── */

typedef struct ocrlayer_result ocrlayer_result;

/*
 * Add an invisible text layer to a PDF loaded from memory.
 *   buf / len   : raw PDF bytes
 *   words_json  : per-page OCR words (format in src/ocrlayer_input.cpp)
 *   config_json : tuning knobs, or NULL for defaults
 *   out         : receives the result on OCRLAYER_OK, NULL otherwise
 *
 * Pages that cannot take a layer are kept as they were and reported in
 * the result's report; only document-level problems return an error.
 */
int ocrlayer_embed(const void* buf, size_t len,
                   const char* words_json, const char* config_json,
                   ocrlayer_result** out);

/* Output PDF bytes, valid until ocrlayer_result_free. */
const void* ocrlayer_result_data(const ocrlayer_result* result, size_t* len);

/* {"page_count":..,"pages_embedded":..,"words_embedded":..,"warnings":[..]} */
const char* ocrlayer_result_report_json(const ocrlayer_result* result);

void ocrlayer_result_free(ocrlayer_result* result);

/* ── text extraction ─────────────────────────────────────────────── */

/* Callback receives a JSON string per text run. Return 0 to continue, non-zero to abort. */
typedef int (*ocrlayer_text_callback)(const char* json, void* user_data);

/*
 * Extract text runs from a PDF loaded from memory; used to confirm that
 * output is searchable. Returns OCRLAYER_OK, a negative OCRLAYER_ERR_* code
 * (OCRLAYER_ERR_MALFORMED_INPUT for a bad PDF), or the callback's non-zero
 * value if it aborted.
 */
int ocrlayer_extract_text(const void* buf, size_t len, const char* password,
                          ocrlayer_text_callback cb, void* user_data);

#ifdef __cplusplus
}
#endif

#endif

#include "ocrlayer.h"

#include <cstdio>
#include <string>
#include <vector>

static bool read_file(const char* path, std::vector<char>& buf) {
    FILE* f = fopen(path, "rb");
    if (!f) { perror(path); return false; }
    fseek(f, 0, SEEK_END);
    long sz = ftell(f);
    rewind(f);
    buf.resize(sz);
    bool ok = fread(buf.data(), 1, sz, f) == static_cast<size_t>(sz);
    fclose(f);
    if (!ok) fprintf(stderr, "%s: read error\n", path);
    return ok;
}

static int print_run(const char* json, void* user_data) {
    int* count = static_cast<int*>(user_data);
    if ((*count)++ < 10) printf("  %s\n", json);
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        fprintf(stderr, "usage: %s <scan.pdf> <words.json> <out.pdf> [config.json]\n", argv[0]);
        return 1;
    }

    std::vector<char> pdf, words, config;
    if (!read_file(argv[1], pdf) || !read_file(argv[2], words)) return 1;
    if (argc > 4 && !read_file(argv[4], config)) return 1;
    words.push_back('\0');
    if (!config.empty()) config.push_back('\0');

    ocrlayer_pdf_init();

    ocrlayer_result* res = nullptr;
    int rc = ocrlayer_embed(pdf.data(), pdf.size(), words.data(),
                            config.empty() ? nullptr : config.data(), &res);
    if (rc != OCRLAYER_OK) {
        fprintf(stderr, "embed failed (%d): %s\n", rc, ocrlayer_last_error());
        ocrlayer_pdf_destroy();
        return 1;
    }

    size_t len = 0;
    const void* data = ocrlayer_result_data(res, &len);
    FILE* f = fopen(argv[3], "wb");
    if (!f || fwrite(data, 1, len, f) != len) {
        perror(argv[3]);
        if (f) fclose(f);
        ocrlayer_result_free(res);
        ocrlayer_pdf_destroy();
        return 1;
    }
    fclose(f);

    /* report */
    printf("--- report ---\n  %s\n", ocrlayer_result_report_json(res));

    /* text runs found in the output (first 10) */
    printf("--- text runs (first 10) ---\n");
    int count = 0;
    if (ocrlayer_extract_text(data, len, nullptr, print_run, &count) != 0)
        fprintf(stderr, "output could not be read back\n");
    printf("  %d runs\n", count);

    ocrlayer_result_free(res);
    ocrlayer_pdf_destroy();
    return 0;
}

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "ocrlayer.h"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    ocrlayer_pdf_init();
    int rc = Catch::Session().run(argc, argv);
    ocrlayer_pdf_destroy();
    return rc;
}

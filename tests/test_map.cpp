#include <catch2/catch.hpp>

#include "ocrlayer_types.h"
#include "pdf_fixtures.h"

static Page make_page(double w, double h, int rotation = 0) {
    Page p;
    p.index     = 0;
    p.box       = {0, 0, w, h};
    p.rotation  = rotation;
    p.has_layer = false;
    return p;
}

TEST_CASE("full-page pixel box maps onto the full page", "[map]") {
    Page page = make_page(612, 792);
    LayerConfig config;
    MappedWord m = map_word(word("all", 0, 0, 1000, 1500), {1000, 1500}, page, config);

    CHECK(m.origin.x == Approx(0).margin(1e-9));
    CHECK(m.origin.y == Approx(0).margin(1e-9));
    CHECK(m.width == Approx(612));
    CHECK(m.height == Approx(792));
    CHECK(m.rotation == 0);
}

TEST_CASE("pixel box is scaled and flipped to bottom-left origin", "[map]") {
    Page page = make_page(612, 792);
    MappedWord m = map_word(word("Invoice", 100, 50, 200, 40), {1700, 2200}, page, LayerConfig{});

    CHECK(m.origin.x == Approx(36.0));
    CHECK(m.origin.y == Approx(792 - 90 * 0.36));
    CHECK(m.width == Approx(72.0));
    CHECK(m.height == Approx(14.4));
    CHECK(m.text == "Invoice");
}

TEST_CASE("page origin offset is carried into user space", "[map]") {
    Page page;
    page.index     = 0;
    page.box       = {10, 20, 622, 812};
    page.rotation  = 0;
    page.has_layer = false;
    MappedWord m = map_word(word("w", 0, 0, 612, 792), {612, 792}, page, LayerConfig{});

    CHECK(m.origin.x == Approx(10));
    CHECK(m.origin.y == Approx(20));
}

TEST_CASE("boxes overshooting the page are clamped", "[map]") {
    Page page = make_page(600, 800);
    LayerConfig config;

    SECTION("past the right and bottom edges") {
        MappedWord m = map_word(word("edge", 550, 780, 100, 40), {600, 800}, page, config);
        CHECK(m.origin.x == Approx(550));
        CHECK(m.origin.y == Approx(0).margin(1e-9));
        CHECK(m.width == Approx(50));
        CHECK(m.height == Approx(20));
    }
    SECTION("before the left and top edges") {
        MappedWord m = map_word(word("edge", -10, -5, 30, 25), {600, 800}, page, config);
        CHECK(m.origin.x == Approx(0).margin(1e-9));
        CHECK(m.width == Approx(20));
        CHECK(m.origin.y + m.height == Approx(800));
        CHECK(m.height == Approx(20));
    }
    SECTION("entirely off the page collapses to nothing") {
        MappedWord m = map_word(word("gone", 700, 10, 50, 10), {600, 800}, page, config);
        CHECK(m.width == Approx(0).margin(1e-9));
    }
}

TEST_CASE("non-positive pixel dimensions are invalid page metadata", "[map]") {
    Page page = make_page(612, 792);
    LayerConfig config;

    for (PageImageMeta meta : {PageImageMeta{0, 100}, PageImageMeta{100, 0},
                               PageImageMeta{-5, 100}}) {
        try {
            map_word(word("x", 0, 0, 10, 10), meta, page, config);
            FAIL("expected InvalidPageMetadata");
        } catch (const LayerError& e) {
            CHECK(e.kind() == ErrorKind::InvalidPageMetadata);
        }
    }
}

TEST_CASE("user and display space round-trip for every rotation", "[map]") {
    for (int rotation : {0, 90, 180, 270}) {
        Page page = make_page(500, 700, rotation);
        page.box = {15, 25, 515, 725};
        Point p{123, 456};
        Point back = display_to_user(page, user_to_display(page, p));
        CHECK(back.x == Approx(p.x));
        CHECK(back.y == Approx(p.y));
    }
}

TEST_CASE("rotated page places text on the same displayed region", "[map]") {
    /* same displayed page (612 x 792) built four ways */
    Page upright = make_page(612, 792, 0);
    LayerConfig config;
    RecognizedWord w = word("Invoice", 100, 50, 200, 40);
    PageImageMeta meta{1700, 2200};
    MappedWord ref = map_word(w, meta, upright, config);

    for (int rotation : {90, 180, 270}) {
        bool quarter = rotation % 180 != 0;
        Page page = make_page(quarter ? 792 : 612, quarter ? 612 : 792, rotation);
        MappedWord m = map_word(w, meta, page, config);

        CAPTURE(rotation);
        Point shown = user_to_display(page, m.origin);
        CHECK(shown.x == Approx(ref.origin.x));
        CHECK(shown.y == Approx(ref.origin.y));
        CHECK(m.width == Approx(ref.width));
        CHECK(m.height == Approx(ref.height));
        CHECK(m.rotation == rotation);
    }
}

TEST_CASE("a 90 degree page turns the text upward in user space", "[map]") {
    Page page = make_page(792, 612, 90);
    MappedWord m = map_word(word("Invoice", 100, 50, 200, 40), {1700, 2200}, page, LayerConfig{});

    /* displayed lower-left (36, 759.6) -> user (792 - 759.6, 36) */
    CHECK(m.origin.x == Approx(792 - 759.6));
    CHECK(m.origin.y == Approx(36));
}

TEST_CASE("image area mapping stretches pixel space over the scan", "[map]") {
    Page page = make_page(612, 792);
    page.image_area = Rect{72, 72, 540, 720};

    LayerConfig config;
    config.use_image_area = true;
    MappedWord m = map_word(word("all", 0, 0, 1000, 1000), {1000, 1000}, page, config);
    CHECK(m.origin.x == Approx(72));
    CHECK(m.origin.y == Approx(72));
    CHECK(m.width == Approx(468));
    CHECK(m.height == Approx(648));

    SECTION("ignored unless asked for") {
        MappedWord full = map_word(word("all", 0, 0, 1000, 1000), {1000, 1000}, page, LayerConfig{});
        CHECK(full.width == Approx(612));
    }
}

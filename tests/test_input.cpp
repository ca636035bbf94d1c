#include <catch2/catch.hpp>

#include "ocrlayer_types.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

TEST_CASE("word data parses pages, metadata and words", "[input]") {
    PerPageWords words = words_from_json(R"({
        "pages": [
            {"page": 0, "pixel_width": 1700, "pixel_height": 2200,
             "words": [{"text": "Invoice", "box": {"x": 100, "y": 50, "width": 200, "height": 40}},
                       {"text": "No.",     "box": {"x": 320, "y": 50, "width": 60,  "height": 40}}]},
            {"page": 2, "normalized": true,
             "words": [{"text": "Total", "box": {"x": 0.1, "y": 0.9, "width": 0.1, "height": 0.02}}]},
            {"page": 3, "pixel_width": 10, "pixel_height": 10}
        ]})");

    REQUIRE(words.size() == 3);
    const PageWords& first = words.at(0);
    CHECK(first.meta.pixel_width == 1700);
    CHECK(first.meta.pixel_height == 2200);
    REQUIRE(first.words.size() == 2);
    CHECK(first.words[0].text == "Invoice");
    CHECK(first.words[0].box.x == 100);
    CHECK(first.words[0].box.height == 40);
    CHECK(first.words[1].page_index == 0);

    const PageWords& norm = words.at(2);
    CHECK(norm.meta.pixel_width == 1);
    CHECK(norm.meta.pixel_height == 1);
    CHECK(norm.words[0].box.y == Approx(0.9));

    CHECK(words.at(3).words.empty());
    CHECK(words.count(1) == 0);
}

TEST_CASE("malformed word data is rejected", "[input]") {
    CHECK_THROWS_AS(words_from_json("not json"), std::invalid_argument);
    CHECK_THROWS_AS(words_from_json(R"({"pages": [{"page": 0}]})"), std::invalid_argument);
    CHECK_THROWS_AS(words_from_json(R"({"pages": [{"page": 0, "normalized": true,
                                        "words": [{"text": "x"}]}]})"),
                    std::invalid_argument);
    CHECK_THROWS_AS(words_from_json(R"({"pages": [{"page": 0, "normalized": true},
                                                  {"page": 0, "normalized": true}]})"),
                    std::invalid_argument);
}

TEST_CASE("config defaults and overrides", "[input]") {
    LayerConfig defaults = config_from_json("");
    CHECK(defaults.calibration == Approx(0.85));
    CHECK_FALSE(defaults.strict);
    CHECK(defaults.min_horizontal_scale == Approx(0.01));

    LayerConfig c = config_from_json(R"({"calibration": 0.9, "strict": true,
                                         "use_image_area": true, "workers": 2,
                                         "min_font_size": 4, "max_font_size": 48})");
    CHECK(c.calibration == Approx(0.9));
    CHECK(c.strict);
    CHECK(c.use_image_area);
    CHECK(c.workers == 2u);
    CHECK(c.min_font_size == Approx(4));
    CHECK(c.max_font_size == Approx(48));
}

TEST_CASE("invalid config is rejected", "[input]") {
    CHECK_THROWS_AS(config_from_json(R"({"calibration": 0})"), std::invalid_argument);
    CHECK_THROWS_AS(config_from_json(R"({"min_font_size": 10, "max_font_size": 5})"),
                    std::invalid_argument);
    CHECK_THROWS_AS(config_from_json(R"({"min_horizontal_scale": -1})"), std::invalid_argument);
    CHECK_THROWS_AS(config_from_json(R"({"strict": "yes"})"), std::invalid_argument);
    CHECK_THROWS_AS(config_from_json("[1, 2]"), std::invalid_argument);
}

TEST_CASE("report lists warnings with page and word", "[input]") {
    EmbedResult r;
    r.page_count     = 3;
    r.pages_embedded = 2;
    r.words_embedded = 5;
    r.warnings.push_back({1, 4, "DegenerateWord", "empty text or zero-area box"});
    r.warnings.push_back({2, -1, "UnsupportedPageStructure", "page 2: cannot be loaded"});

    auto obj = nlohmann::json::parse(report_json(r));
    CHECK(obj["page_count"] == 3);
    CHECK(obj["pages_embedded"] == 2);
    CHECK(obj["words_embedded"] == 5);
    REQUIRE(obj["warnings"].size() == 2);
    CHECK(obj["warnings"][0]["word"] == 4);
    CHECK(obj["warnings"][1]["word"].is_null());
    CHECK(obj["warnings"][1]["reason"] == "UnsupportedPageStructure");
}

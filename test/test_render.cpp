#include <doctest/doctest.h>
#include <ultracode/render.hpp>

#include "helpers/synthetic.hpp"

#include <numeric>
#include <vector>

using namespace ultracode;
using test_helpers::pixel_at;

namespace {

std::size_t module_sum(const std::vector<std::uint8_t>& modules) {
    return std::accumulate(modules.begin(), modules.end(), std::size_t{0});
}

} // namespace

TEST_CASE("Renderer: EAN-13 modules") {
    std::vector<std::uint8_t> modules;

    SUBCASE("13 digits") {
        REQUIRE(ean13_modules("4006381333931", modules));
        CHECK(modules.size() == 59);
        CHECK(module_sum(modules) == 95);
        CHECK(modules[0] == 1);
        CHECK(modules[1] == 1);
        CHECK(modules[2] == 1);
    }

    SUBCASE("12 digits append the check digit") {
        std::vector<std::uint8_t> full;
        REQUIRE(ean13_modules("4006381333931", full));
        REQUIRE(ean13_modules("400638133393", modules));
        CHECK(modules == full);
    }

    SUBCASE("invalid text") {
        CHECK(ean13_modules("40063813339", modules).error == decode_error::invalid_input);
        CHECK(ean13_modules("40063813339X1", modules).error == decode_error::invalid_input);
        CHECK(ean13_modules("", modules).error == decode_error::invalid_input);
    }
}

TEST_CASE("Renderer: UPC-A modules") {
    std::vector<std::uint8_t> upc;
    std::vector<std::uint8_t> ean;
    REQUIRE(upca_modules("03600029145", upc));
    REQUIRE(ean13_modules("0036000291452", ean));
    CHECK(upc == ean);

    CHECK(upca_modules("0360002914", upc).error == decode_error::invalid_input);
}

TEST_CASE("Renderer: Code 128 modules") {
    std::vector<std::uint8_t> modules;

    SUBCASE("set B") {
        REQUIRE(code128_modules("Hi", code128_set::b, modules));
        // start, 2 data, check: 6 elements each; stop: 7
        CHECK(modules.size() == 4 * 6 + 7);
        CHECK(module_sum(modules) == 4 * 11 + 13);
    }

    SUBCASE("set C packs digit pairs") {
        REQUIRE(code128_modules("123456", code128_set::c, modules));
        CHECK(module_sum(modules) == 5 * 11 + 13);
    }

    SUBCASE("rejects characters outside the set") {
        CHECK(code128_modules("12345", code128_set::c, modules).error == decode_error::invalid_input);
        CHECK(code128_modules("12a4", code128_set::c, modules).error == decode_error::invalid_input);
        CHECK(code128_modules("abc", code128_set::a, modules).error == decode_error::invalid_input);
        CHECK(code128_modules("\x01", code128_set::b, modules).error == decode_error::invalid_input);
        CHECK(code128_modules("", code128_set::b, modules).error == decode_error::invalid_input);
    }
}

TEST_CASE("Renderer: rasterize") {
    const std::vector<std::uint8_t> modules = {1, 2, 3};

    SUBCASE("draw_modules paints bars only") {
        gray_buffer buffer;
        REQUIRE(buffer.reset(20, 2, 255));
        CHECK(draw_modules(buffer, 1, 0, 2, 2, modules) == 12);
        const auto view = buffer.view();
        CHECK(pixel_at(view, 0, 0) == 255);
        CHECK(pixel_at(view, 1, 0) == 0);
        CHECK(pixel_at(view, 2, 1) == 0);
        CHECK(pixel_at(view, 3, 0) == 255);    // 2-module space
        CHECK(pixel_at(view, 6, 0) == 255);
        CHECK(pixel_at(view, 7, 0) == 0);      // 3-module bar
        CHECK(pixel_at(view, 12, 0) == 0);
        CHECK(pixel_at(view, 13, 0) == 255);
    }

    SUBCASE("render_symbol adds quiet zones") {
        gray_buffer buffer;
        render_options options;
        options.module_width = 3;
        options.height = 20;
        options.quiet_zone = 4;
        REQUIRE(render_symbol(modules, buffer, options));
        CHECK(buffer.width() == (6 + 8) * 3);
        CHECK(buffer.height() == 20);

        const auto view = buffer.view();
        // 60% bar height centred: rows 4..15
        CHECK(pixel_at(view, 12, 3) == 255);
        CHECK(pixel_at(view, 12, 4) == 0);
        CHECK(pixel_at(view, 12, 15) == 0);
        CHECK(pixel_at(view, 12, 16) == 255);
        CHECK(pixel_at(view, 11, 10) == 255);
    }

    SUBCASE("render_symbol rejects nothing to draw") {
        gray_buffer buffer;
        CHECK(render_symbol({}, buffer).error == decode_error::invalid_input);

        render_options options;
        options.module_width = 0;
        CHECK(render_symbol(modules, buffer, options).error == decode_error::invalid_input);
    }
}

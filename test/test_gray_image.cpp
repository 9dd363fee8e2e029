#include <doctest/doctest.h>
#include <ultracode/gray_image.hpp>

#include "helpers/synthetic.hpp"

#include <vector>

using namespace ultracode;
using test_helpers::pixel_at;

TEST_CASE("Gray image: validate") {
    std::vector<std::uint8_t> pixels(12, 128);

    SUBCASE("matching buffer") {
        gray_image image(pixels, 4, 3);
        CHECK(image.validate());
        CHECK(pixel_at(image, 3, 2) == 128);
        CHECK(image.row(1).size() == 4);
    }

    SUBCASE("size mismatch") {
        gray_image image(pixels, 5, 3);
        auto result = image.validate();
        CHECK_FALSE(result);
        CHECK(result.error == decode_error::invalid_input);
    }

    SUBCASE("zero dimension") {
        CHECK(gray_image(pixels, 0, 3).validate().error == decode_error::invalid_input);
        CHECK(gray_image(pixels, 4, 0).validate().error == decode_error::invalid_input);
        CHECK(gray_image().validate().error == decode_error::invalid_input);
    }

    SUBCASE("limits") {
        decode_options options;
        options.max_width = 3;
        auto result = gray_image(pixels, 4, 3).validate(options);
        CHECK(result.error == decode_error::invalid_input);
    }
}

TEST_CASE("Gray buffer: drawing") {
    gray_buffer buffer;

    SUBCASE("reset rejects empty") {
        CHECK_FALSE(buffer.reset(0, 10));
        CHECK_FALSE(buffer.reset(10, 0));
    }

    SUBCASE("fill") {
        REQUIRE(buffer.reset(4, 2, 7));
        CHECK(buffer.width() == 4);
        CHECK(buffer.height() == 2);
        for (auto v : buffer.pixels()) {
            CHECK(v == 7);
        }
    }

    SUBCASE("fill_rect clips") {
        REQUIRE(buffer.reset(4, 4, 255));
        buffer.fill_rect(2, 2, 10, 10, 0);
        const auto view = buffer.view();
        CHECK(pixel_at(view, 1, 1) == 255);
        CHECK(pixel_at(view, 2, 2) == 0);
        CHECK(pixel_at(view, 3, 3) == 0);
        CHECK(pixel_at(view, 3, 1) == 255);

        buffer.fill_rect(9, 9, 2, 2, 0);  // fully outside
        CHECK(pixel_at(buffer.view(), 0, 0) == 255);
    }

    SUBCASE("set_pixel ignores out of range") {
        REQUIRE(buffer.reset(2, 2, 255));
        buffer.set_pixel(1, 0, 9);
        buffer.set_pixel(5, 5, 9);
        CHECK(pixel_at(buffer.view(), 1, 0) == 9);
        CHECK(buffer.view().validate());
    }
}

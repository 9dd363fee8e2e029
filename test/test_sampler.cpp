#include <doctest/doctest.h>
#include <ultracode/sampler.hpp>

#include <vector>

using namespace ultracode;

TEST_CASE("Row sampler: band centres") {
    std::vector<std::size_t> rows;

    SUBCASE("15 rows over 50") {
        REQUIRE(sample_rows(50, 15, rows));
        REQUIRE(rows.size() == 15);
        CHECK(rows.front() == 1);
        CHECK(rows.back() == 48);
        for (std::size_t i = 1; i < rows.size(); ++i) {
            CHECK(rows[i] > rows[i - 1]);
        }
    }

    SUBCASE("one row takes the middle") {
        REQUIRE(sample_rows(101, 1, rows));
        REQUIRE(rows.size() == 1);
        CHECK(rows[0] == 50);
    }

    SUBCASE("more rows than height") {
        REQUIRE(sample_rows(5, 40, rows));
        CHECK(rows == std::vector<std::size_t>{0, 1, 2, 3, 4});
    }

    SUBCASE("invalid") {
        CHECK(sample_rows(0, 5, rows).error == decode_error::invalid_input);
        CHECK(sample_rows(5, 0, rows).error == decode_error::invalid_input);
        CHECK(rows.empty());
    }
}

TEST_CASE("Row sampler: views") {
    std::vector<std::uint8_t> pixels(8 * 4);
    for (std::size_t y = 0; y < 4; ++y) {
        for (std::size_t x = 0; x < 8; ++x) {
            pixels[y * 8 + x] = static_cast<std::uint8_t>(y * 10);
        }
    }
    gray_image image(pixels, 8, 4);

    row_sampler sampler;
    REQUIRE(sampler.reset(image, 2));
    REQUIRE(sampler.size() == 2);
    CHECK(sampler.row_index(0) == 1);
    CHECK(sampler.row_index(1) == 3);
    CHECK(sampler.row(1).size() == 8);
    CHECK(sampler.row(1)[0] == 30);

    CHECK(sampler.reset(gray_image(pixels, 0, 4), 2).error == decode_error::invalid_input);
}

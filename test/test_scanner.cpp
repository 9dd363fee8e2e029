#include <doctest/doctest.h>
#include <ultracode/ultracode.hpp>

#include "helpers/synthetic.hpp"

#include <string>
#include <vector>

using namespace ultracode;
using test_helpers::draw_symbol;

namespace {

// 95 modules * 2 px with a 5 px quiet zone each side
gray_buffer ean13_image(std::string_view text, std::size_t x = 5) {
    return draw_symbol(test_helpers::ean13(text), 200, 50, x, 2);
}

// Reports a fixed list of symbols and counts calls
class fake_area_decoder : public area_decoder {
public:
    explicit fake_area_decoder(std::vector<decoded_symbol> symbols,
                               scan_error error = scan_error::none)
        : symbols_(std::move(symbols)), error_(error) {}

    std::string_view name() const noexcept override { return "fake"; }
    barcode_format format() const noexcept override { return barcode_format::qr; }

    scan_error decode(const gray_image& image,
                      const decode_options&,
                      std::vector<decoded_symbol>& out) const override {
        ++calls;
        last_width = image.width();
        if (error_ != scan_error::none) {
            return error_;
        }
        out = symbols_;
        return scan_error::none;
    }

    mutable int calls = 0;
    mutable std::size_t last_width = 0;

private:
    std::vector<decoded_symbol> symbols_;
    scan_error error_;
};

decoded_symbol make_symbol(barcode_format format, std::string text, float confidence) {
    decoded_symbol sym;
    sym.format = format;
    sym.text = std::move(text);
    sym.checksum_ok = true;
    sym.confidence = confidence;
    return sym;
}

} // namespace

TEST_CASE("Scanner: EAN-13 on a 200x50 image") {
    const auto image = ean13_image("4006381333931");

    decode_options options;
    options.scan_rows = 15;

    std::vector<decoded_symbol> symbols;
    auto result = decode_any(image.view(), symbols, options);
    REQUIRE(result);
    REQUIRE(symbols.size() == 1);

    const auto& sym = symbols[0];
    CHECK(sym.format == barcode_format::ean13);
    CHECK(sym.text == "4006381333931");
    CHECK(sym.checksum_ok);
    REQUIRE(sym.row.has_value());
    CHECK(*sym.row == 1);
    REQUIRE(sym.bounds.has_value());
    CHECK(sym.bounds->x == 5);
    CHECK(sym.bounds->y == 1);
    CHECK(sym.bounds->w == 190);
    CHECK(sym.bounds->h == 1);
}

TEST_CASE("Scanner: UPC-A and format filtering") {
    const auto image = draw_symbol(test_helpers::upca("036000291452"), 200, 40, 5, 2);
    std::vector<decoded_symbol> symbols;

    SUBCASE("default formats") {
        REQUIRE(decode_any(image.view(), symbols));
        REQUIRE(symbols.size() == 1);
        CHECK(symbols[0].format == barcode_format::upca);
        CHECK(symbols[0].text == "036000291452");
    }

    SUBCASE("EAN-13 only") {
        decode_options options;
        options.formats = {barcode_format::ean13};
        REQUIRE(decode_any(image.view(), symbols, options));
        REQUIRE(symbols.size() == 1);
        CHECK(symbols[0].format == barcode_format::ean13);
        CHECK(symbols[0].text == "0036000291452");
    }

    SUBCASE("Code 128 only") {
        decode_options options;
        options.formats = {barcode_format::code128};
        REQUIRE(decode_any(image.view(), symbols, options));
        CHECK(symbols.empty());
    }
}

TEST_CASE("Scanner: Code 128") {
    const auto modules = test_helpers::code128("ULTRA-128", code128_set::b);
    const auto image = draw_symbol(modules, 300, 30, 20, 2);

    std::vector<decoded_symbol> symbols;
    REQUIRE(decode_any(image.view(), symbols));
    REQUIRE(symbols.size() == 1);
    CHECK(symbols[0].format == barcode_format::code128);
    CHECK(symbols[0].text == "ULTRA-128");
    CHECK(symbols[0].checksum_ok);
}

TEST_CASE("Scanner: rendered symbol with quiet zones") {
    gray_buffer image;
    REQUIRE(render_symbol(test_helpers::ean13("5901234123457"), image));

    decoded_symbol sym;
    REQUIRE(decode_first(image.view(), sym));
    CHECK(sym.text == "5901234123457");
}

TEST_CASE("Scanner: orientation") {
    const auto image = test_helpers::rotate_180(ean13_image("4006381333931", 3));
    std::vector<decoded_symbol> symbols;

    SUBCASE("reversed runs read a rotated symbol") {
        REQUIRE(decode_any(image.view(), symbols));
        REQUIRE(symbols.size() == 1);
        CHECK(symbols[0].text == "4006381333931");
        REQUIRE(symbols[0].bounds.has_value());
        CHECK(symbols[0].bounds->x == 7);
        CHECK(symbols[0].bounds->w == 190);
    }

    SUBCASE("without reverse reading") {
        decode_options options;
        options.try_reverse = false;
        REQUIRE(decode_any(image.view(), symbols, options));
        CHECK(symbols.empty());
    }
}

TEST_CASE("Scanner: brightness gradient") {
    auto image = ean13_image("4006381333931");
    auto pixels = image.mutable_pixels();
    for (std::size_t y = 0; y < image.height(); ++y) {
        for (std::size_t x = 0; x < image.width(); ++x) {
            auto& px = pixels[y * image.width() + x];
            const auto background = static_cast<int>(250 - x * 150 / image.width());
            px = static_cast<std::uint8_t>(px == 0 ? background / 4 : background);
        }
    }

    decode_options options;
    options.binarization = binarize_mode::adaptive;
    std::vector<decoded_symbol> symbols;
    REQUIRE(decode_any(image.view(), symbols, options));
    REQUIRE(symbols.size() == 1);
    CHECK(symbols[0].text == "4006381333931");
}

TEST_CASE("Scanner: empty results") {
    std::vector<decoded_symbol> symbols;

    SUBCASE("uniform gray") {
        gray_buffer image;
        REQUIRE(image.reset(200, 50, 128));
        auto result = decode_any(image.view(), symbols);
        CHECK(result);
        CHECK(symbols.empty());
    }

    SUBCASE("noise without a symbol") {
        gray_buffer image;
        REQUIRE(image.reset(200, 50, 255));
        for (std::size_t x = 0; x < 200; x += 37) {
            image.fill_rect(x, 0, 3, 50, 0);
        }
        CHECK(decode_any(image.view(), symbols));
        CHECK(symbols.empty());
    }

    SUBCASE("rows narrower than min_row_width are skipped") {
        const auto image = ean13_image("4006381333931");
        decode_options options;
        options.min_row_width = 201;
        REQUIRE(decode_any(image.view(), symbols, options));
        CHECK(symbols.empty());
    }

    SUBCASE("output is cleared") {
        symbols.push_back(make_symbol(barcode_format::ean13, "stale", 1.0f));
        gray_buffer image;
        REQUIRE(image.reset(64, 8, 255));
        REQUIRE(decode_any(image.view(), symbols));
        CHECK(symbols.empty());
    }
}

TEST_CASE("Scanner: invalid input") {
    std::vector<decoded_symbol> symbols;
    std::vector<std::uint8_t> pixels(100, 255);

    SUBCASE("buffer size mismatch") {
        auto result = decode_any(gray_image(pixels, 20, 10), symbols);
        CHECK(result.error == decode_error::invalid_input);
    }

    SUBCASE("zero dimension") {
        CHECK(decode_any(gray_image(pixels, 0, 10), symbols).error == decode_error::invalid_input);
        CHECK(decode_any(gray_image(), symbols).error == decode_error::invalid_input);
    }

    SUBCASE("too large") {
        decode_options options;
        options.max_height = 5;
        CHECK(decode_any(gray_image(pixels, 10, 10), symbols, options).error ==
              decode_error::invalid_input);

        // Above the default 16384 limit, still a plain input error
        std::vector<std::uint8_t> wide(16385 * 2, 255);
        CHECK(decode_any(gray_image(wide, 16385, 2), symbols).error == decode_error::invalid_input);
    }

    SUBCASE("options") {
        const gray_image image(pixels, 10, 10);
        decode_options options;

        options.scan_rows = 0;
        CHECK(decode_any(image, symbols, options).error == decode_error::invalid_input);

        options = {};
        options.tolerance = 0.0f;
        CHECK(decode_any(image, symbols, options).error == decode_error::invalid_input);
        options.tolerance = 0.6f;
        CHECK(decode_any(image, symbols, options).error == decode_error::invalid_input);

        options = {};
        options.formats = {};
        CHECK(decode_any(image, symbols, options).error == decode_error::invalid_input);
    }
}

TEST_CASE("Scanner: deduplication") {
    // Two symbols stacked vertically
    const auto top = test_helpers::ean13("4006381333931");
    const auto bottom = test_helpers::ean13("5901234123457");
    gray_buffer image;
    REQUIRE(image.reset(200, 60, 255));
    draw_modules(image, 5, 0, 2, 30, top);
    draw_modules(image, 5, 30, 2, 30, bottom);

    std::vector<decoded_symbol> symbols;

    SUBCASE("one entry per symbol in order of first detection") {
        REQUIRE(decode_any(image.view(), symbols));
        REQUIRE(symbols.size() == 2);
        CHECK(symbols[0].text == "4006381333931");
        CHECK(symbols[1].text == "5901234123457");
        CHECK(*symbols[0].row < 30);
        CHECK(*symbols[1].row >= 30);
    }

    SUBCASE("identical symbols collapse") {
        gray_buffer twin;
        REQUIRE(twin.reset(200, 60, 255));
        draw_modules(twin, 5, 0, 2, 30, top);
        draw_modules(twin, 5, 30, 2, 30, top);
        REQUIRE(decode_any(twin.view(), symbols));
        REQUIRE(symbols.size() == 1);
        CHECK(*symbols[0].row < 30);
    }

    SUBCASE("deterministic") {
        std::vector<decoded_symbol> again;
        REQUIRE(decode_any(image.view(), symbols));
        REQUIRE(decode_any(image.view(), again));
        REQUIRE(symbols.size() == again.size());
        for (std::size_t i = 0; i < symbols.size(); ++i) {
            CHECK(symbols[i].format == again[i].format);
            CHECK(symbols[i].text == again[i].text);
            CHECK(symbols[i].row == again[i].row);
            CHECK(symbols[i].bounds == again[i].bounds);
        }
    }
}

TEST_CASE("Scanner: drop checksum failures") {
    const auto image = ean13_image("4006381333932");
    std::vector<decoded_symbol> symbols;

    REQUIRE(decode_any(image.view(), symbols));
    REQUIRE(symbols.size() == 1);
    CHECK_FALSE(symbols[0].checksum_ok);

    decode_options options;
    options.drop_checksum_failures = true;
    REQUIRE(decode_any(image.view(), symbols, options));
    CHECK(symbols.empty());
}

TEST_CASE("Scanner: area decoders") {
    const auto image = ean13_image("4006381333931");
    std::vector<decoded_symbol> symbols;

    SUBCASE("results are appended") {
        fake_area_decoder qr({make_symbol(barcode_format::qr, "hello", 0.9f)});
        decode_options options;
        options.formats = format_set::all();
        options.area_decoders.push_back(&qr);

        REQUIRE(decode_any(image.view(), symbols, options));
        CHECK(qr.calls == 1);
        CHECK(qr.last_width == 200);
        REQUIRE(symbols.size() == 2);
        CHECK(symbols[0].format == barcode_format::ean13);
        CHECK(symbols[1].format == barcode_format::qr);
        CHECK(symbols[1].text == "hello");
    }

    SUBCASE("skipped when the format is disabled") {
        fake_area_decoder qr({make_symbol(barcode_format::qr, "hello", 0.9f)});
        decode_options options;
        options.area_decoders.push_back(&qr);

        REQUIRE(decode_any(image.view(), symbols, options));
        CHECK(qr.calls == 0);
        CHECK(symbols.size() == 1);
    }

    SUBCASE("failures are contained") {
        fake_area_decoder qr({}, scan_error::no_guard_found);
        decode_options options;
        options.formats = format_set::all();
        options.area_decoders.push_back(&qr);
        options.area_decoders.push_back(nullptr);

        REQUIRE(decode_any(image.view(), symbols, options));
        CHECK(qr.calls == 1);
        CHECK(symbols.size() == 1);
    }

    SUBCASE("duplicates keep position and the higher confidence") {
        auto low = make_symbol(barcode_format::qr, "dup", 0.3f);
        low.row = 7;
        auto high = make_symbol(barcode_format::qr, "dup", 0.8f);
        high.row = 9;
        auto lower = make_symbol(barcode_format::qr, "dup", 0.5f);
        lower.row = 11;
        fake_area_decoder qr({low, make_symbol(barcode_format::qr, "other", 1.0f), high, lower});

        decode_options options;
        options.formats = format_set::all();
        options.area_decoders.push_back(&qr);

        REQUIRE(decode_any(image.view(), symbols, options));
        REQUIRE(symbols.size() == 3);
        CHECK(symbols[1].text == "dup");
        CHECK(*symbols[1].confidence == doctest::Approx(0.8f));
        CHECK(*symbols[1].row == 9);
        CHECK(symbols[2].text == "other");
    }
}

TEST_CASE("Scanner: decode_first") {
    decoded_symbol sym;

    SUBCASE("found") {
        REQUIRE(decode_first(ean13_image("4006381333931").view(), sym));
        CHECK(sym.text == "4006381333931");
    }

    SUBCASE("not found") {
        gray_buffer image;
        REQUIRE(image.reset(100, 20, 255));
        CHECK(decode_first(image.view(), sym).error == decode_error::not_found);
    }

    SUBCASE("invalid input passes through") {
        CHECK(decode_first(gray_image(), sym).error == decode_error::invalid_input);
    }
}

TEST_CASE("Scanner: reuse") {
    scanner reusable;
    std::vector<decoded_symbol> symbols;

    const auto first = ean13_image("4006381333931");
    REQUIRE(reusable.scan(first.view(), symbols));
    REQUIRE(symbols.size() == 1);

    const auto second = draw_symbol(test_helpers::code128("42", code128_set::c), 120, 20, 10, 2);
    REQUIRE(reusable.scan(second.view(), symbols));
    REQUIRE(symbols.size() == 1);
    CHECK(symbols[0].format == barcode_format::code128);
    CHECK(symbols[0].text == "42");
}

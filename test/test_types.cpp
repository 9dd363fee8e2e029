#include <doctest/doctest.h>
#include <ultracode/types.hpp>

#include <string>

using namespace ultracode;

TEST_CASE("Format names: parse") {
    SUBCASE("canonical names") {
        CHECK(format_from_string("ean13") == barcode_format::ean13);
        CHECK(format_from_string("upca") == barcode_format::upca);
        CHECK(format_from_string("code128") == barcode_format::code128);
        CHECK(format_from_string("qr") == barcode_format::qr);
    }

    SUBCASE("display names and separators") {
        CHECK(format_from_string("EAN-13") == barcode_format::ean13);
        CHECK(format_from_string("UPC-A") == barcode_format::upca);
        CHECK(format_from_string("Code128") == barcode_format::code128);
        CHECK(format_from_string("QR Code") == barcode_format::qr);
        CHECK(format_from_string("ean_13") == barcode_format::ean13);
    }

    SUBCASE("unknown") {
        CHECK_FALSE(format_from_string("").has_value());
        CHECK_FALSE(format_from_string("code39").has_value());
        CHECK_FALSE(format_from_string("ean8").has_value());
    }
}

TEST_CASE("Format names: display round trip") {
    for (auto fmt : {barcode_format::ean13, barcode_format::upca,
                     barcode_format::code128, barcode_format::qr}) {
        CAPTURE(to_string(fmt));
        CHECK(format_from_string(to_string(fmt)) == fmt);
    }
}

TEST_CASE("Format set: membership") {
    SUBCASE("default is empty") {
        format_set set;
        CHECK(set.empty());
        CHECK_FALSE(set.contains(barcode_format::ean13));
    }

    SUBCASE("all_linear excludes qr") {
        const auto set = format_set::all_linear();
        CHECK(set.contains(barcode_format::ean13));
        CHECK(set.contains(barcode_format::upca));
        CHECK(set.contains(barcode_format::code128));
        CHECK_FALSE(set.contains(barcode_format::qr));
        CHECK(format_set::all().contains(barcode_format::qr));
    }

    SUBCASE("insert and erase") {
        format_set set = {barcode_format::ean13};
        set.insert(barcode_format::code128);
        CHECK(set.contains(barcode_format::code128));
        set.erase(barcode_format::ean13);
        CHECK_FALSE(set.contains(barcode_format::ean13));
        CHECK(set == format_set{barcode_format::code128});
    }

    SUBCASE("intersects") {
        const format_set ean = {barcode_format::ean13, barcode_format::upca};
        CHECK(ean.intersects(format_set{barcode_format::upca}));
        CHECK_FALSE(ean.intersects(format_set{barcode_format::code128}));
    }
}

TEST_CASE("Errors: names") {
    CHECK(std::string(to_string(decode_error::invalid_input)) == "invalid_input");
    CHECK(std::string(to_string(decode_error::not_found)) == "not_found");
    CHECK(std::string(to_string(scan_error::checksum_mismatch)) == "checksum_mismatch");
    CHECK(std::string(to_string(scan_error::no_guard_found)) == "no_guard_found");
}

TEST_CASE("Decode result: factories") {
    const auto ok = decode_result::success();
    CHECK(ok);
    CHECK(ok.error == decode_error::none);

    const auto bad = decode_result::failure(decode_error::invalid_input, "bad");
    CHECK_FALSE(bad);
    CHECK(bad.error == decode_error::invalid_input);
    CHECK(bad.message == "bad");
}

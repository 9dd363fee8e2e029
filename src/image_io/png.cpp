#include "io_helpers.hpp"
#include <lodepng.h>

#include <limits>
#include <string>

namespace ultracode {

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

// IHDR follows the signature: length, type, width, height (big-endian)
constexpr std::size_t PNG_IHDR_LENGTH_OFFSET = 8;
constexpr std::size_t PNG_IHDR_TYPE_OFFSET = 12;
constexpr std::size_t PNG_IHDR_WIDTH_OFFSET = 16;
constexpr std::size_t PNG_IHDR_HEIGHT_OFFSET = 20;
constexpr std::size_t PNG_MIN_SIZE_FOR_DIMENSIONS = 24;
constexpr std::uint32_t PNG_IHDR_TYPE = 0x49484452;  // "IHDR"
constexpr std::uint32_t PNG_IHDR_LENGTH = 13;

} // namespace

bool png_loader::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }
    for (std::size_t i = 0; i < PNG_SIGNATURE_SIZE; ++i) {
        if (data[i] != PNG_SIGNATURE[i]) {
            return false;
        }
    }
    return true;
}

decode_result png_loader::load(std::span<const std::uint8_t> data,
                               gray_buffer& buffer,
                               const load_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::invalid_format, "Not a valid PNG file");
    }

    // Reject oversized images before lodepng allocates for them
    if (data.size() >= PNG_MIN_SIZE_FOR_DIMENSIONS &&
        read_be32(data.data() + PNG_IHDR_LENGTH_OFFSET) == PNG_IHDR_LENGTH &&
        read_be32(data.data() + PNG_IHDR_TYPE_OFFSET) == PNG_IHDR_TYPE) {
        const std::uint32_t ihdr_width = read_be32(data.data() + PNG_IHDR_WIDTH_OFFSET);
        const std::uint32_t ihdr_height = read_be32(data.data() + PNG_IHDR_HEIGHT_OFFSET);
        auto result = validate_dimensions(ihdr_width, ihdr_height, options);
        if (!result) return result;
    }

    unsigned width = 0;
    unsigned height = 0;
    std::vector<std::uint8_t> pixels;

    // lodepng cannot reduce colour to gray itself; decode as RGB and take luma
    unsigned error = lodepng::decode(pixels, width, height, data.data(), data.size(), LCT_RGB, 8);
    if (error) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    auto result = validate_dimensions(width, height, options);
    if (!result) return result;

    if (!buffer.reset(width, height)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate image");
    }
    write_luma_rows(buffer, pixels.data(), 3);

    return decode_result::success();
}

decode_result write_png(const gray_image& image, std::vector<std::uint8_t>& out) {
    out.clear();
    auto result = image.validate();
    if (!result) return result;

    constexpr auto max_unsigned = static_cast<std::size_t>(std::numeric_limits<unsigned>::max());
    if (image.width() > max_unsigned || image.height() > max_unsigned) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image too large for PNG");
    }

    const auto pixels = image.pixels();
    unsigned error = lodepng::encode(out, pixels.data(),
                                     static_cast<unsigned>(image.width()),
                                     static_cast<unsigned>(image.height()),
                                     LCT_GREY, 8);
    if (error) {
        out.clear();
        return decode_result::failure(decode_error::internal_error,
            std::string("PNG encode error: ") + lodepng_error_text(error));
    }
    return decode_result::success();
}

} // namespace ultracode

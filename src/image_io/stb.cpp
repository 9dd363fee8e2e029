// stb_image-based loaders for JPEG, BMP, GIF, TGA

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_PNG  // lodepng handles PNG
#define STBI_NO_PSD
#define STBI_NO_HDR
#define STBI_NO_PIC
#define STBI_NO_PNM  // own parser
#define STBI_NO_STDIO

#include <stb_image.h>

#include "io_helpers.hpp"

#include <limits>
#include <memory>

namespace ultracode {

namespace {

bool fits_stb(std::span<const std::uint8_t> data) noexcept {
    // stb uses int for the length
    return data.size() <= static_cast<std::size_t>(std::numeric_limits<int>::max());
}

} // namespace

bool stb_loader::sniff(std::span<const std::uint8_t> data) noexcept {
    int width = 0;
    int height = 0;
    int channels = 0;
    return !data.empty() && fits_stb(data) &&
           stbi_info_from_memory(data.data(), static_cast<int>(data.size()),
                                 &width, &height, &channels) != 0;
}

decode_result stb_loader::load(std::span<const std::uint8_t> data,
                               gray_buffer& buffer,
                               const load_options& options) {
    if (!fits_stb(data)) {
        return decode_result::failure(decode_error::truncated_data,
            "Input data exceeds maximum supported size");
    }

    int info_width = 0;
    int info_height = 0;
    int info_channels = 0;
    if (!stbi_info_from_memory(data.data(), static_cast<int>(data.size()),
                               &info_width, &info_height, &info_channels)) {
        return decode_result::failure(decode_error::invalid_format, stbi_failure_reason());
    }
    if (info_width <= 0 || info_height <= 0) {
        return decode_result::failure(decode_error::invalid_format, "Image has a zero dimension");
    }
    auto result = validate_dimensions(static_cast<std::size_t>(info_width),
                                      static_cast<std::size_t>(info_height), options);
    if (!result) return result;

    int width = 0;
    int height = 0;
    int channels = 0;

    // RGB output; the luma weights are applied here rather than by stb
    constexpr int desired_channels = 3;

    stbi_uc* pixels = stbi_load_from_memory(data.data(), static_cast<int>(data.size()),
                                            &width, &height, &channels, desired_channels);
    if (!pixels) {
        return decode_result::failure(decode_error::invalid_format, stbi_failure_reason());
    }
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> pixel_guard(pixels, stbi_image_free);

    if (width != info_width || height != info_height) {
        return decode_result::failure(decode_error::invalid_format, "Image size changed while decoding");
    }

    if (!buffer.reset(static_cast<std::size_t>(width), static_cast<std::size_t>(height))) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate image");
    }
    write_luma_rows(buffer, pixels, desired_channels);

    return decode_result::success();
}

} // namespace ultracode

#pragma once

#include <ultracode/types.hpp>
#include <ultracode/gray_image.hpp>
#include <ultracode/image_io.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace ultracode {

// Big-endian readers
inline std::uint16_t read_be16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

inline std::uint32_t read_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

// ITU-R BT.601 luma
inline std::uint8_t luma(unsigned r, unsigned g, unsigned b) noexcept {
    return static_cast<std::uint8_t>((299 * r + 587 * g + 114 * b) / 1000);
}

// Validate dimensions against limits, returning failure result if exceeded
inline decode_result validate_dimensions(std::size_t width, std::size_t height,
                                         const load_options& options) {
    if (width == 0 || height == 0) {
        return decode_result::failure(decode_error::invalid_format, "Image has a zero dimension");
    }
    if (width > options.max_width || height > options.max_height) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image dimensions exceed limits");
    }
    return decode_result::success();
}

// Reduce packed RGB/RGBA rows to gray
inline void write_luma_rows(gray_buffer& buffer, const std::uint8_t* data, std::size_t channels) {
    auto dst = buffer.mutable_pixels();
    for (std::size_t i = 0; i < dst.size(); ++i) {
        const std::uint8_t* px = data + i * channels;
        dst[i] = luma(px[0], px[1], px[2]);
    }
}

// ============================================================================
// Loaders
// ============================================================================
//
// Each loader is a static class: name, sniff() on the leading bytes and
// load() into a gray buffer. image_io.cpp binds them in a fixed table.

class pnm_loader {
public:
    static constexpr std::string_view name = "pnm";
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static decode_result load(std::span<const std::uint8_t> data,
                                            gray_buffer& buffer,
                                            const load_options& options);
};

class png_loader {
public:
    static constexpr std::string_view name = "png";
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static decode_result load(std::span<const std::uint8_t> data,
                                            gray_buffer& buffer,
                                            const load_options& options);
};

// JPEG, BMP, GIF and TGA; stb_image decides whether it accepts the data
class stb_loader {
public:
    static constexpr std::string_view name = "stb";
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static decode_result load(std::span<const std::uint8_t> data,
                                            gray_buffer& buffer,
                                            const load_options& options);
};

// lodepng-backed PNG writer
[[nodiscard]] decode_result write_png(const gray_image& image, std::vector<std::uint8_t>& out);

} // namespace ultracode

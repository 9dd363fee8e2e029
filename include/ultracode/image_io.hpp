#ifndef ULTRACODE_IMAGE_IO_HPP_
#define ULTRACODE_IMAGE_IO_HPP_

#include <ultracode/ultracode_image_io_export.h>
#include <ultracode/types.hpp>
#include <ultracode/gray_image.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace ultracode {

// ============================================================================
// Image Loading
// ============================================================================

struct load_options {
    std::size_t max_width = 16384;
    std::size_t max_height = 16384;
};

/**
 * Name of the loader that would accept data: "pnm", "png", or "stb" for the
 * JPEG, BMP, GIF and TGA files stb_image reads. Empty if none does.
 */
[[nodiscard]] ULTRACODE_IMAGE_IO_EXPORT std::string_view sniff_image_format(std::span<const std::uint8_t> data) noexcept;

/**
 * Decode an image file held in memory into 8-bit gray.
 * Colour input is reduced to luma (299 R + 587 G + 114 B) / 1000; alpha is
 * ignored.
 *
 * @return invalid_format if no loader recognises the data,
 *         dimensions_exceeded above the limits, truncated_data for short
 *         pixel data
 */
[[nodiscard]] ULTRACODE_IMAGE_IO_EXPORT decode_result load_gray_image(std::span<const std::uint8_t> data,
                                                             gray_buffer& buffer,
                                                             const load_options& options = {});

/**
 * Read a file and decode it with load_gray_image().
 * @return io_error if the file cannot be read
 */
[[nodiscard]] ULTRACODE_IMAGE_IO_EXPORT decode_result load_gray_image_file(const std::filesystem::path& path,
                                                                  gray_buffer& buffer,
                                                                  const load_options& options = {});

// ============================================================================
// Image Saving
// ============================================================================

// Binary PGM (P5, maxval 255)
[[nodiscard]] ULTRACODE_IMAGE_IO_EXPORT decode_result encode_pgm(const gray_image& image,
                                                        std::vector<std::uint8_t>& out);

// 8-bit grayscale PNG
[[nodiscard]] ULTRACODE_IMAGE_IO_EXPORT decode_result encode_png(const gray_image& image,
                                                        std::vector<std::uint8_t>& out);

/**
 * Write image to path: PNG for a ".png" extension, PGM otherwise.
 * @return io_error if the file cannot be written
 */
[[nodiscard]] ULTRACODE_IMAGE_IO_EXPORT decode_result save_gray_image(const std::filesystem::path& path,
                                                             const gray_image& image);

} // namespace ultracode

#endif // ULTRACODE_IMAGE_IO_HPP_

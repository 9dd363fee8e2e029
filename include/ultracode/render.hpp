#ifndef ULTRACODE_RENDER_HPP_
#define ULTRACODE_RENDER_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>
#include <ultracode/gray_image.hpp>
#include <ultracode/symbologies/code128.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace ultracode {

// ============================================================================
// Module Sequences
// ============================================================================
//
// A module sequence lists element widths in modules, alternating bar and
// space and starting with a bar. Quiet zones are not included.

/**
 * EAN-13 module sequence.
 * @param text 12 digits (check digit computed) or 13 digits (used as given,
 *             even if the check digit is wrong)
 * @param modules Receives 59 widths
 * @return invalid_input on a wrong length or a non-digit
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result ean13_modules(std::string_view text,
                                                           std::vector<std::uint8_t>& modules);

/**
 * UPC-A module sequence (EAN-13 with a leading zero).
 * @param text 11 digits (check digit computed) or 12 digits
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result upca_modules(std::string_view text,
                                                          std::vector<std::uint8_t>& modules);

/**
 * Code 128 module sequence in a single code set.
 * @param text Set A: ASCII 0-95; set B: ASCII 32-127; set C: an even number
 *             of digits
 * @return invalid_input on characters the set cannot encode
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result code128_modules(std::string_view text,
                                                             code128_set set,
                                                             std::vector<std::uint8_t>& modules);

// ============================================================================
// Rasterization
// ============================================================================

struct render_options {
    std::size_t module_width = 2;     // pixels per module
    std::size_t height = 50;          // image height
    std::size_t bar_height = 0;       // 0 = 60% of height, vertically centred
    std::size_t quiet_zone = 10;      // modules on each side
    std::uint8_t bar_value = 0;
    std::uint8_t space_value = 255;
};

/**
 * Paint a module sequence into an existing buffer.
 * Bars are filled with bar_value; spaces are left untouched. Pixels outside
 * the buffer are clipped.
 *
 * @return Width of the symbol in pixels
 */
ULTRACODE_EXPORT std::size_t draw_modules(gray_buffer& buffer,
                                          std::size_t x,
                                          std::size_t y,
                                          std::size_t module_width,
                                          std::size_t bar_height,
                                          std::span<const std::uint8_t> modules,
                                          std::uint8_t bar_value = 0);

/**
 * Allocate a canvas sized for the symbol plus quiet zones and draw it.
 * @return invalid_input for an empty sequence or zero module width/height,
 *         internal_error if the canvas cannot be allocated
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result render_symbol(std::span<const std::uint8_t> modules,
                                                           gray_buffer& buffer,
                                                           const render_options& options = {});

} // namespace ultracode

#endif // ULTRACODE_RENDER_HPP_

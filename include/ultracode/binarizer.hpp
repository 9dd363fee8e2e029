#ifndef ULTRACODE_BINARIZER_HPP_
#define ULTRACODE_BINARIZER_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ultracode {

// ============================================================================
// Scratch Storage
// ============================================================================

/**
 * Reusable per-scanline working storage.
 * Grows to the widest row seen and is then reused, so scanning further rows
 * does not allocate. Owned by exactly one scanner; never share an instance
 * between threads.
 */
struct scanline_buffers {
    std::vector<std::uint32_t> prefix;   // prefix sums for the adaptive window
    std::vector<std::uint8_t> bits;      // 1 = bar, 0 = space
    std::vector<run> runs;
    std::vector<run> reversed;

    void reserve(std::size_t width) {
        prefix.reserve(width + 1);
        bits.reserve(width);
        runs.reserve(width);
        reversed.reserve(width);
    }
};

// ============================================================================
// Binarizer
// ============================================================================

// Adaptive window bias: a pixel must be this much darker than the local mean
constexpr int ADAPTIVE_BIAS = 5;

/**
 * Global row threshold: the average of the row mean and the midpoint of the
 * row's minimum and maximum intensity.
 */
[[nodiscard]] ULTRACODE_EXPORT std::uint8_t global_threshold(std::span<const std::uint8_t> row) noexcept;

/**
 * Half-width of the adaptive window for a row of the given width:
 * width / 32 clamped to [8, 64].
 */
[[nodiscard]] constexpr std::size_t adaptive_window(std::size_t width) noexcept {
    const std::size_t win = width / 32;
    return win < 8 ? 8 : (win > 64 ? 64 : win);
}

/**
 * Classify every pixel of row as bar (1) or space (0).
 *
 * @param row Row pixels
 * @param mode global or adaptive (hybrid is treated as adaptive here; the
 *             scanner handles the fallback)
 * @param buffers Scratch storage; the result lands in buffers.bits
 * @param min_contrast Minimum max - min intensity for a usable row
 * @return no_signal if the row is empty or flat, none otherwise
 */
[[nodiscard]] ULTRACODE_EXPORT scan_error binarize_row(std::span<const std::uint8_t> row,
                                                       binarize_mode mode,
                                                       scanline_buffers& buffers,
                                                       int min_contrast = 16);

// ============================================================================
// Run-Length Extractor
// ============================================================================

/**
 * Collapse classified pixels into alternating runs.
 * @param bits One entry per pixel, non-zero = bar
 * @param out Receives the runs (cleared first)
 */
ULTRACODE_EXPORT void extract_runs(std::span<const std::uint8_t> bits, std::vector<run>& out);

/**
 * Copy runs in reverse order (right-to-left reading).
 */
ULTRACODE_EXPORT void reverse_runs(std::span<const run> runs, std::vector<run>& out);

} // namespace ultracode

#endif // ULTRACODE_BINARIZER_HPP_

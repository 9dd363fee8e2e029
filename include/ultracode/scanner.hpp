#ifndef ULTRACODE_SCANNER_HPP_
#define ULTRACODE_SCANNER_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>
#include <ultracode/gray_image.hpp>
#include <ultracode/binarizer.hpp>
#include <ultracode/sampler.hpp>

#include <vector>

namespace ultracode {

// ============================================================================
// Scanner
// ============================================================================

/**
 * Scan orchestrator with reusable scratch buffers.
 *
 * A scanner keeps its row list and scanline_buffers between calls, so a
 * worker decoding a stream of frames allocates only while the buffers grow.
 * One instance must not be used from two threads at once; give each worker
 * its own.
 */
class ULTRACODE_EXPORT scanner {
public:
    scanner() = default;

    scanner(const scanner&) = delete;
    scanner& operator=(const scanner&) = delete;
    scanner(scanner&&) noexcept = default;
    scanner& operator=(scanner&&) noexcept = default;

    /**
     * Decode every symbol visible on the sampled rows.
     *
     * For each sampled row, each binarization (adaptive then global in hybrid
     * mode) and each enabled matcher not yet satisfied on that row, the runs
     * are matched left to right and, if enabled, right to left. Area decoders
     * run once afterwards. Results with equal format and text are merged:
     * the entry keeps its first position and the higher confidence.
     *
     * @param image Source image
     * @param out Receives the symbols in order of first detection (cleared)
     * @param options Decode options
     * @return invalid_input for a bad image or options;
     *         success otherwise, even if nothing was found
     */
    [[nodiscard]] decode_result scan(const gray_image& image,
                                     std::vector<decoded_symbol>& out,
                                     const decode_options& options = {});

private:
    row_sampler sampler_;
    scanline_buffers buffers_;
};

// ============================================================================
// Convenience Decode Functions
// ============================================================================

/**
 * Decode all symbols in an image with a call-local scanner.
 * Pure: no state survives the call.
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result decode_any(const gray_image& image,
                                                        std::vector<decoded_symbol>& out,
                                                        const decode_options& options = {});

/**
 * Decode an image and return the first symbol found.
 * @return not_found if the image holds no decodable symbol
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result decode_first(const gray_image& image,
                                                          decoded_symbol& out,
                                                          const decode_options& options = {});

/**
 * Check decode options on their own.
 * @return invalid_input for zero scan_rows, a tolerance outside (0, 0.5),
 *         or no enabled format
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result validate_options(const decode_options& options);

} // namespace ultracode

#endif // ULTRACODE_SCANNER_HPP_

#ifndef ULTRACODE_SAMPLER_HPP_
#define ULTRACODE_SAMPLER_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>
#include <ultracode/gray_image.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ultracode {

// ============================================================================
// Row Sampler
// ============================================================================

/**
 * Compute evenly spaced scanline indices.
 * The image is split into n = min(scan_rows, height) equal horizontal bands
 * and the centre row of each band is taken, so the first and last rows are
 * never sampled and spacing is height / n.
 *
 * @param height Image height in pixels
 * @param scan_rows Requested number of rows
 * @param out Receives strictly increasing row indices (cleared first)
 * @return invalid_input if height or scan_rows is zero
 */
[[nodiscard]] ULTRACODE_EXPORT decode_result sample_rows(std::size_t height,
                                                         std::size_t scan_rows,
                                                         std::vector<std::size_t>& out);

/**
 * Scanline view over a validated image.
 */
class ULTRACODE_EXPORT row_sampler {
public:
    row_sampler() = default;

    /**
     * Prepare the sampled rows of image.
     * @return invalid_input if width, height or scan_rows is zero
     */
    [[nodiscard]] decode_result reset(const gray_image& image, std::size_t scan_rows);

    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }

    [[nodiscard]] std::size_t row_index(std::size_t i) const noexcept { return rows_[i]; }

    // Pixels of the i-th sampled row, no copy
    [[nodiscard]] std::span<const std::uint8_t> row(std::size_t i) const noexcept {
        return image_.row(rows_[i]);
    }

private:
    gray_image image_;
    std::vector<std::size_t> rows_;
};

} // namespace ultracode

#endif // ULTRACODE_SAMPLER_HPP_

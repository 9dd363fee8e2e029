#ifndef ULTRACODE_AREA_DECODER_HPP_
#define ULTRACODE_AREA_DECODER_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>
#include <ultracode/gray_image.hpp>

#include <string_view>
#include <vector>

namespace ultracode {

// ============================================================================
// Area Decoder Interface
// ============================================================================

/**
 * Abstract base class for decoders that need the whole image rather than
 * single scanlines (QR and other finder-pattern symbologies).
 *
 * The scanner calls decode() once per decode_any() for every decoder listed
 * in decode_options::area_decoders whose format() is enabled. Symbols are
 * appended to out and deduplicated together with the linear results; a
 * non-none return value is treated like a failed match attempt.
 *
 * Implementations must not keep mutable state between calls.
 */
class ULTRACODE_EXPORT area_decoder {
public:
    virtual ~area_decoder() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual barcode_format format() const noexcept = 0;

    [[nodiscard]] virtual scan_error decode(const gray_image& image,
                                            const decode_options& options,
                                            std::vector<decoded_symbol>& out) const = 0;
};

} // namespace ultracode

#endif // ULTRACODE_AREA_DECODER_HPP_

#ifndef ULTRACODE_SYMBOLOGIES_EAN13_HPP_
#define ULTRACODE_SYMBOLOGIES_EAN13_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>
#include <ultracode/matcher.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace ultracode {

// ============================================================================
// EAN-13 / UPC-A Matcher
// ============================================================================

class ULTRACODE_EXPORT ean13_matcher {
public:
    static constexpr std::string_view name = "ean13";
    static constexpr format_set formats = {barcode_format::ean13, barcode_format::upca};

    // Module widths of one digit (bar/space alternation starts with a space
    // on the left half and with a bar on the right half)
    using digit_pattern = std::array<std::uint8_t, 4>;

    // L (odd parity) set; R has the same widths with colours inverted
    static constexpr std::array<digit_pattern, 10> l_patterns = {{
        {3, 2, 1, 1}, {2, 2, 2, 1}, {2, 1, 2, 2}, {1, 4, 1, 1}, {1, 1, 3, 2},
        {1, 2, 3, 1}, {1, 1, 1, 4}, {1, 3, 1, 2}, {1, 2, 1, 3}, {3, 1, 1, 2},
    }};

    // G (even parity) set: L widths reversed
    static constexpr std::array<digit_pattern, 10> g_patterns = {{
        {1, 1, 2, 3}, {1, 2, 2, 2}, {2, 2, 1, 2}, {1, 1, 4, 1}, {2, 3, 1, 1},
        {1, 3, 2, 1}, {4, 1, 1, 1}, {2, 1, 3, 1}, {3, 1, 2, 1}, {2, 1, 1, 3},
    }};

    // Parity of the six left digits per leading digit, bit 5 = first digit,
    // set bit = G
    static constexpr std::array<std::uint8_t, 10> first_digit_parity = {
        0x00, 0x0B, 0x0D, 0x0E, 0x13, 0x19, 0x1C, 0x15, 0x16, 0x1A,
    };

    static constexpr std::size_t guard_runs = 3;
    static constexpr std::size_t middle_guard_runs = 5;
    static constexpr std::size_t digit_runs = 4;

    // 3 + 6*4 + 5 + 6*4 + 3
    static constexpr std::size_t symbol_runs = 59;

    /**
     * Decode one EAN-13 or UPC-A symbol from a run sequence.
     *
     * Every bar triple matching the 1:1:1 start guard is tried in order until
     * one decodes. A leading zero is reported as UPC-A (12 digits) when
     * options.formats contains upca.
     *
     * @param runs Alternating runs of one scanline
     * @param options tolerance, formats and drop_checksum_failures are used
     * @return The symbol, or the error of the attempt that got furthest
     */
    [[nodiscard]] static match_result match(std::span<const run> runs,
                                            const decode_options& options);

    /**
     * EAN-13 check digit of the first 12 digits (weights 1, 3, 1, 3, ...).
     * @param digits Values 0-9; only the first 12 are read
     */
    [[nodiscard]] static std::uint8_t check_digit(std::span<const std::uint8_t> digits) noexcept;
};

} // namespace ultracode

#endif // ULTRACODE_SYMBOLOGIES_EAN13_HPP_

#ifndef ULTRACODE_SYMBOLOGIES_CODE128_HPP_
#define ULTRACODE_SYMBOLOGIES_CODE128_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>
#include <ultracode/matcher.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ultracode {

// ============================================================================
// Code 128 Matcher
// ============================================================================

enum class code128_set : std::uint8_t {
    a,  // ASCII 0-95
    b,  // ASCII 32-127
    c   // digit pairs
};

class ULTRACODE_EXPORT code128_matcher {
public:
    static constexpr std::string_view name = "code128";
    static constexpr format_set formats = {barcode_format::code128};

    using symbol_pattern = std::array<std::uint8_t, 6>;

    // Element widths (bar first, 11 modules) of values 0-105
    static constexpr std::array<symbol_pattern, 106> patterns = {{
        {2, 1, 2, 2, 2, 2}, {2, 2, 2, 1, 2, 2}, {2, 2, 2, 2, 2, 1}, {1, 2, 1, 2, 2, 3}, {1, 2, 1, 3, 2, 2},  // 0
        {1, 3, 1, 2, 2, 2}, {1, 2, 2, 2, 1, 3}, {1, 2, 2, 3, 1, 2}, {1, 3, 2, 2, 1, 2}, {2, 2, 1, 2, 1, 3},  // 5
        {2, 2, 1, 3, 1, 2}, {2, 3, 1, 2, 1, 2}, {1, 1, 2, 2, 3, 2}, {1, 2, 2, 1, 3, 2}, {1, 2, 2, 2, 3, 1},  // 10
        {1, 1, 3, 2, 2, 2}, {1, 2, 3, 1, 2, 2}, {1, 2, 3, 2, 2, 1}, {2, 2, 3, 2, 1, 1}, {2, 2, 1, 1, 3, 2},  // 15
        {2, 2, 1, 2, 3, 1}, {2, 1, 3, 2, 1, 2}, {2, 2, 3, 1, 1, 2}, {3, 1, 2, 1, 3, 1}, {3, 1, 1, 2, 2, 2},  // 20
        {3, 2, 1, 1, 2, 2}, {3, 2, 1, 2, 2, 1}, {3, 1, 2, 2, 1, 2}, {3, 2, 2, 1, 1, 2}, {3, 2, 2, 2, 1, 1},  // 25
        {2, 1, 2, 1, 2, 3}, {2, 1, 2, 3, 2, 1}, {2, 3, 2, 1, 2, 1}, {1, 1, 1, 3, 2, 3}, {1, 3, 1, 1, 2, 3},  // 30
        {1, 3, 1, 3, 2, 1}, {1, 1, 2, 3, 1, 3}, {1, 3, 2, 1, 1, 3}, {1, 3, 2, 3, 1, 1}, {2, 1, 1, 3, 1, 3},  // 35
        {2, 3, 1, 1, 1, 3}, {2, 3, 1, 3, 1, 1}, {1, 1, 2, 1, 3, 3}, {1, 1, 2, 3, 3, 1}, {1, 3, 2, 1, 3, 1},  // 40
        {1, 1, 3, 1, 2, 3}, {1, 1, 3, 3, 2, 1}, {1, 3, 3, 1, 2, 1}, {3, 1, 3, 1, 2, 1}, {2, 1, 1, 3, 3, 1},  // 45
        {2, 3, 1, 1, 3, 1}, {2, 1, 3, 1, 1, 3}, {2, 1, 3, 3, 1, 1}, {2, 1, 3, 1, 3, 1}, {3, 1, 1, 1, 2, 3},  // 50
        {3, 1, 1, 3, 2, 1}, {3, 3, 1, 1, 2, 1}, {3, 1, 2, 1, 1, 3}, {3, 1, 2, 3, 1, 1}, {3, 3, 2, 1, 1, 1},  // 55
        {3, 1, 4, 1, 1, 1}, {2, 2, 1, 4, 1, 1}, {4, 3, 1, 1, 1, 1}, {1, 1, 1, 2, 2, 4}, {1, 1, 1, 4, 2, 2},  // 60
        {1, 2, 1, 1, 2, 4}, {1, 2, 1, 4, 2, 1}, {1, 4, 1, 1, 2, 2}, {1, 4, 1, 2, 2, 1}, {1, 1, 2, 2, 1, 4},  // 65
        {1, 1, 2, 4, 1, 2}, {1, 2, 2, 1, 1, 4}, {1, 2, 2, 4, 1, 1}, {1, 4, 2, 1, 1, 2}, {1, 4, 2, 2, 1, 1},  // 70
        {2, 4, 1, 2, 1, 1}, {2, 2, 1, 1, 1, 4}, {4, 1, 3, 1, 1, 1}, {2, 4, 1, 1, 1, 2}, {1, 3, 4, 1, 1, 1},  // 75
        {1, 1, 1, 2, 4, 2}, {1, 2, 1, 1, 4, 2}, {1, 2, 1, 2, 4, 1}, {1, 1, 4, 2, 1, 2}, {1, 2, 4, 1, 1, 2},  // 80
        {1, 2, 4, 2, 1, 1}, {4, 1, 1, 2, 1, 2}, {4, 2, 1, 1, 1, 2}, {4, 2, 1, 2, 1, 1}, {2, 1, 2, 1, 4, 1},  // 85
        {2, 1, 4, 1, 2, 1}, {4, 1, 2, 1, 2, 1}, {1, 1, 1, 1, 4, 3}, {1, 1, 1, 3, 4, 1}, {1, 3, 1, 1, 4, 1},  // 90
        {1, 1, 4, 1, 1, 3}, {1, 1, 4, 3, 1, 1}, {4, 1, 1, 1, 1, 3}, {4, 1, 1, 3, 1, 1}, {1, 1, 3, 1, 4, 1},  // 95
        {1, 1, 4, 1, 3, 1}, {3, 1, 1, 1, 4, 1}, {4, 1, 1, 1, 3, 1}, {2, 1, 1, 4, 1, 2}, {2, 1, 1, 2, 1, 4},  // 100
        {2, 1, 1, 2, 3, 2},  // 105
    }};

    // Stop pattern: 7 elements, 13 modules
    static constexpr std::array<std::uint8_t, 7> stop_pattern = {2, 3, 3, 1, 1, 1, 2};

    static constexpr std::uint8_t start_a = 103;
    static constexpr std::uint8_t start_b = 104;
    static constexpr std::uint8_t start_c = 105;

    static constexpr std::uint8_t fnc3 = 96;
    static constexpr std::uint8_t fnc2 = 97;
    static constexpr std::uint8_t shift = 98;
    static constexpr std::uint8_t code_c = 99;
    static constexpr std::uint8_t code_b = 100;   // FNC4 in set B
    static constexpr std::uint8_t code_a = 101;   // FNC4 in set A
    static constexpr std::uint8_t fnc1 = 102;

    // ASCII GS, emitted for FNC1
    static constexpr char group_separator = 29;

    static constexpr std::size_t symbol_runs = 6;
    static constexpr std::size_t stop_runs = 7;

    /**
     * Decode one Code 128 symbol from a run sequence.
     *
     * Looks for a Start A/B/C character, decodes symbol characters until the
     * stop pattern, verifies the mod 103 check character and translates the
     * values through code sets A, B and C (CODE x switches, SHIFT, FNC1 as
     * ASCII GS; FNC2-FNC4 are dropped).
     *
     * @param runs Alternating runs of one scanline
     * @param options tolerance, formats and drop_checksum_failures are used
     * @return The symbol, or the error of the attempt that got furthest
     */
    [[nodiscard]] static match_result match(std::span<const run> runs,
                                            const decode_options& options);

    /**
     * Mod 103 check value of a start value followed by data values.
     */
    [[nodiscard]] static std::uint8_t checksum(std::span<const std::uint8_t> values) noexcept;

    /**
     * Translate data values (without start, check and stop) to text.
     * @return false on a value that is not valid in the active code set
     */
    [[nodiscard]] static bool values_to_text(std::span<const std::uint8_t> values,
                                             code128_set start_set,
                                             std::string& out);
};

} // namespace ultracode

#endif // ULTRACODE_SYMBOLOGIES_CODE128_HPP_

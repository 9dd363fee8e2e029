#include <ultracode/symbologies/ean13.hpp>
#include "module_helpers.hpp"

#include <array>
#include <string>
#include <utility>

namespace ultracode {

namespace {

constexpr std::size_t DIGITS_PER_HALF = 6;
constexpr int DIGIT_MODULES = 7;
constexpr int MIDDLE_GUARD_MODULES = 5;

// Look up a digit pattern in a table; -1 if absent
int find_pattern(const ean13_matcher::digit_pattern& pattern,
                 const std::array<ean13_matcher::digit_pattern, 10>& table) noexcept {
    for (std::size_t d = 0; d < table.size(); ++d) {
        if (table[d] == pattern) {
            return static_cast<int>(d);
        }
    }
    return -1;
}

// Read the 4 runs of one digit as module counts using the current unit
bool read_digit_pattern(std::span<const run> runs, std::size_t first, float unit,
                        float tolerance, ean13_matcher::digit_pattern& pattern,
                        float& deviation) noexcept {
    if (first + ean13_matcher::digit_runs > runs.size()) {
        return false;
    }
    for (std::size_t k = 0; k < ean13_matcher::digit_runs; ++k) {
        int modules = 0;
        if (!to_modules(runs[first + k].length, unit, tolerance,
                        MAX_ELEMENT_MODULES, modules, deviation)) {
            return false;
        }
        pattern[k] = static_cast<std::uint8_t>(modules);
    }
    return true;
}

// Decode a full symbol whose start guard begins at run index start
match_result decode_at(std::span<const run> runs, std::size_t start, float unit,
                       float guard_deviation, const decode_options& options) {
    const float tolerance = options.tolerance;
    float max_deviation = guard_deviation;

    std::array<std::uint8_t, 13> digits{};
    unsigned parity = 0;
    std::size_t idx = start + ean13_matcher::guard_runs;

    // Left half: L or G patterns, parity encodes the leading digit
    for (std::size_t d = 0; d < DIGITS_PER_HALF; ++d) {
        ean13_matcher::digit_pattern pattern{};
        if (!read_digit_pattern(runs, idx, unit, tolerance, pattern, max_deviation)) {
            return match_result::failure(scan_error::digit_decode_failure, idx - start);
        }

        int digit = find_pattern(pattern, ean13_matcher::l_patterns);
        parity <<= 1;
        if (digit < 0) {
            digit = find_pattern(pattern, ean13_matcher::g_patterns);
            parity |= 1u;
        }
        if (digit < 0) {
            return match_result::failure(scan_error::digit_decode_failure, idx - start);
        }

        digits[1 + d] = static_cast<std::uint8_t>(digit);
        unit = static_cast<float>(total_length(runs, idx, ean13_matcher::digit_runs)) /
               static_cast<float>(DIGIT_MODULES);
        idx += ean13_matcher::digit_runs;
    }

    if (!is_unit_guard(runs, idx, ean13_matcher::middle_guard_runs, polarity::space,
                       unit, tolerance, max_deviation)) {
        return match_result::failure(scan_error::middle_guard_mismatch, idx - start);
    }
    unit = static_cast<float>(total_length(runs, idx, ean13_matcher::middle_guard_runs)) /
           static_cast<float>(MIDDLE_GUARD_MODULES);
    idx += ean13_matcher::middle_guard_runs;

    // Right half: R patterns only
    for (std::size_t d = 0; d < DIGITS_PER_HALF; ++d) {
        ean13_matcher::digit_pattern pattern{};
        if (!read_digit_pattern(runs, idx, unit, tolerance, pattern, max_deviation)) {
            return match_result::failure(scan_error::digit_decode_failure, idx - start);
        }

        const int digit = find_pattern(pattern, ean13_matcher::l_patterns);
        if (digit < 0) {
            return match_result::failure(scan_error::digit_decode_failure, idx - start);
        }

        digits[7 + d] = static_cast<std::uint8_t>(digit);
        unit = static_cast<float>(total_length(runs, idx, ean13_matcher::digit_runs)) /
               static_cast<float>(DIGIT_MODULES);
        idx += ean13_matcher::digit_runs;
    }

    if (!is_unit_guard(runs, idx, ean13_matcher::guard_runs, polarity::bar,
                       unit, tolerance, max_deviation)) {
        return match_result::failure(scan_error::end_guard_mismatch, idx - start);
    }
    idx += ean13_matcher::guard_runs;

    int first = -1;
    for (std::size_t d = 0; d < ean13_matcher::first_digit_parity.size(); ++d) {
        if (ean13_matcher::first_digit_parity[d] == parity) {
            first = static_cast<int>(d);
            break;
        }
    }
    if (first < 0) {
        return match_result::failure(scan_error::digit_decode_failure, idx - start);
    }
    digits[0] = static_cast<std::uint8_t>(first);

    const bool checksum_ok = ean13_matcher::check_digit(digits) == digits[12];
    if (!checksum_ok && options.drop_checksum_failures) {
        return match_result::failure(scan_error::checksum_mismatch, idx - start);
    }

    decoded_symbol sym;
    std::size_t text_begin = 0;
    if (digits[0] == 0 && options.formats.contains(barcode_format::upca)) {
        sym.format = barcode_format::upca;
        text_begin = 1;
    } else if (options.formats.contains(barcode_format::ean13)) {
        sym.format = barcode_format::ean13;
    } else {
        return match_result::failure(scan_error::format_disabled, idx - start);
    }

    sym.text.reserve(digits.size() - text_begin);
    for (std::size_t k = text_begin; k < digits.size(); ++k) {
        sym.text.push_back(static_cast<char>('0' + digits[k]));
    }
    sym.checksum_ok = checksum_ok;

    float confidence = confidence_from_deviation(max_deviation);
    if (!checksum_ok) {
        confidence *= 0.5f;
    }
    sym.confidence = confidence;

    image_rect bounds;
    bounds.x = static_cast<int>(total_length(runs, 0, start));
    bounds.w = static_cast<int>(total_length(runs, start, ean13_matcher::symbol_runs));
    bounds.h = 1;
    sym.bounds = bounds;

    return match_result::success(std::move(sym));
}

} // namespace

std::uint8_t ean13_matcher::check_digit(std::span<const std::uint8_t> digits) noexcept {
    unsigned sum = 0;
    for (std::size_t i = 0; i < 12 && i < digits.size(); ++i) {
        sum += digits[i] * ((i % 2 == 0) ? 1u : 3u);
    }
    return static_cast<std::uint8_t>((10 - (sum % 10)) % 10);
}

match_result ean13_matcher::match(std::span<const run> runs, const decode_options& options) {
    match_result best = match_result::failure(scan_error::no_guard_found);
    bool found_guard = false;

    for (std::size_t i = 0; i + guard_runs <= runs.size(); ++i) {
        if (runs[i].color != polarity::bar) {
            continue;
        }

        const float unit = static_cast<float>(total_length(runs, i, guard_runs)) /
                           static_cast<float>(guard_runs);
        float deviation = 0.0f;
        if (!is_unit_guard(runs, i, guard_runs, polarity::bar, unit,
                           options.tolerance, deviation)) {
            continue;
        }

        auto attempt = decode_at(runs, i, unit, deviation, options);
        if (attempt) {
            return attempt;
        }
        if (!found_guard || attempt.progress >= best.progress) {
            best = std::move(attempt);
        }
        found_guard = true;
    }

    return best;
}

} // namespace ultracode

#include <ultracode/symbologies/code128.hpp>
#include "module_helpers.hpp"

#include <array>
#include <utility>

namespace ultracode {

namespace {

constexpr int SYMBOL_MODULES = 11;
constexpr int STOP_MODULES = 13;

// Values before the stop that are plausible for one row; longer reads are
// noise
constexpr std::size_t MAX_SYMBOL_VALUES = 256;

// Read 6 runs as one symbol character. Returns the value or -1.
int read_symbol(std::span<const run> runs, std::size_t first, float tolerance,
                float& deviation) noexcept {
    if (first + code128_matcher::symbol_runs > runs.size()) {
        return -1;
    }

    const float unit = static_cast<float>(total_length(runs, first, code128_matcher::symbol_runs)) /
                       static_cast<float>(SYMBOL_MODULES);
    code128_matcher::symbol_pattern pattern{};
    float local_deviation = deviation;
    int sum = 0;
    for (std::size_t k = 0; k < code128_matcher::symbol_runs; ++k) {
        int modules = 0;
        if (!to_modules(runs[first + k].length, unit, tolerance,
                        MAX_ELEMENT_MODULES, modules, local_deviation)) {
            return -1;
        }
        pattern[k] = static_cast<std::uint8_t>(modules);
        sum += modules;
    }
    if (sum != SYMBOL_MODULES) {
        return -1;
    }

    for (std::size_t v = 0; v < code128_matcher::patterns.size(); ++v) {
        if (code128_matcher::patterns[v] == pattern) {
            deviation = local_deviation;
            return static_cast<int>(v);
        }
    }
    return -1;
}

bool is_stop(std::span<const run> runs, std::size_t first, float tolerance,
             float& deviation) noexcept {
    if (first + code128_matcher::stop_runs > runs.size()) {
        return false;
    }

    const float unit = static_cast<float>(total_length(runs, first, code128_matcher::stop_runs)) /
                       static_cast<float>(STOP_MODULES);
    float local_deviation = deviation;
    for (std::size_t k = 0; k < code128_matcher::stop_runs; ++k) {
        int modules = 0;
        if (!to_modules(runs[first + k].length, unit, tolerance,
                        MAX_ELEMENT_MODULES, modules, local_deviation)) {
            return false;
        }
        if (modules != code128_matcher::stop_pattern[k]) {
            return false;
        }
    }
    deviation = local_deviation;
    return true;
}

code128_set set_for_start(int start_value) noexcept {
    switch (start_value) {
        case code128_matcher::start_a: return code128_set::a;
        case code128_matcher::start_b: return code128_set::b;
        default:                       return code128_set::c;
    }
}

match_result decode_from(std::span<const run> runs, std::size_t start, int start_value,
                         float deviation, const decode_options& options) {
    std::array<std::uint8_t, MAX_SYMBOL_VALUES> values{};
    std::size_t count = 0;
    values[count++] = static_cast<std::uint8_t>(start_value);

    std::size_t idx = start + code128_matcher::symbol_runs;
    for (;;) {
        const int value = read_symbol(runs, idx, options.tolerance, deviation);
        if (value >= 0 && value < code128_matcher::start_a) {
            if (count >= MAX_SYMBOL_VALUES) {
                return match_result::failure(scan_error::digit_decode_failure, idx - start);
            }
            values[count++] = static_cast<std::uint8_t>(value);
            idx += code128_matcher::symbol_runs;
            continue;
        }
        if (is_stop(runs, idx, options.tolerance, deviation)) {
            break;
        }
        if (idx + code128_matcher::symbol_runs > runs.size()) {
            return match_result::failure(scan_error::end_guard_mismatch, idx - start);
        }
        return match_result::failure(scan_error::digit_decode_failure, idx - start);
    }
    const std::size_t end = idx + code128_matcher::stop_runs;

    // start + at least one data value + check value
    if (count < 3) {
        return match_result::failure(scan_error::digit_decode_failure, idx - start);
    }

    const std::span<const std::uint8_t> checked(values.data(), count - 1);
    const bool checksum_ok = code128_matcher::checksum(checked) == values[count - 1];
    if (!checksum_ok && options.drop_checksum_failures) {
        return match_result::failure(scan_error::checksum_mismatch, idx - start);
    }

    if (!options.formats.contains(barcode_format::code128)) {
        return match_result::failure(scan_error::format_disabled, idx - start);
    }

    decoded_symbol sym;
    sym.format = barcode_format::code128;
    if (!code128_matcher::values_to_text(checked.subspan(1), set_for_start(start_value), sym.text)) {
        return match_result::failure(scan_error::invalid_code_sequence, idx - start);
    }
    sym.checksum_ok = checksum_ok;

    float confidence = confidence_from_deviation(deviation);
    if (!checksum_ok) {
        confidence *= 0.5f;
    }
    sym.confidence = confidence;

    image_rect bounds;
    bounds.x = static_cast<int>(total_length(runs, 0, start));
    bounds.w = static_cast<int>(total_length(runs, start, end - start));
    bounds.h = 1;
    sym.bounds = bounds;

    return match_result::success(std::move(sym));
}

} // namespace

std::uint8_t code128_matcher::checksum(std::span<const std::uint8_t> values) noexcept {
    if (values.empty()) {
        return 0;
    }
    std::uint32_t sum = values[0];
    for (std::size_t i = 1; i < values.size(); ++i) {
        sum += static_cast<std::uint32_t>(values[i]) * static_cast<std::uint32_t>(i);
    }
    return static_cast<std::uint8_t>(sum % 103);
}

bool code128_matcher::values_to_text(std::span<const std::uint8_t> values,
                                     code128_set start_set,
                                     std::string& out) {
    out.clear();
    code128_set set = start_set;
    bool shifted = false;

    for (const auto v : values) {
        code128_set active = set;
        if (shifted) {
            active = set == code128_set::a ? code128_set::b : code128_set::a;
        }
        const bool was_shifted = shifted;
        shifted = false;

        if (active == code128_set::c) {
            if (v < 100) {
                out.push_back(static_cast<char>('0' + v / 10));
                out.push_back(static_cast<char>('0' + v % 10));
                continue;
            }
            switch (v) {
                case code_b: set = code128_set::b; break;
                case code_a: set = code128_set::a; break;
                case fnc1:   out.push_back(group_separator); break;
                default:     return false;
            }
            continue;
        }

        if (v < 96) {
            if (active == code128_set::a) {
                out.push_back(static_cast<char>(v < 64 ? v + 32 : v - 64));
            } else {
                out.push_back(static_cast<char>(v + 32));
            }
            continue;
        }

        // A shifted character must be data
        if (was_shifted) {
            return false;
        }

        switch (v) {
            case fnc3:
            case fnc2:
                break;
            case shift:
                shifted = true;
                break;
            case code_c:
                set = code128_set::c;
                break;
            case code_b:
                if (active == code128_set::a) {
                    set = code128_set::b;
                }
                break;  // FNC4 in set B
            case code_a:
                if (active == code128_set::b) {
                    set = code128_set::a;
                }
                break;  // FNC4 in set A
            case fnc1:
                out.push_back(group_separator);
                break;
            default:
                return false;
        }
    }
    return !shifted;
}

match_result code128_matcher::match(std::span<const run> runs, const decode_options& options) {
    match_result best = match_result::failure(scan_error::no_guard_found);
    bool found_start = false;

    for (std::size_t i = 0; i + symbol_runs <= runs.size(); ++i) {
        if (runs[i].color != polarity::bar) {
            continue;
        }

        float deviation = 0.0f;
        const int value = read_symbol(runs, i, options.tolerance, deviation);
        if (value < start_a || value > start_c) {
            continue;
        }

        auto attempt = decode_from(runs, i, value, deviation, options);
        if (attempt) {
            return attempt;
        }
        if (!found_start || attempt.progress >= best.progress) {
            best = std::move(attempt);
        }
        found_start = true;
    }

    return best;
}

} // namespace ultracode

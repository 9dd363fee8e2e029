#pragma once

#include <ultracode/types.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>

namespace ultracode {

// Widest element any supported symbology uses, in modules
constexpr int MAX_ELEMENT_MODULES = 4;

// Round a run width to whole modules.
// Returns false if the result is outside [1, max_modules] or further than
// tolerance from the nearest integer; deviation is updated with the largest
// distance seen so far.
inline bool to_modules(std::uint32_t length, float unit, float tolerance,
                       int max_modules, int& modules, float& deviation) noexcept {
    if (unit <= 0.0f) {
        return false;
    }
    const float exact = static_cast<float>(length) / unit;
    const float rounded = std::round(exact);
    if (rounded < 1.0f || rounded > static_cast<float>(max_modules)) {
        return false;
    }
    const float dev = std::fabs(exact - rounded);
    if (dev > tolerance) {
        return false;
    }
    modules = static_cast<int>(rounded);
    deviation = std::max(deviation, dev);
    return true;
}

// Sum of run lengths in [first, first + count)
inline std::uint32_t total_length(std::span<const run> runs, std::size_t first,
                                  std::size_t count) noexcept {
    std::uint32_t sum = 0;
    for (std::size_t i = first; i < first + count && i < runs.size(); ++i) {
        sum += runs[i].length;
    }
    return sum;
}

// True if count runs starting at first all exist, alternate starting with
// the given colour, and are each one module wide.
inline bool is_unit_guard(std::span<const run> runs, std::size_t first, std::size_t count,
                          polarity first_color, float unit, float tolerance,
                          float& deviation) noexcept {
    if (first + count > runs.size()) {
        return false;
    }
    polarity expected = first_color;
    for (std::size_t i = 0; i < count; ++i) {
        const auto& r = runs[first + i];
        if (r.color != expected) {
            return false;
        }
        int modules = 0;
        if (!to_modules(r.length, unit, tolerance, 1, modules, deviation)) {
            return false;
        }
        expected = expected == polarity::bar ? polarity::space : polarity::bar;
    }
    return true;
}

// Confidence from the largest module deviation of a decode: 1 at a perfect
// read, 0 at half a module
inline float confidence_from_deviation(float max_deviation) noexcept {
    return std::clamp(1.0f - 2.0f * max_deviation, 0.0f, 1.0f);
}

} // namespace ultracode

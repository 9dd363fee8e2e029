#ifndef ULTRACODE_MATCHER_HPP_
#define ULTRACODE_MATCHER_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>

namespace ultracode {

// ============================================================================
// Match Result
// ============================================================================

/**
 * Outcome of one matcher on one run sequence.
 * On success the symbol's bounds are relative to the start of the run
 * sequence (y = 0, h = 1); the scanner maps them to image coordinates.
 */
struct match_result {
    bool ok = false;
    scan_error error = scan_error::none;
    decoded_symbol symbol;

    // Number of runs the furthest attempt consumed before failing
    std::size_t progress = 0;

    [[nodiscard]] static match_result success(decoded_symbol sym) {
        return {true, scan_error::none, std::move(sym), 0};
    }

    [[nodiscard]] static match_result failure(scan_error err, std::size_t progress = 0) {
        return {false, err, {}, progress};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Built-in Matcher Table
// ============================================================================

using match_fn = match_result (*)(std::span<const run> runs, const decode_options& options);

/**
 * One entry of the fixed symbology table.
 * Every linear symbology is a static matcher class exposing name, formats
 * and match(); the table binds them to the scanner. New symbologies are
 * added here, not registered at runtime.
 */
struct matcher_entry {
    std::string_view name;
    format_set formats;     // formats match() may produce
    match_fn match;
};

/**
 * The built-in linear matchers, in the order the scanner runs them.
 */
[[nodiscard]] ULTRACODE_EXPORT std::span<const matcher_entry> builtin_matchers() noexcept;

/**
 * Find a built-in matcher by name (e.g. "ean13").
 * @return Pointer into the static table, or nullptr
 */
[[nodiscard]] ULTRACODE_EXPORT const matcher_entry* find_matcher(std::string_view name) noexcept;

} // namespace ultracode

#endif // ULTRACODE_MATCHER_HPP_

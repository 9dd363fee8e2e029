#ifndef ULTRACODE_TYPES_HPP_
#define ULTRACODE_TYPES_HPP_

#include <ultracode/ultracode_export.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ultracode {

class area_decoder;

// ============================================================================
// Barcode Formats
// ============================================================================

enum class barcode_format : std::uint8_t {
    ean13,
    upca,
    code128,
    qr        // produced by area decoders only
};

constexpr std::size_t barcode_format_count = 4;

[[nodiscard]] ULTRACODE_EXPORT const char* to_string(barcode_format fmt) noexcept;

/**
 * Parse a format name.
 * Accepts the canonical lowercase names ("ean13", "upca", "code128", "qr")
 * and the common spellings ("EAN-13", "UPC-A", "Code128", "QRCode", ...).
 */
[[nodiscard]] ULTRACODE_EXPORT std::optional<barcode_format>
format_from_string(std::string_view name) noexcept;

/**
 * Small bitmask over barcode_format tags.
 */
class format_set {
public:
    constexpr format_set() noexcept = default;

    constexpr format_set(std::initializer_list<barcode_format> formats) noexcept {
        for (auto fmt : formats) {
            insert(fmt);
        }
    }

    [[nodiscard]] static constexpr format_set all_linear() noexcept {
        return {barcode_format::ean13, barcode_format::upca, barcode_format::code128};
    }

    [[nodiscard]] static constexpr format_set all() noexcept {
        return {barcode_format::ean13, barcode_format::upca,
                barcode_format::code128, barcode_format::qr};
    }

    constexpr void insert(barcode_format fmt) noexcept { bits_ |= bit(fmt); }
    constexpr void erase(barcode_format fmt) noexcept {
        bits_ &= static_cast<std::uint32_t>(~bit(fmt));
    }

    [[nodiscard]] constexpr bool contains(barcode_format fmt) const noexcept {
        return (bits_ & bit(fmt)) != 0;
    }

    [[nodiscard]] constexpr bool intersects(format_set other) const noexcept {
        return (bits_ & other.bits_) != 0;
    }

    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

    constexpr bool operator==(const format_set&) const noexcept = default;

private:
    static constexpr std::uint32_t bit(barcode_format fmt) noexcept {
        return 1u << static_cast<unsigned>(fmt);
    }

    std::uint32_t bits_ = 0;
};

// ============================================================================
// Runs
// ============================================================================

enum class polarity : std::uint8_t {
    bar,    // dark
    space   // light
};

struct run {
    std::uint32_t length = 0;
    polarity color = polarity::space;

    constexpr bool operator==(const run&) const noexcept = default;
};

// ============================================================================
// Errors
// ============================================================================

// Call-level errors. Only invalid_input ever leaves decode_any(); the others
// come from decode_first(), rendering and image I/O.
enum class decode_error {
    none,
    invalid_input,
    dimensions_exceeded,
    not_found,
    invalid_format,
    unsupported_encoding,
    truncated_data,
    io_error,
    internal_error
};

[[nodiscard]] ULTRACODE_EXPORT const char* to_string(decode_error err) noexcept;

// Attempt-level errors. Contained inside the scan orchestrator.
enum class scan_error {
    none,
    no_signal,
    no_guard_found,
    digit_decode_failure,
    middle_guard_mismatch,
    end_guard_mismatch,
    checksum_mismatch,
    invalid_code_sequence,
    format_disabled
};

[[nodiscard]] ULTRACODE_EXPORT const char* to_string(scan_error err) noexcept;

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decoded Symbols
// ============================================================================

struct image_rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    constexpr bool operator==(const image_rect&) const noexcept = default;
};

struct decoded_symbol {
    barcode_format format = barcode_format::ean13;
    std::string text;
    bool checksum_ok = false;
    std::optional<std::size_t> row;       // scanline that produced the symbol
    std::optional<float> confidence;      // 0..1
    std::optional<image_rect> bounds;     // pixel span on that scanline
};

// ============================================================================
// Decode Options
// ============================================================================

enum class binarize_mode {
    global,     // one threshold per row
    adaptive,   // sliding window mean
    hybrid      // adaptive first, global as fallback
};

struct decode_options {
    // Number of evenly spaced rows to scan
    std::size_t scan_rows = 15;

    // Formats the matchers are allowed to report
    format_set formats = format_set::all_linear();

    // Largest allowed distance (in modules) between a run width and its
    // rounded module count
    float tolerance = 0.35f;

    // Discard symbols whose check digit does not verify instead of
    // reporting them with checksum_ok = false
    bool drop_checksum_failures = false;

    // Also read every row right to left (symbols rotated by 180 degrees)
    bool try_reverse = true;

    binarize_mode binarization = binarize_mode::hybrid;

    // Rows whose max - min intensity is below this have no signal
    int min_contrast = 16;

    // Rows narrower than this are skipped
    std::size_t min_row_width = 30;

    // Maximum accepted image dimensions
    std::size_t max_width = 16384;
    std::size_t max_height = 16384;

    // 2D decoders run once per call; not owned
    std::vector<const area_decoder*> area_decoders;
};

} // namespace ultracode

#endif // ULTRACODE_TYPES_HPP_

#include <ultracode/types.hpp>

#include <new>
#include <cctype>
#include <string>

namespace ultracode {

namespace {

// Lowercase and drop separators so "EAN-13", "ean_13" and "Ean13" compare equal
std::string fold_format_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '-' || c == '_' || c == ' ') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

} // namespace

const char* to_string(barcode_format fmt) noexcept {
    switch (fmt) {
        case barcode_format::ean13:   return "EAN-13";
        case barcode_format::upca:    return "UPC-A";
        case barcode_format::code128: return "Code128";
        case barcode_format::qr:      return "QR Code";
    }
    return "unknown";
}

std::optional<barcode_format> format_from_string(std::string_view name) noexcept {
    std::string folded;
    try {
        folded = fold_format_name(name);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    if (folded == "ean13")                        return barcode_format::ean13;
    if (folded == "upca" || folded == "upc")      return barcode_format::upca;
    if (folded == "code128")                      return barcode_format::code128;
    if (folded == "qr" || folded == "qrcode")     return barcode_format::qr;
    return std::nullopt;
}

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                 return "none";
        case decode_error::invalid_input:        return "invalid_input";
        case decode_error::dimensions_exceeded:  return "dimensions_exceeded";
        case decode_error::not_found:            return "not_found";
        case decode_error::invalid_format:       return "invalid_format";
        case decode_error::unsupported_encoding: return "unsupported_encoding";
        case decode_error::truncated_data:       return "truncated_data";
        case decode_error::io_error:             return "io_error";
        case decode_error::internal_error:       return "internal_error";
    }
    return "unknown";
}

const char* to_string(scan_error err) noexcept {
    switch (err) {
        case scan_error::none:                  return "none";
        case scan_error::no_signal:             return "no_signal";
        case scan_error::no_guard_found:        return "no_guard_found";
        case scan_error::digit_decode_failure:  return "digit_decode_failure";
        case scan_error::middle_guard_mismatch: return "middle_guard_mismatch";
        case scan_error::end_guard_mismatch:    return "end_guard_mismatch";
        case scan_error::checksum_mismatch:     return "checksum_mismatch";
        case scan_error::invalid_code_sequence: return "invalid_code_sequence";
        case scan_error::format_disabled:       return "format_disabled";
    }
    return "unknown";
}

} // namespace ultracode

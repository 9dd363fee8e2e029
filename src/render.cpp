#include <ultracode/render.hpp>
#include <ultracode/symbologies/ean13.hpp>

#include <algorithm>
#include <array>
#include <numeric>
#include <string>

namespace ultracode {

namespace {

bool parse_digits(std::string_view text, std::span<std::uint8_t> out) noexcept {
    if (text.size() != out.size()) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
        out[i] = static_cast<std::uint8_t>(text[i] - '0');
    }
    return true;
}

void append(std::vector<std::uint8_t>& modules, std::span<const std::uint8_t> widths) {
    modules.insert(modules.end(), widths.begin(), widths.end());
}

void append_unit_guard(std::vector<std::uint8_t>& modules, std::size_t count) {
    modules.insert(modules.end(), count, 1);
}

// Encode 13 EAN digits
void encode_ean13(const std::array<std::uint8_t, 13>& digits, std::vector<std::uint8_t>& modules) {
    modules.clear();
    modules.reserve(ean13_matcher::symbol_runs);

    append_unit_guard(modules, ean13_matcher::guard_runs);

    const auto parity = ean13_matcher::first_digit_parity[digits[0]];
    for (std::size_t i = 0; i < 6; ++i) {
        const bool even = (parity >> (5 - i)) & 1u;
        const auto& table = even ? ean13_matcher::g_patterns : ean13_matcher::l_patterns;
        append(modules, table[digits[1 + i]]);
    }

    append_unit_guard(modules, ean13_matcher::middle_guard_runs);

    for (std::size_t i = 0; i < 6; ++i) {
        append(modules, ean13_matcher::l_patterns[digits[7 + i]]);
    }

    append_unit_guard(modules, ean13_matcher::guard_runs);
}

} // namespace

decode_result ean13_modules(std::string_view text, std::vector<std::uint8_t>& modules) {
    std::array<std::uint8_t, 13> digits{};
    if (text.size() == 12) {
        if (!parse_digits(text, std::span(digits).first(12))) {
            return decode_result::failure(decode_error::invalid_input, "EAN-13 text must be digits");
        }
        digits[12] = ean13_matcher::check_digit(digits);
    } else if (text.size() == 13) {
        if (!parse_digits(text, digits)) {
            return decode_result::failure(decode_error::invalid_input, "EAN-13 text must be digits");
        }
    } else {
        return decode_result::failure(decode_error::invalid_input,
            "EAN-13 needs 12 or 13 digits, got " + std::to_string(text.size()));
    }

    encode_ean13(digits, modules);
    return decode_result::success();
}

decode_result upca_modules(std::string_view text, std::vector<std::uint8_t>& modules) {
    std::array<std::uint8_t, 13> digits{};
    if (text.size() == 11) {
        if (!parse_digits(text, std::span(digits).subspan(1, 11))) {
            return decode_result::failure(decode_error::invalid_input, "UPC-A text must be digits");
        }
        digits[12] = ean13_matcher::check_digit(digits);
    } else if (text.size() == 12) {
        if (!parse_digits(text, std::span(digits).subspan(1))) {
            return decode_result::failure(decode_error::invalid_input, "UPC-A text must be digits");
        }
    } else {
        return decode_result::failure(decode_error::invalid_input,
            "UPC-A needs 11 or 12 digits, got " + std::to_string(text.size()));
    }

    encode_ean13(digits, modules);
    return decode_result::success();
}

decode_result code128_modules(std::string_view text, code128_set set,
                              std::vector<std::uint8_t>& modules) {
    std::vector<std::uint8_t> values;
    values.reserve(text.size() + 2);

    switch (set) {
        case code128_set::a:
            values.push_back(code128_matcher::start_a);
            for (char ch : text) {
                const auto c = static_cast<unsigned char>(ch);
                if (c > 95) {
                    return decode_result::failure(decode_error::invalid_input,
                        "Code 128 set A encodes ASCII 0-95 only");
                }
                values.push_back(static_cast<std::uint8_t>(c >= 32 ? c - 32 : c + 64));
            }
            break;
        case code128_set::b:
            values.push_back(code128_matcher::start_b);
            for (char ch : text) {
                const auto c = static_cast<unsigned char>(ch);
                if (c < 32 || c > 127) {
                    return decode_result::failure(decode_error::invalid_input,
                        "Code 128 set B encodes ASCII 32-127 only");
                }
                values.push_back(static_cast<std::uint8_t>(c - 32));
            }
            break;
        case code128_set::c:
            if (text.size() % 2 != 0) {
                return decode_result::failure(decode_error::invalid_input,
                    "Code 128 set C needs an even number of digits");
            }
            values.push_back(code128_matcher::start_c);
            for (std::size_t i = 0; i < text.size(); i += 2) {
                const char hi = text[i];
                const char lo = text[i + 1];
                if (hi < '0' || hi > '9' || lo < '0' || lo > '9') {
                    return decode_result::failure(decode_error::invalid_input,
                        "Code 128 set C encodes digits only");
                }
                values.push_back(static_cast<std::uint8_t>((hi - '0') * 10 + (lo - '0')));
            }
            break;
    }

    if (values.size() < 2) {
        return decode_result::failure(decode_error::invalid_input, "Code 128 text is empty");
    }

    values.push_back(code128_matcher::checksum(values));

    modules.clear();
    modules.reserve(values.size() * code128_matcher::symbol_runs + code128_matcher::stop_runs);
    for (auto v : values) {
        append(modules, code128_matcher::patterns[v]);
    }
    append(modules, code128_matcher::stop_pattern);
    return decode_result::success();
}

std::size_t draw_modules(gray_buffer& buffer,
                         std::size_t x,
                         std::size_t y,
                         std::size_t module_width,
                         std::size_t bar_height,
                         std::span<const std::uint8_t> modules,
                         std::uint8_t bar_value) {
    std::size_t cursor = x;
    bool bar = true;
    for (auto m : modules) {
        const std::size_t w = static_cast<std::size_t>(m) * module_width;
        if (bar) {
            buffer.fill_rect(cursor, y, w, bar_height, bar_value);
        }
        cursor += w;
        bar = !bar;
    }
    return cursor - x;
}

decode_result render_symbol(std::span<const std::uint8_t> modules,
                            gray_buffer& buffer,
                            const render_options& options) {
    if (modules.empty() || options.module_width == 0 || options.height == 0) {
        return decode_result::failure(decode_error::invalid_input, "Nothing to render");
    }

    const std::size_t symbol_modules =
        std::accumulate(modules.begin(), modules.end(), std::size_t{0});
    const std::size_t width = (symbol_modules + 2 * options.quiet_zone) * options.module_width;

    if (!buffer.reset(width, options.height, options.space_value)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate canvas");
    }

    std::size_t bar_height = options.bar_height;
    if (bar_height == 0) {
        bar_height = std::max<std::size_t>(1, (options.height * 3) / 5);
    }
    bar_height = std::min(bar_height, options.height);
    const std::size_t top = (options.height - bar_height) / 2;

    draw_modules(buffer, options.quiet_zone * options.module_width, top,
                 options.module_width, bar_height, modules, options.bar_value);
    return decode_result::success();
}

} // namespace ultracode

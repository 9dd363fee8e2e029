#include <ultracode/scanner.hpp>
#include <ultracode/matcher.hpp>
#include <ultracode/area_decoder.hpp>

#include <array>
#include <string>
#include <utility>

namespace ultracode {

namespace {

// Matchers that can run at most; grows with the built-in table
constexpr std::size_t MAX_MATCHERS = 8;

// Merge sym into out: equal format and text keep the first position, and
// take the later record only if its confidence is strictly higher.
void merge_symbol(std::vector<decoded_symbol>& out, decoded_symbol sym) {
    for (auto& existing : out) {
        if (existing.format != sym.format || existing.text != sym.text) {
            continue;
        }
        if (sym.confidence.value_or(0.0f) > existing.confidence.value_or(0.0f)) {
            existing = std::move(sym);
        }
        return;
    }
    out.push_back(std::move(sym));
}

// Map matcher-relative bounds onto the image row
void place_symbol(decoded_symbol& sym, std::size_t y, std::size_t width, bool reversed) {
    sym.row = y;
    image_rect bounds = sym.bounds.value_or(image_rect{});
    if (reversed) {
        bounds.x = static_cast<int>(width) - (bounds.x + bounds.w);
    }
    bounds.y = static_cast<int>(y);
    bounds.h = 1;
    sym.bounds = bounds;
}

} // namespace

decode_result validate_options(const decode_options& options) {
    if (options.scan_rows == 0) {
        return decode_result::failure(decode_error::invalid_input, "scan_rows must be positive");
    }
    if (!(options.tolerance > 0.0f && options.tolerance < 0.5f)) {
        return decode_result::failure(decode_error::invalid_input,
            "tolerance must lie in (0, 0.5), got " + std::to_string(options.tolerance));
    }
    if (options.formats.empty()) {
        return decode_result::failure(decode_error::invalid_input, "No barcode format enabled");
    }
    if (options.min_contrast < 0 || options.min_contrast > 255) {
        return decode_result::failure(decode_error::invalid_input,
            "min_contrast must lie in [0, 255]");
    }
    return decode_result::success();
}

decode_result scanner::scan(const gray_image& image,
                            std::vector<decoded_symbol>& out,
                            const decode_options& options) {
    out.clear();

    auto result = image.validate(options);
    if (!result) {
        return result;
    }
    result = validate_options(options);
    if (!result) {
        return result;
    }
    result = sampler_.reset(image, options.scan_rows);
    if (!result) {
        return result;
    }

    // Matchers that may produce an enabled format
    std::array<const matcher_entry*, MAX_MATCHERS> active{};
    std::size_t active_count = 0;
    for (const auto& entry : builtin_matchers()) {
        if (entry.formats.intersects(options.formats) && active_count < MAX_MATCHERS) {
            active[active_count++] = &entry;
        }
    }

    std::array<binarize_mode, 2> modes{};
    std::size_t mode_count = 0;
    switch (options.binarization) {
        case binarize_mode::global:
            modes[mode_count++] = binarize_mode::global;
            break;
        case binarize_mode::adaptive:
            modes[mode_count++] = binarize_mode::adaptive;
            break;
        case binarize_mode::hybrid:
            modes[mode_count++] = binarize_mode::adaptive;
            modes[mode_count++] = binarize_mode::global;
            break;
    }

    const std::size_t width = image.width();
    if (active_count > 0 && width >= options.min_row_width) {
        buffers_.reserve(width);

        for (std::size_t r = 0; r < sampler_.size(); ++r) {
            const std::size_t y = sampler_.row_index(r);
            const auto pixels = sampler_.row(r);
            std::array<bool, MAX_MATCHERS> satisfied{};
            std::size_t satisfied_count = 0;

            for (std::size_t m = 0; m < mode_count && satisfied_count < active_count; ++m) {
                if (binarize_row(pixels, modes[m], buffers_, options.min_contrast) != scan_error::none) {
                    continue;
                }
                extract_runs(buffers_.bits, buffers_.runs);
                if (options.try_reverse) {
                    reverse_runs(buffers_.runs, buffers_.reversed);
                }

                for (std::size_t k = 0; k < active_count; ++k) {
                    if (satisfied[k]) {
                        continue;
                    }

                    auto found = active[k]->match(buffers_.runs, options);
                    bool reversed = false;
                    if (!found && options.try_reverse) {
                        found = active[k]->match(buffers_.reversed, options);
                        reversed = true;
                    }
                    if (!found) {
                        continue;
                    }

                    satisfied[k] = true;
                    ++satisfied_count;
                    place_symbol(found.symbol, y, width, reversed);
                    merge_symbol(out, std::move(found.symbol));
                }
            }
        }
    }

    for (const area_decoder* decoder : options.area_decoders) {
        if (decoder == nullptr || !options.formats.contains(decoder->format())) {
            continue;
        }
        std::vector<decoded_symbol> found;
        if (decoder->decode(image, options, found) != scan_error::none) {
            continue;
        }
        for (auto& sym : found) {
            merge_symbol(out, std::move(sym));
        }
    }

    return decode_result::success();
}

decode_result decode_any(const gray_image& image,
                         std::vector<decoded_symbol>& out,
                         const decode_options& options) {
    scanner local;
    return local.scan(image, out, options);
}

decode_result decode_first(const gray_image& image,
                           decoded_symbol& out,
                           const decode_options& options) {
    std::vector<decoded_symbol> symbols;
    auto result = decode_any(image, symbols, options);
    if (!result) {
        return result;
    }
    if (symbols.empty()) {
        return decode_result::failure(decode_error::not_found, "No barcode found");
    }
    out = std::move(symbols.front());
    return decode_result::success();
}

} // namespace ultracode

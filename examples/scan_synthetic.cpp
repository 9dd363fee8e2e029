#include <ultracode/ultracode.hpp>
#include <ultracode/image_io.hpp>

#include <charconv>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n";
    std::cerr << "Renders a barcode, decodes it again and prints the result.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --format F     ean13, upca or code128 (default ean13)\n";
    std::cerr << "  --text T       Payload (default 400638133393)\n";
    std::cerr << "  --set S        Code 128 code set: A, B or C (default B)\n";
    std::cerr << "  --module N     Pixels per module (default 2)\n";
    std::cerr << "  --height N     Image height (default 50)\n";
    std::cerr << "  --write FILE   Save the rendered image (.png or PGM)\n";
    std::cerr << "  -h, --help     Show this help\n";
}

bool parse_size(const char* text, std::size_t& value) {
    const char* end = text + std::strlen(text);
    auto result = std::from_chars(text, end, value);
    return result.ec == std::errc{} && result.ptr == end && value > 0;
}

bool parse_set(std::string_view name, ultracode::code128_set& set) {
    if (name == "A" || name == "a") {
        set = ultracode::code128_set::a;
    } else if (name == "B" || name == "b") {
        set = ultracode::code128_set::b;
    } else if (name == "C" || name == "c") {
        set = ultracode::code128_set::c;
    } else {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    ultracode::barcode_format format = ultracode::barcode_format::ean13;
    std::string text;
    ultracode::code128_set set = ultracode::code128_set::b;
    ultracode::render_options render;
    const char* output = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(arg, "--format") == 0 && has_value) {
            const auto fmt = ultracode::format_from_string(argv[++i]);
            if (!fmt || *fmt == ultracode::barcode_format::qr) {
                std::cerr << "Error: --format must be ean13, upca or code128\n";
                return 2;
            }
            format = *fmt;
        } else if (std::strcmp(arg, "--text") == 0 && has_value) {
            text = argv[++i];
        } else if (std::strcmp(arg, "--set") == 0 && has_value) {
            if (!parse_set(argv[++i], set)) {
                std::cerr << "Error: --set must be A, B or C\n";
                return 2;
            }
        } else if (std::strcmp(arg, "--module") == 0 && has_value) {
            if (!parse_size(argv[++i], render.module_width)) {
                std::cerr << "Error: --module needs a positive integer\n";
                return 2;
            }
        } else if (std::strcmp(arg, "--height") == 0 && has_value) {
            if (!parse_size(argv[++i], render.height)) {
                std::cerr << "Error: --height needs a positive integer\n";
                return 2;
            }
        } else if (std::strcmp(arg, "--write") == 0 && has_value) {
            output = argv[++i];
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    std::vector<std::uint8_t> modules;
    ultracode::decode_result result;
    switch (format) {
        case ultracode::barcode_format::upca:
            result = ultracode::upca_modules(text.empty() ? "03600029145" : text, modules);
            break;
        case ultracode::barcode_format::code128:
            if (text.empty()) {
                text = set == ultracode::code128_set::c ? "123456" : "ULTRACODE-128";
            }
            result = ultracode::code128_modules(text, set, modules);
            break;
        default:
            result = ultracode::ean13_modules(text.empty() ? "400638133393" : text, modules);
            break;
    }
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 2;
    }

    ultracode::gray_buffer image;
    result = ultracode::render_symbol(modules, image, render);
    if (!result) {
        std::cerr << "Error: Failed to render: " << result.message << "\n";
        return 1;
    }

    std::cout << "Rendered " << ultracode::to_string(format) << ": "
              << image.width() << "x" << image.height() << "\n";

    if (output != nullptr) {
        const std::filesystem::path output_path(output);
        result = ultracode::save_gray_image(output_path, image.view());
        if (!result) {
            std::cerr << "Error: Failed to save: " << result.message << "\n";
            return 1;
        }
        std::cout << "Saved: " << output_path << "\n";
    }

    std::vector<ultracode::decoded_symbol> symbols;
    result = ultracode::decode_any(image.view(), symbols);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    if (symbols.empty()) {
        std::cout << "No barcode found.\n";
        return 1;
    }

    for (const auto& sym : symbols) {
        std::cout << ultracode::to_string(sym.format) << ": " << sym.text
                  << " (row=" << sym.row.value_or(0)
                  << ", checksum=" << (sym.checksum_ok ? "ok" : "bad")
                  << ", confidence=" << sym.confidence.value_or(0.0f) << ")\n";
    }
    return 0;
}

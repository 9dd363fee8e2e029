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

constexpr int EXIT_FOUND = 0;
constexpr int EXIT_NOTHING = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <image_file>\n";
    std::cerr << "Decodes the barcodes in an image.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --rows N          Scanlines to sample (default 15)\n";
    std::cerr << "  --formats a,b     Formats to decode (ean13,upca,code128)\n";
    std::cerr << "  --tolerance T     Module tolerance in (0, 0.5) (default 0.35)\n";
    std::cerr << "  --strict          Drop symbols with a bad checksum\n";
    std::cerr << "  --no-reverse      Do not read scanlines right to left\n";
    std::cerr << "  --mode M          Binarization: hybrid, adaptive or global\n";
    std::cerr << "  -h, --help        Show this help\n";
}

bool parse_formats(std::string_view list, ultracode::format_set& formats) {
    formats = {};
    while (!list.empty()) {
        const auto comma = list.find(',');
        const auto name = list.substr(0, comma);
        const auto fmt = ultracode::format_from_string(name);
        if (!fmt) {
            std::cerr << "Error: Unknown format: " << name << "\n";
            return false;
        }
        formats.insert(*fmt);
        list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
    }
    return !formats.empty();
}

bool parse_mode(std::string_view name, ultracode::binarize_mode& mode) {
    if (name == "hybrid") {
        mode = ultracode::binarize_mode::hybrid;
    } else if (name == "adaptive") {
        mode = ultracode::binarize_mode::adaptive;
    } else if (name == "global") {
        mode = ultracode::binarize_mode::global;
    } else {
        return false;
    }
    return true;
}

template <typename T>
bool parse_number(const char* text, T& value) {
    const char* end = text + std::strlen(text);
    auto result = std::from_chars(text, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

} // namespace

int main(int argc, char* argv[]) {
    ultracode::decode_options options;
    const char* input = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return EXIT_FOUND;
        } else if (std::strcmp(arg, "--rows") == 0 && has_value) {
            if (!parse_number(argv[++i], options.scan_rows) || options.scan_rows == 0) {
                std::cerr << "Error: --rows needs a positive integer\n";
                return EXIT_USAGE;
            }
        } else if (std::strcmp(arg, "--formats") == 0 && has_value) {
            if (!parse_formats(argv[++i], options.formats)) {
                return EXIT_USAGE;
            }
        } else if (std::strcmp(arg, "--tolerance") == 0 && has_value) {
            if (!parse_number(argv[++i], options.tolerance)) {
                std::cerr << "Error: --tolerance needs a number\n";
                return EXIT_USAGE;
            }
        } else if (std::strcmp(arg, "--strict") == 0) {
            options.drop_checksum_failures = true;
        } else if (std::strcmp(arg, "--no-reverse") == 0) {
            options.try_reverse = false;
        } else if (std::strcmp(arg, "--mode") == 0 && has_value) {
            if (!parse_mode(argv[++i], options.binarization)) {
                std::cerr << "Error: --mode must be hybrid, adaptive or global\n";
                return EXIT_USAGE;
            }
        } else if (arg[0] == '-' || input != nullptr) {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            print_usage(argv[0]);
            return EXIT_USAGE;
        } else {
            input = arg;
        }
    }

    if (input == nullptr) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    auto result = ultracode::validate_options(options);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return EXIT_USAGE;
    }

    const std::filesystem::path input_path(input);
    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return EXIT_NOTHING;
    }

    ultracode::load_options load;
    load.max_width = options.max_width;
    load.max_height = options.max_height;

    ultracode::gray_buffer image;
    result = ultracode::load_gray_image_file(input_path, image, load);
    if (!result) {
        std::cerr << "Error: Failed to load " << input_path << ": " << result.message
                  << " (" << ultracode::to_string(result.error) << ")\n";
        return EXIT_NOTHING;
    }

    std::vector<ultracode::decoded_symbol> symbols;
    result = ultracode::decode_any(image.view(), symbols, options);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return EXIT_NOTHING;
    }

    if (symbols.empty()) {
        std::cout << "No barcode found.\n";
        return EXIT_NOTHING;
    }

    for (const auto& sym : symbols) {
        std::cout << ultracode::to_string(sym.format) << ": " << sym.text
                  << " (row=" << sym.row.value_or(0)
                  << ", checksum=" << (sym.checksum_ok ? "ok" : "bad") << ")\n";
    }
    return EXIT_FOUND;
}

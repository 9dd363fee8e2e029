#include <ultracode/image_io.hpp>
#include "io_helpers.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string>

namespace ultracode {

namespace {

struct loader_entry {
    std::string_view name;
    bool (*sniff)(std::span<const std::uint8_t>) noexcept;
    decode_result (*load)(std::span<const std::uint8_t>, gray_buffer&, const load_options&);
};

// TGA last: it has no magic and would accept some other headers
// stb last: its TGA check has no magic number
constexpr std::array<loader_entry, 3> LOADERS = {{
    {pnm_loader::name, &pnm_loader::sniff, &pnm_loader::load},
    {png_loader::name, &png_loader::sniff, &png_loader::load},
    {stb_loader::name, &stb_loader::sniff, &stb_loader::load},
}};

const loader_entry* find_loader(std::span<const std::uint8_t> data) noexcept {
    for (const auto& entry : LOADERS) {
        if (entry.sniff(data)) {
            return &entry;
        }
    }
    return nullptr;
}

bool read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    const auto size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);
    return static_cast<bool>(file);
}

bool has_png_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png";
}

} // namespace

std::string_view sniff_image_format(std::span<const std::uint8_t> data) noexcept {
    const auto* loader = find_loader(data);
    return loader ? loader->name : std::string_view{};
}

decode_result load_gray_image(std::span<const std::uint8_t> data,
                              gray_buffer& buffer,
                              const load_options& options) {
    if (data.empty()) {
        return decode_result::failure(decode_error::invalid_format, "Empty input");
    }
    const auto* loader = find_loader(data);
    if (!loader) {
        return decode_result::failure(decode_error::invalid_format, "Unknown image format");
    }
    return loader->load(data, buffer, options);
}

decode_result load_gray_image_file(const std::filesystem::path& path,
                                   gray_buffer& buffer,
                                   const load_options& options) {
    std::vector<std::uint8_t> data;
    if (!read_file(path, data)) {
        return decode_result::failure(decode_error::io_error,
            "Failed to read file: " + path.string());
    }
    return load_gray_image(data, buffer, options);
}

decode_result encode_pgm(const gray_image& image, std::vector<std::uint8_t>& out) {
    out.clear();
    auto result = image.validate();
    if (!result) return result;

    const std::string header = "P5\n" + std::to_string(image.width()) + " " +
                               std::to_string(image.height()) + "\n255\n";
    const auto pixels = image.pixels();
    out.reserve(header.size() + pixels.size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), pixels.begin(), pixels.end());
    return decode_result::success();
}

decode_result encode_png(const gray_image& image, std::vector<std::uint8_t>& out) {
    return write_png(image, out);
}

decode_result save_gray_image(const std::filesystem::path& path, const gray_image& image) {
    std::vector<std::uint8_t> bytes;
    auto result = has_png_extension(path) ? encode_png(image, bytes) : encode_pgm(image, bytes);
    if (!result) return result;

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return decode_result::failure(decode_error::io_error,
            "Failed to open for writing: " + path.string());
    }

    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file.good()) {
        return decode_result::failure(decode_error::io_error,
            "Failed to write: " + path.string());
    }
    return decode_result::success();
}

} // namespace ultracode

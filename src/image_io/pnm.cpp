#include "io_helpers.hpp"

#include <cctype>
#include <charconv>
#include <string>

namespace ultracode {

namespace {

constexpr int PNM_TYPE_PBM_ASCII  = 1;  // P1
constexpr int PNM_TYPE_PGM_ASCII  = 2;  // P2
constexpr int PNM_TYPE_PPM_ASCII  = 3;  // P3
constexpr int PNM_TYPE_PBM_BINARY = 4;  // P4
constexpr int PNM_TYPE_PGM_BINARY = 5;  // P5
constexpr int PNM_TYPE_PPM_BINARY = 6;  // P6

struct pnm_header {
    int type = 0;
    std::size_t width = 0;
    std::size_t height = 0;
    unsigned maxval = 1;    // PBM has no maxval
    std::size_t data_offset = 0;
};

class pnm_parser {
public:
    explicit pnm_parser(std::span<const std::uint8_t> data)
        : data_(data), pos_(0) {}

    bool parse_header(pnm_header& header) {
        if (data_.size() < 3 || data_[0] != 'P' || data_[1] < '1' || data_[1] > '6') {
            return false;
        }
        header.type = data_[1] - '0';
        pos_ = 2;

        if (!skip_whitespace_and_comments() || !parse_number(header.width) || header.width == 0) {
            return false;
        }
        if (!skip_whitespace_and_comments() || !parse_number(header.height) || header.height == 0) {
            return false;
        }

        if (header.type != PNM_TYPE_PBM_ASCII && header.type != PNM_TYPE_PBM_BINARY) {
            if (!skip_whitespace_and_comments() || !parse_number(header.maxval)) {
                return false;
            }
            if (header.maxval == 0 || header.maxval > 65535) {
                return false;
            }
        }

        if (header.type >= PNM_TYPE_PBM_BINARY) {
            // One whitespace byte ends the header; everything after it is pixel data
            if (pos_ >= data_.size() || !std::isspace(data_[pos_])) {
                return false;
            }
            ++pos_;
        } else if (!skip_whitespace_and_comments()) {
            return false;
        }

        header.data_offset = pos_;
        return true;
    }

private:
    bool skip_whitespace_and_comments() {
        while (pos_ < data_.size()) {
            if (data_[pos_] == '#') {
                while (pos_ < data_.size() && data_[pos_] != '\n') {
                    ++pos_;
                }
            } else if (std::isspace(data_[pos_])) {
                ++pos_;
            } else {
                return true;
            }
        }
        return false;
    }

    template <typename T>
    bool parse_number(T& value) {
        if (pos_ >= data_.size()) return false;

        const char* start = reinterpret_cast<const char*>(data_.data() + pos_);
        const char* end = reinterpret_cast<const char*>(data_.data() + data_.size());

        auto result = std::from_chars(start, end, value);
        if (result.ec != std::errc{}) return false;

        pos_ += static_cast<std::size_t>(result.ptr - start);
        return true;
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_;
};

// Pulls whitespace-separated ASCII samples
class ascii_reader {
public:
    ascii_reader(std::span<const std::uint8_t> data, std::size_t offset)
        : ptr_(reinterpret_cast<const char*>(data.data()) + offset),
          end_(reinterpret_cast<const char*>(data.data()) + data.size()) {}

    bool next(unsigned& value) {
        while (ptr_ < end_ && (std::isspace(static_cast<unsigned char>(*ptr_)) || *ptr_ == '#')) {
            if (*ptr_ == '#') {
                while (ptr_ < end_ && *ptr_ != '\n') ++ptr_;
            } else {
                ++ptr_;
            }
        }
        if (ptr_ >= end_) return false;

        auto result = std::from_chars(ptr_, end_, value);
        if (result.ec != std::errc{}) return false;
        ptr_ = result.ptr;
        return true;
    }

    // P1 allows samples without separators ("0101")
    bool next_bit(unsigned& value) {
        while (ptr_ < end_ && std::isspace(static_cast<unsigned char>(*ptr_))) ++ptr_;
        if (ptr_ >= end_ || (*ptr_ != '0' && *ptr_ != '1')) return false;
        value = static_cast<unsigned>(*ptr_ - '0');
        ++ptr_;
        return true;
    }

private:
    const char* ptr_;
    const char* end_;
};

std::uint8_t scale(unsigned value, unsigned maxval) noexcept {
    if (value >= maxval) return 255;
    return static_cast<std::uint8_t>(value * 255u / maxval);
}

bool decode_pbm_ascii(std::span<const std::uint8_t> data, const pnm_header& header,
                      std::span<std::uint8_t> dst) {
    ascii_reader reader(data, header.data_offset);
    for (auto& px : dst) {
        unsigned bit = 0;
        if (!reader.next_bit(bit)) return false;
        // 1 = black
        px = bit ? 0 : 255;
    }
    return true;
}

bool decode_pbm_binary(std::span<const std::uint8_t> data, const pnm_header& header,
                       std::span<std::uint8_t> dst) {
    const std::size_t row_bytes = (header.width + 7) / 8;
    std::size_t pos = header.data_offset;

    for (std::size_t y = 0; y < header.height; ++y) {
        if (pos + row_bytes > data.size()) return false;
        for (std::size_t x = 0; x < header.width; ++x) {
            const int bit = (data[pos + x / 8] >> (7 - static_cast<int>(x % 8))) & 1;
            dst[y * header.width + x] = bit ? 0 : 255;
        }
        pos += row_bytes;
    }
    return true;
}

bool decode_ascii_samples(std::span<const std::uint8_t> data, const pnm_header& header,
                          std::size_t channels, std::span<std::uint8_t> dst) {
    ascii_reader reader(data, header.data_offset);
    for (auto& px : dst) {
        unsigned sample[3] = {0, 0, 0};
        for (std::size_t c = 0; c < channels; ++c) {
            if (!reader.next(sample[c])) return false;
        }
        if (channels == 1) {
            px = scale(sample[0], header.maxval);
        } else {
            px = luma(scale(sample[0], header.maxval),
                      scale(sample[1], header.maxval),
                      scale(sample[2], header.maxval));
        }
    }
    return true;
}

bool decode_binary_samples(std::span<const std::uint8_t> data, const pnm_header& header,
                           std::size_t channels, std::span<std::uint8_t> dst) {
    const std::size_t sample_bytes = header.maxval > 255 ? 2 : 1;
    const std::size_t pixel_bytes = sample_bytes * channels;
    if (header.data_offset > data.size() ||
        (data.size() - header.data_offset) / pixel_bytes < dst.size()) {
        return false;
    }

    const std::uint8_t* src = data.data() + header.data_offset;
    for (auto& px : dst) {
        unsigned sample[3] = {0, 0, 0};
        for (std::size_t c = 0; c < channels; ++c) {
            sample[c] = sample_bytes == 2 ? read_be16(src) : *src;
            src += sample_bytes;
        }
        if (channels == 1) {
            px = scale(sample[0], header.maxval);
        } else {
            px = luma(scale(sample[0], header.maxval),
                      scale(sample[1], header.maxval),
                      scale(sample[2], header.maxval));
        }
    }
    return true;
}

} // namespace

bool pnm_loader::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 3) return false;
    if (data[0] != 'P') return false;
    if (data[1] < '1' || data[1] > '6') return false;
    return std::isspace(data[2]) != 0;
}

decode_result pnm_loader::load(std::span<const std::uint8_t> data,
                               gray_buffer& buffer,
                               const load_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::invalid_format, "Not a valid PNM file");
    }

    pnm_header header;
    pnm_parser parser(data);
    if (!parser.parse_header(header)) {
        return decode_result::failure(decode_error::invalid_format, "Failed to parse PNM header");
    }

    auto result = validate_dimensions(header.width, header.height, options);
    if (!result) return result;

    if (!buffer.reset(header.width, header.height)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate image");
    }

    const auto dst = buffer.mutable_pixels();
    bool success = false;
    switch (header.type) {
        case PNM_TYPE_PBM_ASCII:
            success = decode_pbm_ascii(data, header, dst);
            break;
        case PNM_TYPE_PGM_ASCII:
            success = decode_ascii_samples(data, header, 1, dst);
            break;
        case PNM_TYPE_PPM_ASCII:
            success = decode_ascii_samples(data, header, 3, dst);
            break;
        case PNM_TYPE_PBM_BINARY:
            success = decode_pbm_binary(data, header, dst);
            break;
        case PNM_TYPE_PGM_BINARY:
            success = decode_binary_samples(data, header, 1, dst);
            break;
        case PNM_TYPE_PPM_BINARY:
            success = decode_binary_samples(data, header, 3, dst);
            break;
        default:
            return decode_result::failure(decode_error::unsupported_encoding,
                "Unsupported PNM type: P" + std::to_string(header.type));
    }

    if (!success) {
        return decode_result::failure(decode_error::truncated_data, "Failed to decode PNM pixel data");
    }
    return decode_result::success();
}

} // namespace ultracode

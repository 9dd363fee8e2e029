#include <ultracode/gray_image.hpp>

#include <algorithm>
#include <limits>
#include <new>
#include <string>

namespace ultracode {

decode_result gray_image::validate(const decode_options& options) const {
    if (width_ == 0 || height_ == 0) {
        return decode_result::failure(decode_error::invalid_input, "Image has a zero dimension");
    }

    if (width_ > std::numeric_limits<std::size_t>::max() / height_) {
        return decode_result::failure(decode_error::invalid_input, "Image dimensions overflow");
    }

    if (pixels_.size() != width_ * height_) {
        return decode_result::failure(decode_error::invalid_input,
            "Pixel buffer holds " + std::to_string(pixels_.size()) + " bytes, expected " +
            std::to_string(width_ * height_));
    }

    if (width_ > options.max_width || height_ > options.max_height) {
        return decode_result::failure(decode_error::invalid_input,
            "Image " + std::to_string(width_) + "x" + std::to_string(height_) +
            " exceeds the decode limits");
    }

    return decode_result::success();
}

bool gray_buffer::reset(std::size_t width, std::size_t height, std::uint8_t fill) {
    if (width == 0 || height == 0) {
        return false;
    }

    // Check for overflow in total size calculation
    if (width > std::numeric_limits<std::size_t>::max() / height) {
        return false;
    }
    const std::size_t total_size = width * height;

    // Sanity limit (256 MiB of 8-bit pixels)
    constexpr std::size_t MAX_BUFFER_SIZE = 256ULL * 1024ULL * 1024ULL;
    if (total_size > MAX_BUFFER_SIZE) {
        return false;
    }

    try {
        pixels_.assign(total_size, fill);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    return true;
}

void gray_buffer::set_pixel(std::size_t x, std::size_t y, std::uint8_t value) noexcept {
    if (x >= width_ || y >= height_) {
        return;
    }
    pixels_[y * width_ + x] = value;
}

void gray_buffer::fill_rect(std::size_t x, std::size_t y, std::size_t w, std::size_t h,
                            std::uint8_t value) noexcept {
    if (x >= width_ || y >= height_) {
        return;
    }
    const std::size_t x_end = std::min(width_, x + std::min(w, width_ - x));
    const std::size_t y_end = std::min(height_, y + std::min(h, height_ - y));

    for (std::size_t row = y; row < y_end; ++row) {
        auto* dst = pixels_.data() + row * width_;
        std::fill(dst + x, dst + x_end, value);
    }
}

} // namespace ultracode

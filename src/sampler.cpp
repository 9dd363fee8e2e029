#include <ultracode/sampler.hpp>

#include <algorithm>

namespace ultracode {

decode_result sample_rows(std::size_t height, std::size_t scan_rows,
                          std::vector<std::size_t>& out) {
    out.clear();
    if (height == 0) {
        return decode_result::failure(decode_error::invalid_input, "Image height is zero");
    }
    if (scan_rows == 0) {
        return decode_result::failure(decode_error::invalid_input, "scan_rows must be positive");
    }

    const std::size_t n = std::min(scan_rows, height);
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(((2 * i + 1) * height) / (2 * n));
    }
    return decode_result::success();
}

decode_result row_sampler::reset(const gray_image& image, std::size_t scan_rows) {
    rows_.clear();
    if (image.width() == 0) {
        return decode_result::failure(decode_error::invalid_input, "Image width is zero");
    }

    auto result = sample_rows(image.height(), scan_rows, rows_);
    if (!result) {
        return result;
    }

    image_ = image;
    return decode_result::success();
}

} // namespace ultracode

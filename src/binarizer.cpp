#include <ultracode/binarizer.hpp>

#include <algorithm>

namespace ultracode {

namespace {

struct row_stats {
    std::uint8_t min = 255;
    std::uint8_t max = 0;
    std::uint64_t sum = 0;
};

row_stats compute_stats(std::span<const std::uint8_t> row) noexcept {
    row_stats stats;
    for (auto v : row) {
        stats.min = std::min(stats.min, v);
        stats.max = std::max(stats.max, v);
        stats.sum += v;
    }
    return stats;
}

std::uint8_t threshold_from(const row_stats& stats, std::size_t count) noexcept {
    const auto mean = static_cast<unsigned>(stats.sum / count);
    const unsigned mid = (static_cast<unsigned>(stats.min) + stats.max) / 2;
    return static_cast<std::uint8_t>((mean + mid) / 2);
}

void binarize_global(std::span<const std::uint8_t> row, std::uint8_t threshold,
                     std::vector<std::uint8_t>& bits) {
    bits.resize(row.size());
    for (std::size_t i = 0; i < row.size(); ++i) {
        bits[i] = row[i] < threshold ? 1 : 0;
    }
}

void binarize_adaptive(std::span<const std::uint8_t> row,
                       std::vector<std::uint32_t>& prefix,
                       std::vector<std::uint8_t>& bits) {
    const std::size_t n = row.size();
    const std::size_t win = adaptive_window(n);

    prefix.resize(n + 1);
    prefix[0] = 0;
    for (std::size_t i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + row[i];
    }

    bits.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t left = i > win ? i - win : 0;
        const std::size_t right = std::min(i + win, n - 1);
        const auto count = static_cast<std::uint32_t>(right - left + 1);
        const auto mean = static_cast<int>((prefix[right + 1] - prefix[left]) / count);
        bits[i] = static_cast<int>(row[i]) < mean - ADAPTIVE_BIAS ? 1 : 0;
    }
}

} // namespace

std::uint8_t global_threshold(std::span<const std::uint8_t> row) noexcept {
    if (row.empty()) {
        return 0;
    }
    return threshold_from(compute_stats(row), row.size());
}

scan_error binarize_row(std::span<const std::uint8_t> row,
                        binarize_mode mode,
                        scanline_buffers& buffers,
                        int min_contrast) {
    buffers.bits.clear();
    if (row.empty()) {
        return scan_error::no_signal;
    }

    const auto stats = compute_stats(row);
    if (static_cast<int>(stats.max) - static_cast<int>(stats.min) < std::max(min_contrast, 1)) {
        return scan_error::no_signal;
    }

    if (mode == binarize_mode::global) {
        binarize_global(row, threshold_from(stats, row.size()), buffers.bits);
    } else {
        binarize_adaptive(row, buffers.prefix, buffers.bits);
    }
    return scan_error::none;
}

void extract_runs(std::span<const std::uint8_t> bits, std::vector<run>& out) {
    out.clear();
    if (bits.empty()) {
        return;
    }

    bool current = bits[0] != 0;
    std::uint32_t length = 1;
    for (std::size_t i = 1; i < bits.size(); ++i) {
        const bool b = bits[i] != 0;
        if (b == current) {
            ++length;
        } else {
            out.push_back({length, current ? polarity::bar : polarity::space});
            current = b;
            length = 1;
        }
    }
    out.push_back({length, current ? polarity::bar : polarity::space});
}

void reverse_runs(std::span<const run> runs, std::vector<run>& out) {
    out.assign(runs.rbegin(), runs.rend());
}

} // namespace ultracode

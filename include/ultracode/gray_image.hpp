#ifndef ULTRACODE_GRAY_IMAGE_HPP_
#define ULTRACODE_GRAY_IMAGE_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ultracode {

// ============================================================================
// Grayscale Image View
// ============================================================================

/**
 * Non-owning view of an 8-bit grayscale image.
 * Pixels are row-major, one byte per pixel, no row padding:
 * pixel (x, y) lives at pixels()[y * width() + x].
 *
 * The view never copies; the caller's buffer must outlive it.
 */
class ULTRACODE_EXPORT gray_image {
public:
    gray_image() noexcept = default;

    gray_image(std::span<const std::uint8_t> pixels,
               std::size_t width,
               std::size_t height) noexcept
        : pixels_(pixels), width_(width), height_(height) {}

    /**
     * Check the buffer against the declared dimensions.
     * @return invalid_input if a dimension is zero, the buffer size is not
     *         width * height, or the image is larger than the limits in
     *         options
     */
    [[nodiscard]] decode_result validate(const decode_options& options = {}) const;

    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] bool empty() const noexcept { return width_ == 0 || height_ == 0; }

    /**
     * Row y as a view into the buffer. Only valid on a validated image.
     */
    [[nodiscard]] std::span<const std::uint8_t> row(std::size_t y) const noexcept {
        return pixels_.subspan(y * width_, width_);
    }

private:
    std::span<const std::uint8_t> pixels_;
    std::size_t width_ = 0;
    std::size_t height_ = 0;
};

// ============================================================================
// Owning Grayscale Buffer
// ============================================================================

/**
 * In-memory grayscale image. Used by the renderer and the image loaders.
 */
class ULTRACODE_EXPORT gray_buffer {
public:
    gray_buffer() = default;

    gray_buffer(const gray_buffer&) = delete;
    gray_buffer& operator=(const gray_buffer&) = delete;
    gray_buffer(gray_buffer&&) noexcept = default;
    gray_buffer& operator=(gray_buffer&&) noexcept = default;

    /**
     * Resize and fill with a constant value.
     * @return false if the dimensions are zero or the allocation fails
     */
    bool reset(std::size_t width, std::size_t height, std::uint8_t fill = 255);

    void set_pixel(std::size_t x, std::size_t y, std::uint8_t value) noexcept;

    /**
     * Fill the rectangle [x, x + w) x [y, y + h), clipped to the image.
     */
    void fill_rect(std::size_t x, std::size_t y, std::size_t w, std::size_t h,
                   std::uint8_t value) noexcept;

    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }

    [[nodiscard]] gray_image view() const noexcept {
        return gray_image(pixels_, width_, height_);
    }

private:
    std::vector<std::uint8_t> pixels_;
    std::size_t width_ = 0;
    std::size_t height_ = 0;
};

} // namespace ultracode

#endif // ULTRACODE_GRAY_IMAGE_HPP_

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace scanprep::core {

/// Memory: ImageBuffer owns a single contiguous, tightly packed buffer
/// (std::vector<std::byte>); stages hand buffers on by value/move, never by alias.
/// Thread-safety: distinct ImageBuffer instances are independent.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  Binary8,  // one byte per pixel, samples are kInk or kPaper only
  BGR8,
  BGRA8,
};

/// Sample values of a Binary8 image.
inline constexpr std::uint8_t kInk = 0;
inline constexpr std::uint8_t kPaper = 255;

/// A 2D grid of 8-bit samples: dimensions, format and pixel buffer.
class ImageBuffer {
 public:
  ImageBuffer() = default;

  ImageBuffer(std::uint32_t width,
              std::uint32_t height,
              PixelFormat format,
              std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  /// Image of the given size with every byte set to \p fill.
  [[nodiscard]] static ImageBuffer filled(std::uint32_t width,
                                          std::uint32_t height,
                                          PixelFormat format,
                                          std::uint8_t fill);

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept {
    return channel_count(format_);
  }

  /// Mutable view of the buffer (owned).
  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] std::uint8_t at(std::uint32_t x, std::uint32_t y,
                                std::uint32_t channel = 0) const noexcept {
    const std::size_t idx =
        (static_cast<std::size_t>(y) * width_ + x) * channels() + channel;
    return static_cast<std::uint8_t>(buffer_[idx]);
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Non-empty, known format and buffer size matching the dimensions.
  [[nodiscard]] bool valid() const noexcept;

  /// True for a valid Binary8 image whose samples are all kInk or kPaper.
  [[nodiscard]] bool is_two_level() const noexcept;

  [[nodiscard]] static std::uint32_t channel_count(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace scanprep::core

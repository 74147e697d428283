#include <scanprep/core/image.hpp>
#include <algorithm>
#include <cstddef>

namespace scanprep::core {

ImageBuffer ImageBuffer::filled(std::uint32_t width,
                                std::uint32_t height,
                                PixelFormat format,
                                std::uint8_t fill) {
  std::vector<std::byte> buffer(min_bytes(width, height, format),
                                static_cast<std::byte>(fill));
  return ImageBuffer(width, height, format, std::move(buffer));
}

std::uint32_t ImageBuffer::channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
    case PixelFormat::Binary8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t ImageBuffer::min_bytes(std::uint32_t width,
                                   std::uint32_t height,
                                   PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channel_count(format);
}

bool ImageBuffer::valid() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) {
    return false;
  }
  return buffer_.size() == min_bytes(width_, height_, format_);
}

bool ImageBuffer::is_two_level() const noexcept {
  if (format_ != PixelFormat::Binary8 || !valid()) return false;
  return std::all_of(buffer_.begin(), buffer_.end(), [](std::byte b) {
    const auto v = static_cast<std::uint8_t>(b);
    return v == kInk || v == kPaper;
  });
}

}  // namespace scanprep::core

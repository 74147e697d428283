#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <expected>
#include <filesystem>

namespace scanprep::vision {

/// Decode an image file into a BGR8 or Grayscale8 ImageBuffer.
/// LoadFailed if the file is missing or not decodable.
[[nodiscard]] std::expected<scanprep::core::ImageBuffer, scanprep::core::PipelineError>
load_image(const std::filesystem::path& path);

/// Encode an image to \p path; the codec follows the file extension.
/// Creates missing parent directories. WriteFailed on any error.
[[nodiscard]] std::expected<void, scanprep::core::PipelineError>
write_image(const std::filesystem::path& path, const scanprep::core::ImageBuffer& image);

}  // namespace scanprep::vision

#include <scanprep/core/error.hpp>

namespace scanprep::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidImage:
      return "InvalidImage";
    case PipelineError::LoadFailed:
      return "LoadFailed";
    case PipelineError::ScoreUnavailable:
      return "ScoreUnavailable";
    case PipelineError::BinarizationFailed:
      return "BinarizationFailed";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::CacheIOError:
      return "CacheIOError";
    case PipelineError::WriteFailed:
      return "WriteFailed";
  }
  return "Unknown";
}

}  // namespace scanprep::core

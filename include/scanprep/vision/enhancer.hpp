#pragma once

#include <scanprep/core/pipeline.hpp>
#include <scanprep/vision/contrast_enhance_stage.hpp>
#include <scanprep/vision/denoise_stage.hpp>

namespace scanprep::vision {

/// Shared enhancer used by both binarization branches:
/// grayscale -> non-local-means denoise [-> contrast stretch + CLAHE].
[[nodiscard]] scanprep::core::Pipeline make_enhancer(bool contrast_enhance,
                                                     DenoiseParams denoise = {},
                                                     ContrastParams contrast = {});

}  // namespace scanprep::vision

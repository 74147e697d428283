#include <scanprep/vision/enhancer.hpp>
#include <scanprep/vision/grayscale_stage.hpp>
#include <memory>

namespace scanprep::vision {

scanprep::core::Pipeline make_enhancer(bool contrast_enhance,
                                       DenoiseParams denoise,
                                       ContrastParams contrast) {
  scanprep::core::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<GrayscaleStage>());
  pipeline.add_stage(std::make_unique<DenoiseStage>(denoise));
  if (contrast_enhance) {
    pipeline.add_stage(std::make_unique<ContrastEnhanceStage>(contrast));
  }
  return pipeline;
}

}  // namespace scanprep::vision

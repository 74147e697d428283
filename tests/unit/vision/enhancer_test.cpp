#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/vision/contrast_enhance_stage.hpp>
#include <scanprep/vision/denoise_stage.hpp>
#include <scanprep/vision/enhancer.hpp>
#include <scanprep/vision/grayscale_stage.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <vector>

namespace sc = scanprep::core;
namespace sv = scanprep::vision;

namespace {

// Vertical stripes, 4 pixels wide, alternating between two gray levels.
sc::ImageBuffer make_stripes(std::uint32_t w, std::uint32_t h, std::uint8_t a, std::uint8_t b) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      buf[static_cast<std::size_t>(y) * w + x] = static_cast<std::byte>((x / 4) % 2 ? b : a);
    }
  }
  return sc::ImageBuffer(w, h, sc::PixelFormat::Grayscale8, std::move(buf));
}

}  // namespace

TEST(GrayscaleStage, ConvertsBgrWithLumaWeights) {
  std::vector<std::byte> buf;
  for (int i = 0; i < 4; ++i) {
    buf.push_back(std::byte{255});  // B
    buf.push_back(std::byte{0});    // G
    buf.push_back(std::byte{0});    // R
  }
  sc::ImageBuffer blue(2, 2, sc::PixelFormat::BGR8, std::move(buf));
  sv::GrayscaleStage stage;
  auto result = stage.process(blue);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->format(), sc::PixelFormat::Grayscale8);
  EXPECT_NEAR(result->at(1, 1), 29, 1);
}

TEST(GrayscaleStage, GrayInputIsCopied) {
  auto gray = sc::ImageBuffer::filled(3, 3, sc::PixelFormat::Grayscale8, 77);
  sv::GrayscaleStage stage;
  auto result = stage.process(gray);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->at(2, 2), 77);
}

TEST(GrayscaleStage, InvalidImageIsRejected) {
  sv::GrayscaleStage stage;
  auto result = stage.process(sc::ImageBuffer{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InvalidImage);
}

TEST(DenoiseStage, KeepsUniformImage) {
  auto gray = sc::ImageBuffer::filled(32, 32, sc::PixelFormat::Grayscale8, 180);
  sv::DenoiseStage stage;
  auto result = stage.process(gray);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->at(0, 0), 180);
  EXPECT_EQ(result->at(16, 16), 180);
}

TEST(DenoiseStage, RequiresGrayscale) {
  auto bgr = sc::ImageBuffer::filled(8, 8, sc::PixelFormat::BGR8, 10);
  sv::DenoiseStage stage;
  auto result = stage.process(bgr);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InvalidImage);
}

TEST(ContrastEnhanceStage, ConstantImageIsUnchanged) {
  auto gray = sc::ImageBuffer::filled(16, 16, sc::PixelFormat::Grayscale8, 100);
  sv::ContrastEnhanceStage stage;
  auto result = stage.process(gray);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->at(0, 0), 100);
  EXPECT_EQ(result->at(15, 15), 100);
}

TEST(ContrastEnhanceStage, StretchesLowContrast) {
  auto gray = make_stripes(64, 64, 100, 150);
  sv::ContrastEnhanceStage stage;
  auto result = stage.process(gray);
  ASSERT_TRUE(result.has_value());
  const int dark = result->at(33, 32);   // stripe 8: level 100
  const int bright = result->at(37, 32); // stripe 9: level 150
  EXPECT_LT(dark, bright);
  EXPECT_GE(bright - dark, 100);
}

TEST(Enhancer, ContrastStepIsOptional) {
  EXPECT_EQ(sv::make_enhancer(false).stage_count(), 2u);
  EXPECT_EQ(sv::make_enhancer(true).stage_count(), 3u);
}

TEST(Enhancer, WhitePageStaysWhite) {
  auto page = sc::ImageBuffer::filled(40, 30, sc::PixelFormat::BGR8, 255);
  for (bool contrast : {false, true}) {
    auto result = sv::make_enhancer(contrast).run(page);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->format(), sc::PixelFormat::Grayscale8);
    EXPECT_EQ(result->width(), 40u);
    EXPECT_EQ(result->height(), 30u);
    for (auto b : result->data()) {
      ASSERT_EQ(static_cast<std::uint8_t>(b), 255);
    }
  }
}

TEST(Enhancer, IsDeterministic) {
  auto page = make_stripes(48, 48, 60, 200);
  auto enhancer = sv::make_enhancer(true);
  auto a = enhancer.run(page);
  auto b = enhancer.run(page);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_TRUE(std::equal(a->data().begin(), a->data().end(), b->data().begin(), b->data().end()));
}

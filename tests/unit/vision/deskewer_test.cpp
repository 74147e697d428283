#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/vision/deskewer.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace sc = scanprep::core;
namespace sv = scanprep::vision;

namespace {

// 300x200 binary page with four horizontal 3-pixel text-line bars.
sc::ImageBuffer make_lined_page() {
  cv::Mat page(200, 300, CV_8UC1, cv::Scalar(sc::kPaper));
  for (int y : {50, 80, 110, 140}) {
    cv::rectangle(page, cv::Point(40, y), cv::Point(259, y + 2), cv::Scalar(sc::kInk), cv::FILLED);
  }
  std::vector<std::byte> buf(page.total());
  std::memcpy(buf.data(), page.data, buf.size());
  return sc::ImageBuffer(300, 200, sc::PixelFormat::Binary8, std::move(buf));
}

sc::ImageBuffer skewed_page(double angle_deg) {
  auto rotated = sv::rotate_binary(make_lined_page(), angle_deg);
  EXPECT_TRUE(rotated.has_value());
  return std::move(*rotated);
}

}  // namespace

TEST(Deskewer, AlignedPageIsNotRotated) {
  auto page = make_lined_page();
  EXPECT_DOUBLE_EQ(sv::estimate_skew(page, sv::DeskewParams{}), 0.0);

  auto result = sv::deskew(page, sv::DeskewParams{});
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->angle_deg, 0.0);
  EXPECT_TRUE(std::equal(page.data().begin(), page.data().end(), result->image.data().begin(),
                         result->image.data().end()));
}

TEST(Deskewer, FindsCounterRotation) {
  auto skewed = skewed_page(7.0);
  EXPECT_NEAR(sv::estimate_skew(skewed, sv::DeskewParams{}), -7.0, 0.5);

  auto clockwise = skewed_page(-4.0);
  EXPECT_NEAR(sv::estimate_skew(clockwise, sv::DeskewParams{}), 4.0, 0.5);
}

TEST(Deskewer, DeskewedPageHasNoResidualSkew) {
  auto result = sv::deskew(skewed_page(7.0), sv::DeskewParams{});
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->angle_deg, -7.0, 0.5);
  EXPECT_TRUE(result->image.is_two_level());
  EXPECT_EQ(result->image.width(), 300u);
  EXPECT_EQ(result->image.height(), 200u);
  EXPECT_NEAR(sv::estimate_skew(result->image, sv::DeskewParams{}), 0.0, 0.5);
}

TEST(Deskewer, ThinnedInkStillFindsTheAngle) {
  sv::DeskewParams params;
  params.max_ink_points = 1000;  // the page has about 2600 ink pixels
  EXPECT_NEAR(sv::estimate_skew(skewed_page(7.0), params), -7.0, 0.5);
  EXPECT_DOUBLE_EQ(sv::estimate_skew(make_lined_page(), params), 0.0);
}

TEST(Deskewer, AngleStaysWithinSweep) {
  sv::DeskewParams params;
  params.max_angle_deg = 3.0;
  const double angle = sv::estimate_skew(skewed_page(8.0), params);
  EXPECT_GE(angle, -3.0);
  EXPECT_LE(angle, 3.0);
}

TEST(Deskewer, BlankPageIsNotRotated) {
  auto blank = sc::ImageBuffer::filled(64, 48, sc::PixelFormat::Binary8, sc::kPaper);
  auto result = sv::deskew(blank, sv::DeskewParams{});
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->angle_deg, 0.0);
  for (auto b : result->image.data()) {
    ASSERT_EQ(static_cast<std::uint8_t>(b), sc::kPaper);
  }
}

TEST(Deskewer, TiedAnglesPreferNoRotation) {
  // A single dot has the same profile at every angle.
  auto dot = sc::ImageBuffer::filled(31, 31, sc::PixelFormat::Binary8, sc::kPaper);
  dot.data()[15 * 31 + 15] = static_cast<std::byte>(sc::kInk);
  EXPECT_DOUBLE_EQ(sv::estimate_skew(dot, sv::DeskewParams{}), 0.0);
}

TEST(Deskewer, RejectsGrayscaleInput) {
  auto gray = sc::ImageBuffer::filled(8, 8, sc::PixelFormat::Grayscale8, 255);
  auto result = sv::deskew(gray, sv::DeskewParams{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InvalidImage);
}

TEST(Deskewer, RejectsInvalidSweep) {
  sv::DeskewParams params;
  params.step_deg = 0.0;
  auto result = sv::deskew(make_lined_page(), params);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InvalidConfig);
}

TEST(Deskewer, RotationFillsWithBackground) {
  auto ink = sc::ImageBuffer::filled(40, 40, sc::PixelFormat::Binary8, sc::kInk);
  auto rotated = sv::rotate_binary(ink, 30.0);
  ASSERT_TRUE(rotated.has_value());
  EXPECT_TRUE(rotated->is_two_level());
  EXPECT_EQ(rotated->at(0, 0), sc::kPaper);
  EXPECT_EQ(rotated->at(20, 20), sc::kInk);
}

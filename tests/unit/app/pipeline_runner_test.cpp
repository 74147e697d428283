#include <scanprep/app/config.hpp>
#include <scanprep/app/document_processor.hpp>
#include <scanprep/app/pipeline_runner.hpp>
#include <scanprep/app/run_summary.hpp>
#include <scanprep/vision/mock_binarizer_backend.hpp>
#include <scanprep/vision/mock_quality_assessor.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace sa = scanprep::app;
namespace sv = scanprep::vision;

namespace {

class PipelineRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("scanprep_runner_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(root_);
    fs::create_directories(root_ / "in");
    for (int i = 0; i < 6; ++i) {
      const fs::path p = root_ / "in" / ("page_" + std::to_string(i) + ".png");
      cv::Mat page(32, 48, CV_8UC1, cv::Scalar(255));
      ASSERT_TRUE(cv::imwrite(p.string(), page));
      files_.push_back(p);
    }
    assessor_ = std::make_shared<sv::MockQualityAssessor>(0.9);
    binarizer_ = std::make_shared<sv::MockBinarizerBackend>();
  }
  void TearDown() override { fs::remove_all(root_); }

  fs::path root_;
  std::vector<fs::path> files_;
  std::shared_ptr<sv::MockQualityAssessor> assessor_;
  std::shared_ptr<sv::MockBinarizerBackend> binarizer_;
};

}  // namespace

TEST_F(PipelineRunnerTest, SequentialProcessesEveryFile) {
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);
  const sa::RunSummary summary = sa::run_batch(processor, files_);
  EXPECT_EQ(summary.total, 6u);
  EXPECT_EQ(summary.processed, 6u);
  EXPECT_TRUE(summary.clean());
  EXPECT_EQ(summary.not_started(), 0u);
  for (const auto& f : files_) {
    EXPECT_TRUE(fs::exists(root_ / "out" / f.filename()));
  }
}

TEST_F(PipelineRunnerTest, ParallelRoutesEachFileOnce) {
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);
  std::mutex mutex;
  std::multiset<fs::path> seen;
  const sa::RunSummary summary = sa::run_batch_parallel(
      processor, files_, 3, nullptr, [&](const sa::FileOutcome& outcome) {
        std::lock_guard lock(mutex);
        seen.insert(outcome.source);
      });
  EXPECT_EQ(summary.processed, 6u);
  EXPECT_TRUE(summary.clean());
  ASSERT_EQ(seen.size(), 6u);
  for (const auto& f : files_) {
    EXPECT_EQ(seen.count(f), 1u);
  }
  EXPECT_EQ(assessor_->call_count(), 6u);
  EXPECT_EQ(binarizer_->call_count(), 6u);
}

TEST_F(PipelineRunnerTest, FailuresAreCountedNotFatal) {
  std::ofstream(root_ / "in" / "broken.png") << "not an image";
  files_.push_back(root_ / "in" / "broken.png");
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);

  const sa::RunSummary summary = sa::run_batch_parallel(processor, files_, 4);
  EXPECT_EQ(summary.processed, 6u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_FALSE(summary.clean());
  ASSERT_EQ(summary.problems.size(), 1u);
  EXPECT_EQ(summary.problems[0].file.filename(), "broken.png");
  EXPECT_EQ(summary.problems[0].error, scanprep::core::PipelineError::LoadFailed);
}

TEST_F(PipelineRunnerTest, SkippedFilesMakeTheRunUnclean) {
  assessor_->set_fail(true);
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);
  const sa::RunSummary summary = sa::run_batch(processor, files_);
  EXPECT_EQ(summary.skipped, 6u);
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_FALSE(summary.clean());
  EXPECT_EQ(summary.problems.size(), 6u);
}

TEST_F(PipelineRunnerTest, CancelStopsBetweenFiles) {
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);
  std::atomic<bool> cancel{false};
  const sa::RunSummary summary = sa::run_batch(
      processor, files_, &cancel, [&](const sa::FileOutcome&) { cancel.store(true); });
  EXPECT_TRUE(summary.cancelled);
  EXPECT_EQ(summary.processed, 1u);
  EXPECT_EQ(summary.not_started(), 5u);
  EXPECT_FALSE(summary.clean());
}

TEST_F(PipelineRunnerTest, PreCancelledParallelRunStartsNothing) {
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);
  std::atomic<bool> cancel{true};
  const sa::RunSummary summary = sa::run_batch_parallel(processor, files_, 2, &cancel);
  EXPECT_TRUE(summary.cancelled);
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_EQ(assessor_->call_count(), 0u);
}

TEST_F(PipelineRunnerTest, EmptyInputIsClean) {
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);
  const sa::RunSummary summary = sa::run_batch_parallel(processor, {}, 4);
  EXPECT_EQ(summary.total, 0u);
  EXPECT_TRUE(summary.clean());
}

TEST_F(PipelineRunnerTest, CollidingOutputNamesAreReportedAsFailures) {
  const fs::path jpg = root_ / "in" / "page_0.jpg";
  const fs::path tif = root_ / "in" / "page_0.tif";
  ASSERT_TRUE(cv::imwrite(jpg.string(), cv::Mat(32, 48, CV_8UC1, cv::Scalar(255))));
  ASSERT_TRUE(cv::imwrite(tif.string(), cv::Mat(32, 48, CV_8UC1, cv::Scalar(255))));
  files_.push_back(jpg);
  files_.push_back(tif);
  std::sort(files_.begin(), files_.end());
  sa::DocumentProcessor processor(sa::default_config(), root_ / "in", root_ / "out", assessor_,
                                  binarizer_, nullptr);

  const sa::RunSummary summary = sa::run_batch_parallel(processor, files_, 4);
  EXPECT_EQ(summary.total, 8u);
  EXPECT_EQ(summary.processed, 6u);
  EXPECT_EQ(summary.failed, 2u);
  EXPECT_FALSE(summary.clean());
  ASSERT_EQ(summary.problems.size(), 2u);
  // page_0.jpg sorts first and keeps page_0.png.
  EXPECT_EQ(summary.problems[0].file, root_ / "in" / "page_0.png");
  EXPECT_EQ(summary.problems[1].file, tif);
  for (const auto& problem : summary.problems) {
    EXPECT_EQ(problem.error, scanprep::core::PipelineError::WriteFailed);
  }
  EXPECT_EQ(assessor_->call_count(), 6u);
}

#pragma once

#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace scanprep::vision::detail {

/// Time budget of one model call, which may span several Session::Run calls
/// (one per patch). A zero timeout means no limit.
class RunDeadline {
 public:
  using Clock = std::chrono::steady_clock;

  explicit RunDeadline(std::chrono::milliseconds timeout)
      : limited_(timeout.count() > 0), deadline_(Clock::now() + timeout) {}

  [[nodiscard]] bool limited() const noexcept { return limited_; }

  [[nodiscard]] bool expired() const { return limited_ && Clock::now() >= deadline_; }

  /// Watchdog timeout for the next Run(): the time left (at least 1 ms), or
  /// zero when the call is unlimited.
  [[nodiscard]] std::chrono::milliseconds remaining() const {
    if (!limited_) return std::chrono::milliseconds{0};
    const auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds{1});
  }

 private:
  bool limited_;
  Clock::time_point deadline_;
};

/// Terminates an in-flight Ort::Session::Run once \p timeout elapses.
/// Scope it around the Run() call; a zero timeout disables the watchdog.
class RunWatchdog {
 public:
  RunWatchdog(Ort::RunOptions& run_options, std::chrono::milliseconds timeout)
      : run_options_(run_options) {
    if (timeout.count() <= 0) return;
    thread_ = std::thread([this, timeout]() {
      std::unique_lock lock(mutex_);
      if (!cv_.wait_for(lock, timeout, [this]() { return done_; })) {
        fired_ = true;
        run_options_.SetTerminate();
      }
    });
  }

  ~RunWatchdog() {
    {
      std::lock_guard lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  RunWatchdog(const RunWatchdog&) = delete;
  RunWatchdog& operator=(const RunWatchdog&) = delete;

  /// True when a timer thread is watching the run.
  [[nodiscard]] bool armed() const noexcept { return thread_.joinable(); }

  [[nodiscard]] bool fired() const noexcept { return fired_.load(); }

 private:
  Ort::RunOptions& run_options_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool done_{false};
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

}  // namespace scanprep::vision::detail

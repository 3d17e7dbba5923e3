#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

// One-second window rate cap for outbound uploads. account() is called after
// every chunk and returns how long the caller must sleep to bring the window
// rate back under the limit. A limit of 0 disables throttling.
class UploadThrottle {
public:
  using Clock = std::chrono::steady_clock;

  explicit UploadThrottle(uint64_t bytes_per_second = 0, Clock::time_point now = Clock::now());

  void set_limit(uint64_t bytes_per_second);
  uint64_t limit() const { return limit_; }

  std::chrono::milliseconds account(std::size_t bytes, Clock::time_point now);

private:
  uint64_t limit_ = 0;
  uint64_t window_bytes_ = 0;
  Clock::time_point window_start_;
};

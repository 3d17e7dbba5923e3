#include "upload_throttle.hpp"

#include <cmath>

UploadThrottle::UploadThrottle(uint64_t bytes_per_second, Clock::time_point now)
  : limit_(bytes_per_second), window_start_(now) {}

void UploadThrottle::set_limit(uint64_t bytes_per_second) {
  limit_ = bytes_per_second;
  window_bytes_ = 0;
  window_start_ = Clock::now();
}

std::chrono::milliseconds UploadThrottle::account(std::size_t bytes, Clock::time_point now) {
  if(limit_ == 0) return std::chrono::milliseconds(0);
  window_bytes_ += bytes;

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window_start_);
  std::chrono::milliseconds delay(0);
  if(elapsed.count() > 0) {
    double rate = static_cast<double>(window_bytes_) / static_cast<double>(elapsed.count()) * 1000.0;
    if(rate > static_cast<double>(limit_)) {
      double target_ms = static_cast<double>(window_bytes_) / static_cast<double>(limit_) * 1000.0;
      auto sleep_ms = static_cast<long long>(std::ceil(target_ms - static_cast<double>(elapsed.count())));
      if(sleep_ms > 0) delay = std::chrono::milliseconds(sleep_ms);
    }
  }

  auto after = now + delay;
  if(after - window_start_ >= std::chrono::seconds(1)) {
    window_bytes_ = 0;
    window_start_ = after;
  }
  return delay;
}

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "device.hpp"
#include "event_channel.hpp"
#include "log.hpp"

enum class LatencyQuality { Excellent, Good, Fair, Poor, Offline, Unknown };

const char* to_string(LatencyQuality quality);
LatencyQuality latency_quality(std::optional<int> ms);
// "offline", "<1 ms", "12 ms"; empty when unknown.
std::string format_latency(std::optional<int> ms);

// Periodic round-trip measurement of GET /api/ping per known device.
// -1 marks an unreachable sample.
class LatencyProber {
public:
  struct Options {
    std::chrono::milliseconds interval{10000};
    std::chrono::milliseconds timeout{3000};
    std::size_t window = 5;
  };

  using LatencyMap = std::map<std::string, int>;
  using Pinger = std::function<int(const Device&)>;

  explicit LatencyProber(Options options, std::shared_ptr<Logger> logger = nullptr, Pinger pinger = {});
  ~LatencyProber();

  void start();
  void stop();

  int ping_device(const Device& device) const;
  // Replaces the tracked set and drops history for devices no longer listed.
  void update_devices(const std::vector<Device>& devices);
  // Pings every device in parallel, then publishes the latest map.
  void measure_all();
  // Ignored for ids outside the tracked set.
  void record(const std::string& device_id, int ms);

  std::optional<int> latest(const std::string& device_id) const;
  std::optional<int> average(const std::string& device_id) const;
  LatencyMap current() const;

  SubscriptionHandle subscribe(EventChannel<LatencyMap>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);

private:
  void run_loop();

  Options options_;
  std::shared_ptr<Logger> logger_;
  Pinger pinger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Device> devices_;
  std::map<std::string, std::deque<int>> history_;
  LatencyMap current_;
  bool running_ = false;
  std::thread thread_;
  EventChannel<LatencyMap> events_;
};

#include "latency_prober.hpp"

#include <future>
#include <algorithm>
#include <iterator>

#include "http_client.hpp"

const char* to_string(LatencyQuality quality) {
  switch(quality) {
    case LatencyQuality::Excellent: return "excellent";
    case LatencyQuality::Good: return "good";
    case LatencyQuality::Fair: return "fair";
    case LatencyQuality::Poor: return "poor";
    case LatencyQuality::Offline: return "offline";
    case LatencyQuality::Unknown: return "unknown";
  }
  return "unknown";
}

LatencyQuality latency_quality(std::optional<int> ms) {
  if(!ms) return LatencyQuality::Unknown;
  if(*ms < 0) return LatencyQuality::Offline;
  if(*ms <= 10) return LatencyQuality::Excellent;
  if(*ms <= 50) return LatencyQuality::Good;
  if(*ms <= 200) return LatencyQuality::Fair;
  return LatencyQuality::Poor;
}

std::string format_latency(std::optional<int> ms) {
  if(!ms) return "";
  if(*ms < 0) return "offline";
  if(*ms < 1) return "<1 ms";
  return std::to_string(*ms) + " ms";
}

LatencyProber::LatencyProber(Options options, std::shared_ptr<Logger> logger, Pinger pinger)
  : options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("latency")),
    pinger_(std::move(pinger)) {
  if(options_.window == 0) options_.window = 1;
}

LatencyProber::~LatencyProber() {
  stop();
}

int LatencyProber::ping_device(const Device& device) const {
  if(pinger_) return pinger_(device);
  auto started = std::chrono::steady_clock::now();
  HttpClient client(device.ip, device.port);
  auto result = client.get("/api/ping", options_.timeout);
  if(!result.ok()) return -1;
  auto elapsed = std::chrono::steady_clock::now() - started;
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void LatencyProber::update_devices(const std::vector<Device>& devices) {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_ = devices;
  for(auto it = history_.begin(); it != history_.end();) {
    bool active = std::any_of(devices.begin(), devices.end(),
                              [&](const Device& d){ return d.id == it->first; });
    if(active) {
      ++it;
    } else {
      current_.erase(it->first);
      it = history_.erase(it);
    }
  }
  for(auto it = current_.begin(); it != current_.end();) {
    bool active = std::any_of(devices.begin(), devices.end(),
                              [&](const Device& d){ return d.id == it->first; });
    it = active ? std::next(it) : current_.erase(it);
  }
}

void LatencyProber::record(const std::string& device_id, int ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  // a measurement can outlive the device's removal from the tracked set
  bool tracked = std::any_of(devices_.begin(), devices_.end(),
                             [&](const Device& d){ return d.id == device_id; });
  if(!tracked) return;
  current_[device_id] = ms;
  auto& samples = history_[device_id];
  samples.push_back(ms);
  while(samples.size() > options_.window) samples.pop_front();
}

void LatencyProber::measure_all() {
  std::vector<Device> devices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    devices = devices_;
  }
  if(devices.empty()) return;

  std::vector<std::future<int>> pending;
  pending.reserve(devices.size());
  for(const auto& device : devices) {
    pending.push_back(std::async(std::launch::async, [this, device]{ return ping_device(device); }));
  }
  for(std::size_t i = 0; i < devices.size(); ++i) {
    int ms = pending[i].get();
    record(devices[i].id, ms);
    logger_->debug("{}: {}", devices[i].name, format_latency(ms));
  }
  events_.publish(current());
}

std::optional<int> LatencyProber::latest(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = current_.find(device_id);
  if(it == current_.end()) return std::nullopt;
  return it->second;
}

std::optional<int> LatencyProber::average(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = history_.find(device_id);
  if(it == history_.end()) return std::nullopt;
  long long sum = 0;
  int count = 0;
  for(int sample : it->second) {
    if(sample < 0) continue;
    sum += sample;
    ++count;
  }
  if(count == 0) return std::nullopt;
  return static_cast<int>(sum / count);
}

LatencyProber::LatencyMap LatencyProber::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

SubscriptionHandle LatencyProber::subscribe(EventChannel<LatencyMap>::Callback callback) {
  return events_.subscribe(std::move(callback));
}

void LatencyProber::unsubscribe(SubscriptionHandle handle) {
  events_.unsubscribe(handle);
}

void LatencyProber::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(running_) return;
  running_ = true;
  thread_ = std::thread([this]{ run_loop(); });
}

void LatencyProber::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void LatencyProber::run_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while(running_) {
    lock.unlock();
    measure_all();
    lock.lock();
    cv_.wait_for(lock, options_.interval, [this]{ return !running_; });
  }
}

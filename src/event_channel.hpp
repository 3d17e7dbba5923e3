#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "log.hpp"

using SubscriptionHandle = std::size_t;

// Typed publish/subscribe. Subscribers are called on the publishing thread,
// outside the channel lock, in subscription order.
template<typename Event>
class EventChannel {
public:
  using Callback = std::function<void(const Event&)>;

  SubscriptionHandle subscribe(Callback callback) {
    if(!callback) return 0;
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
  }

  void unsubscribe(SubscriptionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(handle);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.clear();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

  void publish(const Event& event) const {
    std::vector<Callback> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot.reserve(subscribers_.size());
      for(const auto& entry : subscribers_) snapshot.push_back(entry.second);
    }
    for(const auto& callback : snapshot) {
      try {
        callback(event);
      } catch(const std::exception& e) {
        log_error(nullptr, "event subscriber threw: {}", e.what());
      }
    }
  }

private:
  mutable std::mutex mutex_;
  std::map<SubscriptionHandle, Callback> subscribers_;
  std::atomic<SubscriptionHandle> next_id_{1};
};

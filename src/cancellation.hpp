#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

// Cooperative cancellation shared between the requester and a worker.
// Workers poll cancelled() at chunk or file granularity, sleep through
// wait_for() so a cancel wakes them early, and may register callbacks that
// abort blocking I/O.
class CancellationToken {
public:
  using Callback = std::function<void()>;

  static std::shared_ptr<CancellationToken> create() {
    return std::make_shared<CancellationToken>();
  }

  // Callbacks run on the cancelling thread, one at a time, outside the lock.
  void cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    if(cancelled_) return;
    cancelled_ = true;
    cv_.notify_all();
    while(!callbacks_.empty()) {
      auto entry = callbacks_.begin();
      auto callback = std::move(entry->second);
      running_id_ = entry->first;
      running_thread_ = std::this_thread::get_id();
      callbacks_.erase(entry);
      lock.unlock();
      if(callback) callback();
      lock.lock();
      running_id_ = 0;
      running_thread_ = std::thread::id();
      cv_.notify_all();
    }
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Returns true when cancelled before the delay elapsed.
  template<typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> delay) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, delay, [this]{ return cancelled_; });
  }

  // Runs immediately when already cancelled. Returns 0 in that case.
  std::size_t on_cancel(Callback callback) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!cancelled_) {
        auto id = next_id_++;
        callbacks_.emplace(id, std::move(callback));
        return id;
      }
    }
    if(callback) callback();
    return 0;
  }

  // Once this returns the callback is neither pending nor running, so
  // whatever it captured may be destroyed.
  void remove_callback(std::size_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    callbacks_.erase(id);
    if(running_thread_ == std::this_thread::get_id()) return;
    cv_.wait(lock, [&]{ return running_id_ != id; });
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  std::size_t next_id_ = 1;
  std::size_t running_id_ = 0;
  std::thread::id running_thread_;
  std::map<std::size_t, Callback> callbacks_;
};

// Registers a cancel callback for the lifetime of a scope. A null token makes
// it a no-op.
class CancelScope {
public:
  CancelScope(CancellationToken* token, CancellationToken::Callback callback)
    : token_(token) {
    if(token_) id_ = token_->on_cancel(std::move(callback));
  }
  ~CancelScope() {
    if(token_ && id_ != 0) token_->remove_callback(id_);
  }

  CancelScope(const CancelScope&) = delete;
  CancelScope& operator=(const CancelScope&) = delete;

private:
  CancellationToken* token_;
  std::size_t id_ = 0;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

#pragma once

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "device.hpp"
#include "event_channel.hpp"
#include "log.hpp"
#include "transfer.hpp"

enum class QueueStatus { Queued, Sending, Completed, Failed };

const char* to_string(QueueStatus status);

struct QueueItem {
  std::string id;
  Device target;
  std::filesystem::path file_path;
  WallTime queued_at = WallClock::now();
  QueueStatus status = QueueStatus::Queued;
};

// Strict FIFO of outbound sends with exactly one in flight. The worker
// thread is started by the first enqueue and sleeps while the queue is empty.
class TransferQueue {
public:
  using SendFunction = std::function<Transfer(const Device&, const std::filesystem::path&)>;
  using Snapshot = std::vector<QueueItem>;

  explicit TransferQueue(SendFunction send, std::shared_ptr<Logger> logger = nullptr);
  ~TransferQueue();

  TransferQueue(const TransferQueue&) = delete;
  TransferQueue& operator=(const TransferQueue&) = delete;

  QueueItem enqueue(const Device& target, const std::filesystem::path& file_path);
  std::vector<QueueItem> enqueue_all(const Device& target, const std::vector<std::filesystem::path>& file_paths);

  // Only items still waiting can be removed.
  bool remove(const std::string& item_id);
  void clear_pending();
  void clear_history();

  Snapshot pending() const;
  Snapshot history() const;
  std::size_t length() const;
  bool is_processing() const;

  SubscriptionHandle subscribe(EventChannel<Snapshot>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);

  // Lets the item in flight finish, then joins the worker.
  void stop();

private:
  void worker_loop();
  void publish_locked(std::unique_lock<std::mutex>& lock);

  SendFunction send_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<QueueItem> queue_;
  std::vector<QueueItem> history_;
  std::size_t next_id_ = 0;
  bool processing_ = false;
  bool stopping_ = false;
  std::thread worker_;

  EventChannel<Snapshot> events_;
};

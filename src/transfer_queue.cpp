#include "transfer_queue.hpp"

#include <algorithm>

const char* to_string(QueueStatus status) {
  switch(status) {
    case QueueStatus::Queued: return "queued";
    case QueueStatus::Sending: return "sending";
    case QueueStatus::Completed: return "completed";
    case QueueStatus::Failed: return "failed";
  }
  return "queued";
}

TransferQueue::TransferQueue(SendFunction send, std::shared_ptr<Logger> logger)
  : send_(std::move(send)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer-queue")) {}

TransferQueue::~TransferQueue() {
  stop();
}

QueueItem TransferQueue::enqueue(const Device& target, const std::filesystem::path& file_path) {
  std::unique_lock<std::mutex> lock(mutex_);
  QueueItem item;
  item.id = "q_" + std::to_string(++next_id_);
  item.target = target;
  item.file_path = file_path;
  queue_.push_back(item);
  logger_->debug("Queued {} for {} as {}", file_path.string(), target.name, item.id);
  if(!worker_.joinable() && !stopping_) {
    worker_ = std::thread([this]{ worker_loop(); });
  }
  cv_.notify_all();
  publish_locked(lock);
  return item;
}

std::vector<QueueItem> TransferQueue::enqueue_all(const Device& target,
                                                  const std::vector<std::filesystem::path>& file_paths) {
  std::vector<QueueItem> items;
  items.reserve(file_paths.size());
  for(const auto& path : file_paths) items.push_back(enqueue(target, path));
  return items;
}

bool TransferQueue::remove(const std::string& item_id) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = std::find_if(queue_.begin(), queue_.end(), [&](const QueueItem& item){
    return item.id == item_id && item.status == QueueStatus::Queued;
  });
  if(it == queue_.end()) return false;
  queue_.erase(it);
  publish_locked(lock);
  return true;
}

void TransferQueue::clear_pending() {
  std::unique_lock<std::mutex> lock(mutex_);
  queue_.erase(std::remove_if(queue_.begin(), queue_.end(), [](const QueueItem& item){
    return item.status == QueueStatus::Queued;
  }), queue_.end());
  publish_locked(lock);
}

void TransferQueue::clear_history() {
  std::lock_guard<std::mutex> lock(mutex_);
  history_.clear();
}

TransferQueue::Snapshot TransferQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Snapshot(queue_.begin(), queue_.end());
}

TransferQueue::Snapshot TransferQueue::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_;
}

std::size_t TransferQueue::length() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool TransferQueue::is_processing() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return processing_;
}

SubscriptionHandle TransferQueue::subscribe(EventChannel<Snapshot>::Callback callback) {
  return events_.subscribe(std::move(callback));
}

void TransferQueue::unsubscribe(SubscriptionHandle handle) {
  events_.unsubscribe(handle);
}

void TransferQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if(worker_.joinable()) worker_.join();
}

void TransferQueue::publish_locked(std::unique_lock<std::mutex>& lock) {
  Snapshot snapshot(queue_.begin(), queue_.end());
  lock.unlock();
  events_.publish(snapshot);
  lock.lock();
}

void TransferQueue::worker_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while(true) {
    cv_.wait(lock, [this]{ return stopping_ || !queue_.empty(); });
    if(stopping_) break;

    processing_ = true;
    queue_.front().status = QueueStatus::Sending;
    QueueItem item = queue_.front();
    publish_locked(lock);
    lock.unlock();

    QueueStatus outcome = QueueStatus::Failed;
    try {
      auto transfer = send_(item.target, item.file_path);
      if(transfer.status == TransferStatus::Completed) {
        outcome = QueueStatus::Completed;
      } else {
        logger_->warn("{} to {}: {} {}", item.file_path.filename().string(), item.target.name,
                      to_string(transfer.status), transfer.error);
      }
    } catch(const std::exception& e) {
      logger_->error("Failed to send {}: {}", item.file_path.string(), e.what());
    }

    lock.lock();
    // front is still the item in flight: remove() and clear_pending() skip it
    item.status = outcome;
    if(!queue_.empty() && queue_.front().id == item.id) queue_.pop_front();
    history_.push_back(item);
    processing_ = !queue_.empty();
    publish_locked(lock);
  }
  processing_ = false;
}

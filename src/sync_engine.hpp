#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "device.hpp"
#include "directory_watcher.hpp"
#include "event_channel.hpp"
#include "log.hpp"
#include "sync_client.hpp"
#include "sync_job.hpp"
#include "sync_scheduler.hpp"

// Mirrors local directories onto remote devices. Each job owns a watcher and
// a worker thread; the worker drains debounced batches of changed files,
// skipping files the remote already has.
class SyncEngine {
public:
  struct Options {
    // Empty disables persistence.
    std::filesystem::path jobs_file;
    std::chrono::milliseconds initial_debounce{500};
    std::chrono::milliseconds change_debounce{2000};
    int upload_retries = 2;
    std::chrono::milliseconds retry_base_delay{1000};
    std::size_t liveness_every = 10;
    std::chrono::milliseconds liveness_interval{std::chrono::minutes(5)};
    std::vector<std::chrono::milliseconds> reconnect_delays{
      std::chrono::seconds(30), std::chrono::seconds(60), std::chrono::seconds(120)};
    std::chrono::milliseconds pause_poll{500};
  };

  // Looks a device up in the live registry.
  using DeviceResolver = std::function<std::optional<Device>(const std::string& device_id)>;

  SyncEngine(std::shared_ptr<SyncClient> client,
             DeviceResolver resolver,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Loads persisted jobs and arms their schedules.
  void start();
  // Stops every running job and the scheduler.
  void stop();

  std::optional<SyncJob> create_job(const std::string& name,
                                    const std::filesystem::path& source_directory,
                                    const Device& target,
                                    std::optional<SyncSchedule> schedule,
                                    std::string& error);
  bool delete_job(const std::string& id);
  bool start_job(const std::string& id, std::string& error);
  bool stop_job(const std::string& id);
  bool pause_job(const std::string& id);
  bool resume_job(const std::string& id);
  // Marks a file to be skipped the next time the batch reaches it.
  bool skip_file(const std::string& id, const std::string& relative_path);
  bool update_schedule(const std::string& id, std::optional<SyncSchedule> schedule, std::string& error);
  bool rename_job(const std::string& id, const std::string& name);

  std::vector<SyncJob> jobs() const;
  std::optional<SyncJob> job(const std::string& id) const;

  // A schedule fired. Runs the job unless it is already running or its
  // source is gone; a skip is recorded in the job status.
  void on_schedule_fire(const std::string& id);

  bool load();
  bool save() const;

  SyncScheduler& scheduler() { return scheduler_; }

  SubscriptionHandle subscribe(EventChannel<SyncJob>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);

private:
  struct Runtime {
    SyncJob job;
    Device target;
    std::unique_ptr<DirectoryWatcher> watcher;
    std::thread worker;
    CancellationTokenPtr token;
    bool stopping = false;
    std::set<std::filesystem::path> pending;
    std::optional<std::chrono::steady_clock::time_point> flush_at;
    std::set<std::string> skip_requests;
    std::chrono::steady_clock::time_point last_liveness_check;
    std::size_t files_since_check = 0;
    std::condition_variable cv;
  };

  enum class BatchResult { Done, Cancelled, Unreachable };

  Runtime* find(const std::string& id);
  const Runtime* find(const std::string& id) const;
  bool set_phase(SyncJob& job, SyncPhase to);
  void publish(const std::string& id);
  void teardown(const std::string& id);
  void run_job(const std::string& id);
  BatchResult process_batch(const std::string& id, const std::vector<std::filesystem::path>& batch);
  BatchResult sync_file(const std::string& id, const std::filesystem::path& file);
  bool wait_while_paused(const std::string& id);
  bool target_alive(const std::string& id);
  void on_watch_event(const std::string& id, const WatchEvent& event);
  static bool running_phase(SyncPhase phase);

  std::shared_ptr<SyncClient> client_;
  DeviceResolver resolver_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<Runtime>> jobs_;
  EventChannel<SyncJob> events_;
  SyncScheduler scheduler_;
};

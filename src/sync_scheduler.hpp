#pragma once

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "sync_job.hpp"

// Next firing strictly after now, in local wall-clock time. nullopt when the
// schedule is disabled or cannot fire.
std::optional<WallTime> next_fire_after(const SyncSchedule& schedule, WallTime now);

// Wakes once per armed job at its next firing time and hands the job id to
// the fire callback, then re-arms from the schedule.
class SyncScheduler {
public:
  using FireCallback = std::function<void(const std::string& job_id)>;

  explicit SyncScheduler(FireCallback on_fire, std::shared_ptr<Logger> logger = nullptr);
  ~SyncScheduler();

  void start();
  void stop();

  // Replaces any existing trigger for the job.
  void arm(const std::string& job_id, const SyncSchedule& schedule);
  void disarm(const std::string& job_id);

  std::optional<WallTime> next_fire(const std::string& job_id) const;
  std::size_t armed_count() const;

private:
  struct Entry {
    SyncSchedule schedule;
    WallTime next_run;
  };

  void run_loop();

  FireCallback on_fire_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, Entry> entries_;
  bool running_ = false;
  std::thread thread_;
};

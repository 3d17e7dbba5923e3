#include "sync_scheduler.hpp"

#include <algorithm>
#include <ctime>

namespace {

std::tm local_tm(WallTime t) {
  std::time_t raw = WallClock::to_time_t(t);
  std::tm out{};
  localtime_r(&raw, &out);
  return out;
}

// Local midnight of `base` shifted by day_offset days, at hour:minute.
WallTime local_at(const std::tm& base, int day_offset, int hour, int minute) {
  std::tm t = base;
  t.tm_mday += day_offset;
  t.tm_hour = hour;
  t.tm_min = minute;
  t.tm_sec = 0;
  t.tm_isdst = -1;
  return WallClock::from_time_t(std::mktime(&t));
}

// tm_wday counts from Sunday = 0; schedules count Monday = 1 ... Sunday = 7.
int iso_weekday(const std::tm& t) {
  return t.tm_wday == 0 ? 7 : t.tm_wday;
}

} // namespace

std::optional<WallTime> next_fire_after(const SyncSchedule& schedule, WallTime now) {
  if(!schedule.enabled) return std::nullopt;
  std::string error;
  if(!schedule.validate(error)) return std::nullopt;

  if(schedule.type == ScheduleType::Interval) {
    return now + schedule.interval;
  }

  auto today = local_tm(now);
  for(int offset = 0; offset <= 7; ++offset) {
    auto candidate = local_at(today, offset, schedule.hour, schedule.minute);
    if(candidate <= now) continue;
    if(schedule.type == ScheduleType::Daily) return candidate;
    auto day = iso_weekday(local_tm(candidate));
    if(std::find(schedule.week_days.begin(), schedule.week_days.end(), day) != schedule.week_days.end()) {
      return candidate;
    }
  }
  return std::nullopt;
}

SyncScheduler::SyncScheduler(FireCallback on_fire, std::shared_ptr<Logger> logger)
  : on_fire_(std::move(on_fire)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-scheduler")) {}

SyncScheduler::~SyncScheduler() {
  stop();
}

void SyncScheduler::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(running_) return;
  running_ = true;
  thread_ = std::thread([this]{ run_loop(); });
}

void SyncScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void SyncScheduler::arm(const std::string& job_id, const SyncSchedule& schedule) {
  auto next = next_fire_after(schedule, WallClock::now());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!next) {
      entries_.erase(job_id);
    } else {
      entries_[job_id] = Entry{schedule, *next};
    }
  }
  if(next) {
    logger_->debug("Job {} next fires at {}", job_id, format_iso8601(*next));
  } else {
    logger_->debug("Job {} has no upcoming fire", job_id);
  }
  cv_.notify_all();
}

void SyncScheduler::disarm(const std::string& job_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(job_id);
  }
  cv_.notify_all();
}

std::optional<WallTime> SyncScheduler::next_fire(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(job_id);
  if(it == entries_.end()) return std::nullopt;
  return it->second.next_run;
}

std::size_t SyncScheduler::armed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void SyncScheduler::run_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while(running_) {
    if(entries_.empty()) {
      cv_.wait_for(lock, std::chrono::seconds(5));
      continue;
    }

    auto it = std::min_element(entries_.begin(), entries_.end(),
                               [](const auto& a, const auto& b){
                                 return a.second.next_run < b.second.next_run;
                               });
    auto now = WallClock::now();
    if(it->second.next_run > now) {
      // wall clock can jump; never sleep longer than a minute at a time
      auto wake = std::min(it->second.next_run, now + std::chrono::minutes(1));
      cv_.wait_until(lock, wake);
      continue;
    }

    auto job_id = it->first;
    auto next = next_fire_after(it->second.schedule, now);
    if(next) {
      it->second.next_run = *next;
    } else {
      entries_.erase(it);
    }
    lock.unlock();
    try {
      on_fire_(job_id);
    } catch(const std::exception& e) {
      logger_->error("Scheduled run of job {} failed: {}", job_id, e.what());
    }
    lock.lock();
  }
}

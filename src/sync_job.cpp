#include "sync_job.hpp"

#include <algorithm>
#include <array>
#include <utility>

const char* to_string(SyncFileStatus status) {
  switch(status) {
    case SyncFileStatus::Pending: return "pending";
    case SyncFileStatus::Syncing: return "syncing";
    case SyncFileStatus::Completed: return "completed";
    case SyncFileStatus::Failed: return "failed";
    case SyncFileStatus::Skipped: return "skipped";
    case SyncFileStatus::Paused: return "paused";
  }
  return "pending";
}

const char* to_string(SyncPhase phase) {
  switch(phase) {
    case SyncPhase::Idle: return "idle";
    case SyncPhase::Syncing: return "syncing";
    case SyncPhase::Watching: return "watching";
    case SyncPhase::Paused: return "paused";
    case SyncPhase::Error: return "error";
  }
  return "idle";
}

const char* to_string(ScheduleType type) {
  switch(type) {
    case ScheduleType::Interval: return "interval";
    case ScheduleType::Daily: return "daily";
    case ScheduleType::Weekly: return "weekly";
  }
  return "interval";
}

std::optional<ScheduleType> schedule_type_from_string(const std::string& value) {
  if(value == "interval") return ScheduleType::Interval;
  if(value == "daily") return ScheduleType::Daily;
  if(value == "weekly") return ScheduleType::Weekly;
  return std::nullopt;
}

bool sync_phase_transition_allowed(SyncPhase from, SyncPhase to) {
  static const std::array<std::pair<SyncPhase, SyncPhase>, 7> kAllowed{{
    {SyncPhase::Idle, SyncPhase::Syncing},
    {SyncPhase::Syncing, SyncPhase::Watching},
    {SyncPhase::Watching, SyncPhase::Syncing},
    {SyncPhase::Syncing, SyncPhase::Paused},
    {SyncPhase::Paused, SyncPhase::Syncing},
    {SyncPhase::Syncing, SyncPhase::Error},
    {SyncPhase::Error, SyncPhase::Syncing},
  }};
  if(to == SyncPhase::Idle) return true;
  // a watcher that loses its target also lands in error
  if(from == SyncPhase::Watching && to == SyncPhase::Error) return true;
  return std::find(kAllowed.begin(), kAllowed.end(), std::make_pair(from, to)) != kAllowed.end();
}

bool SyncSchedule::validate(std::string& error) const {
  switch(type) {
    case ScheduleType::Interval:
      if(interval.count() <= 0) {
        error = "interval must be at least one minute";
        return false;
      }
      return true;
    case ScheduleType::Weekly:
      if(week_days.empty()) {
        error = "weekly schedule needs at least one day";
        return false;
      }
      for(int day : week_days) {
        if(day < 1 || day > 7) {
          error = "week days run from 1 (Monday) to 7 (Sunday)";
          return false;
        }
      }
      [[fallthrough]];
    case ScheduleType::Daily:
      if(hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        error = "time must be HH:MM";
        return false;
      }
      return true;
  }
  return true;
}

nlohmann::json SyncSchedule::to_json() const {
  nlohmann::json j{
    {"type", to_string(type)},
    {"weekDays", week_days},
    {"enabled", enabled}
  };
  if(type == ScheduleType::Interval) {
    j["timeHour"] = nullptr;
    j["timeMinute"] = nullptr;
    j["intervalMinutes"] = interval.count();
  } else {
    j["timeHour"] = hour;
    j["timeMinute"] = minute;
    j["intervalMinutes"] = nullptr;
  }
  return j;
}

std::optional<SyncSchedule> SyncSchedule::from_json(const nlohmann::json& j) {
  if(!j.is_object()) return std::nullopt;
  SyncSchedule schedule;
  try {
    if(j.contains("type") && j["type"].is_string()) {
      schedule.type = schedule_type_from_string(j["type"].get<std::string>()).value_or(ScheduleType::Interval);
    }
    if(j.contains("timeHour") && j["timeHour"].is_number_integer()) {
      schedule.hour = j["timeHour"].get<int>();
      if(j.contains("timeMinute") && j["timeMinute"].is_number_integer()) {
        schedule.minute = j["timeMinute"].get<int>();
      }
    }
    if(j.contains("weekDays") && j["weekDays"].is_array()) {
      for(const auto& day : j["weekDays"]) {
        if(day.is_number_integer()) schedule.week_days.push_back(day.get<int>());
      }
    }
    if(j.contains("intervalMinutes") && j["intervalMinutes"].is_number_integer()) {
      schedule.interval = std::chrono::minutes(j["intervalMinutes"].get<int>());
    }
    schedule.enabled = j.value("enabled", true);
  } catch(const nlohmann::json::exception&) {
    return std::nullopt;
  }
  return schedule;
}

double SyncJob::progress() const {
  if(total_bytes == 0) return 0.0;
  return std::clamp(static_cast<double>(transferred_bytes) / static_cast<double>(total_bytes), 0.0, 1.0);
}

int SyncJob::progress_percent() const {
  return static_cast<int>(progress() * 100.0);
}

nlohmann::json SyncJob::to_json() const {
  nlohmann::json j{
    {"id", id},
    {"name", name},
    {"sourceDirectory", source_directory},
    {"targetDeviceId", target_device_id},
    {"targetDeviceName", target_device_name},
    {"createdAt", format_iso8601(created_at)}
  };
  j["targetDeviceIp"] = target_device_ip.empty() ? nlohmann::json() : nlohmann::json(target_device_ip);
  j["lastSyncTime"] = last_sync_time ? nlohmann::json(format_iso8601(*last_sync_time)) : nlohmann::json();
  if(schedule) j["schedule"] = schedule->to_json();
  return j;
}

std::optional<SyncJob> SyncJob::from_json(const nlohmann::json& j) {
  if(!j.is_object()) return std::nullopt;
  for(const char* key : {"id", "name", "sourceDirectory", "targetDeviceId"}) {
    if(!j.contains(key) || !j[key].is_string()) return std::nullopt;
  }
  SyncJob job;
  job.id = j["id"].get<std::string>();
  job.name = j["name"].get<std::string>();
  job.source_directory = j["sourceDirectory"].get<std::string>();
  job.target_device_id = j["targetDeviceId"].get<std::string>();
  if(j.contains("targetDeviceName") && j["targetDeviceName"].is_string()) {
    job.target_device_name = j["targetDeviceName"].get<std::string>();
  }
  if(j.contains("targetDeviceIp") && j["targetDeviceIp"].is_string()) {
    job.target_device_ip = j["targetDeviceIp"].get<std::string>();
  }
  if(j.contains("createdAt") && j["createdAt"].is_string()) {
    job.created_at = parse_iso8601(j["createdAt"].get<std::string>()).value_or(WallClock::now());
  }
  if(j.contains("lastSyncTime") && j["lastSyncTime"].is_string()) {
    job.last_sync_time = parse_iso8601(j["lastSyncTime"].get<std::string>());
  }
  if(j.contains("schedule") && j["schedule"].is_object()) {
    job.schedule = SyncSchedule::from_json(j["schedule"]);
  }
  return job;
}

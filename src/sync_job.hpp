#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "time_utils.hpp"

enum class SyncFileStatus { Pending, Syncing, Completed, Failed, Skipped, Paused };
enum class SyncPhase { Idle, Syncing, Watching, Paused, Error };
enum class ScheduleType { Interval, Daily, Weekly };

const char* to_string(SyncFileStatus status);
const char* to_string(SyncPhase phase);
const char* to_string(ScheduleType type);
std::optional<ScheduleType> schedule_type_from_string(const std::string& value);

// Any phase may return to Idle; everything else follows the job lifecycle.
bool sync_phase_transition_allowed(SyncPhase from, SyncPhase to);

struct SyncFileItem {
  std::string relative_path;
  SyncFileStatus status = SyncFileStatus::Pending;
  uint64_t file_size = 0;
  std::string error;
  std::optional<WallTime> completed_at;
};

struct SyncError {
  std::string file_path;
  std::string error;
  WallTime timestamp = WallClock::now();
};

struct SyncSchedule {
  ScheduleType type = ScheduleType::Interval;
  int hour = 0;                 // local time, daily and weekly
  int minute = 0;
  std::vector<int> week_days;   // 1 = Monday ... 7 = Sunday
  std::chrono::minutes interval{0};
  bool enabled = true;

  bool validate(std::string& error) const;

  nlohmann::json to_json() const;
  static std::optional<SyncSchedule> from_json(const nlohmann::json& j);
};

// One directory mirrored to one device. The first block is persisted; the
// rest is live state owned by the sync engine.
struct SyncJob {
  std::string id;
  std::string name;
  std::string source_directory;
  std::string target_device_id;
  std::string target_device_name;
  std::string target_device_ip;
  std::optional<SyncSchedule> schedule;
  WallTime created_at = WallClock::now();
  std::optional<WallTime> last_sync_time;

  SyncPhase phase = SyncPhase::Idle;
  std::string status;
  std::vector<SyncFileItem> file_items;
  std::vector<SyncError> failed_files;
  uint64_t total_bytes = 0;
  uint64_t transferred_bytes = 0;
  std::size_t synced_count = 0;
  std::size_t failed_count = 0;
  std::size_t skipped_count = 0;
  std::optional<WallTime> sync_start_time;
  double speed = 0.0;           // bytes per second over the current batch

  bool is_active() const { return phase != SyncPhase::Idle; }
  bool has_errors() const { return failed_count > 0; }
  double progress() const;
  int progress_percent() const;

  nlohmann::json to_json() const;
  static std::optional<SyncJob> from_json(const nlohmann::json& j);
};

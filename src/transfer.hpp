#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "device.hpp"

enum class TransferStatus {
  Pending,
  Accepted,
  Rejected,
  Transferring,
  Completed,
  Failed,
  Cancelled
};

const char* to_string(TransferStatus status);
std::optional<TransferStatus> transfer_status_from_string(const std::string& value);
bool is_terminal(TransferStatus status);

struct Transfer {
  std::string id;
  std::string file_name;
  uint64_t file_size = 0;
  Device sender;
  std::optional<Device> receiver;
  TransferStatus status = TransferStatus::Pending;
  double progress = 0.0;
  std::string saved_path;
  std::string error;
  std::optional<double> speed;             // bytes per second
  std::optional<std::chrono::seconds> eta;
  WallTime created_at = WallClock::now();
  bool is_sending = false;

  int progress_percent() const;
  bool is_active() const;
  bool is_finished() const { return is_terminal(status); }
  std::string speed_label() const;

  nlohmann::json to_json() const;
};

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "transfer.hpp"

struct TransferRecord {
  std::string file_name;
  uint64_t file_size = 0;
  std::string device_name;
  bool is_sending = true;
  bool succeeded = false;
  std::string error;
  WallTime timestamp = WallClock::now();

  static TransferRecord from_transfer(const Transfer& transfer);

  nlohmann::json to_json() const;
  static TransferRecord from_json(const nlohmann::json& j);
};

// Finished transfers, newest first, capped. Optionally backed by a JSON file.
class TransferHistory {
public:
  static constexpr std::size_t kMaxRecords = 100;

  explicit TransferHistory(std::filesystem::path file = {}, std::shared_ptr<Logger> logger = nullptr);

  void add(const TransferRecord& record);
  // Records terminal transfers once; non-terminal ones are ignored.
  bool record(const Transfer& transfer);
  void clear();

  std::vector<TransferRecord> records() const;
  std::size_t size() const;

  bool load();
  bool save() const;

private:
  bool save_locked() const;

  std::filesystem::path file_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<TransferRecord> records_;
  std::vector<std::string> recorded_ids_;
};

#include "transfer_history.hpp"

#include <algorithm>
#include <fstream>

TransferRecord TransferRecord::from_transfer(const Transfer& transfer) {
  TransferRecord record;
  record.file_name = transfer.file_name;
  record.file_size = transfer.file_size;
  if(transfer.is_sending) {
    record.device_name = transfer.receiver ? transfer.receiver->name : std::string();
  } else {
    record.device_name = transfer.sender.name;
  }
  record.is_sending = transfer.is_sending;
  record.succeeded = transfer.status == TransferStatus::Completed;
  record.error = transfer.error;
  record.timestamp = WallClock::now();
  return record;
}

nlohmann::json TransferRecord::to_json() const {
  nlohmann::json j{
    {"fileName", file_name},
    {"fileSize", file_size},
    {"deviceName", device_name},
    {"isSending", is_sending},
    {"succeeded", succeeded},
    {"timestamp", format_iso8601(timestamp)}
  };
  j["error"] = error.empty() ? nlohmann::json() : nlohmann::json(error);
  return j;
}

TransferRecord TransferRecord::from_json(const nlohmann::json& j) {
  TransferRecord record;
  record.file_name = j.value("fileName", std::string());
  record.file_size = j.value("fileSize", uint64_t{0});
  record.device_name = j.value("deviceName", std::string());
  record.is_sending = j.value("isSending", true);
  record.succeeded = j.value("succeeded", false);
  if(j.contains("error") && j["error"].is_string()) record.error = j["error"].get<std::string>();
  auto stamp = parse_iso8601(j.value("timestamp", std::string()));
  record.timestamp = stamp ? *stamp : WallClock::now();
  return record;
}

TransferHistory::TransferHistory(std::filesystem::path file, std::shared_ptr<Logger> logger)
  : file_(std::move(file)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("history")) {}

void TransferHistory::add(const TransferRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.insert(records_.begin(), record);
  if(records_.size() > kMaxRecords) records_.resize(kMaxRecords);
  if(!file_.empty()) save_locked();
}

bool TransferHistory::record(const Transfer& transfer) {
  if(!is_terminal(transfer.status) || transfer.id.empty()) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(std::find(recorded_ids_.begin(), recorded_ids_.end(), transfer.id) != recorded_ids_.end()) {
      return false;
    }
    recorded_ids_.push_back(transfer.id);
    if(recorded_ids_.size() > kMaxRecords * 2) {
      recorded_ids_.erase(recorded_ids_.begin(), recorded_ids_.begin() + kMaxRecords);
    }
  }
  add(TransferRecord::from_transfer(transfer));
  return true;
}

void TransferHistory::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  if(!file_.empty()) save_locked();
}

std::vector<TransferRecord> TransferHistory::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

std::size_t TransferHistory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

bool TransferHistory::load() {
  if(file_.empty()) return false;
  std::ifstream in(file_);
  if(!in) return false;
  std::vector<TransferRecord> loaded;
  try {
    nlohmann::json doc;
    in >> doc;
    if(!doc.is_array()) return false;
    for(const auto& entry : doc) {
      if(entry.is_object()) loaded.push_back(TransferRecord::from_json(entry));
    }
  } catch(const nlohmann::json::exception& e) {
    // corrupted history starts fresh
    logger_->warn("Discarding unreadable history {}: {}", file_.string(), e.what());
    loaded.clear();
  }
  if(loaded.size() > kMaxRecords) loaded.resize(kMaxRecords);
  std::lock_guard<std::mutex> lock(mutex_);
  records_ = std::move(loaded);
  return true;
}

bool TransferHistory::save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_locked();
}

bool TransferHistory::save_locked() const {
  if(file_.empty()) return false;
  std::error_code ec;
  if(file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path(), ec);
  std::ofstream out(file_, std::ios::trunc);
  if(!out) {
    logger_->error("Unable to write {}", file_.string());
    return false;
  }
  auto doc = nlohmann::json::array();
  for(const auto& record : records_) doc.push_back(record.to_json());
  out << doc.dump(2);
  return static_cast<bool>(out);
}

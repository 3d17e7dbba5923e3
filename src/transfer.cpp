#include "transfer.hpp"

#include <algorithm>
#include <cmath>

#include "utils.hpp"

const char* to_string(TransferStatus status) {
  switch(status) {
    case TransferStatus::Pending: return "pending";
    case TransferStatus::Accepted: return "accepted";
    case TransferStatus::Rejected: return "rejected";
    case TransferStatus::Transferring: return "transferring";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed: return "failed";
    case TransferStatus::Cancelled: return "cancelled";
  }
  return "pending";
}

std::optional<TransferStatus> transfer_status_from_string(const std::string& value) {
  for(auto status : {TransferStatus::Pending, TransferStatus::Accepted, TransferStatus::Rejected,
                     TransferStatus::Transferring, TransferStatus::Completed,
                     TransferStatus::Failed, TransferStatus::Cancelled}) {
    if(value == to_string(status)) return status;
  }
  return std::nullopt;
}

bool is_terminal(TransferStatus status) {
  return status == TransferStatus::Completed || status == TransferStatus::Failed ||
         status == TransferStatus::Cancelled || status == TransferStatus::Rejected;
}

int Transfer::progress_percent() const {
  return static_cast<int>(std::floor(std::clamp(progress, 0.0, 1.0) * 100.0));
}

bool Transfer::is_active() const {
  return status == TransferStatus::Pending || status == TransferStatus::Accepted ||
         status == TransferStatus::Transferring;
}

std::string Transfer::speed_label() const {
  if(!speed || *speed <= 0) return "";
  return format_size(static_cast<uint64_t>(*speed)) + "/s";
}

nlohmann::json Transfer::to_json() const {
  nlohmann::json j = {
    {"id", id},
    {"fileName", file_name},
    {"fileSize", file_size},
    {"senderDevice", sender.to_json()},
    {"receiverDevice", receiver ? receiver->to_json() : nlohmann::json(nullptr)},
    {"status", to_string(status)},
    {"progress", progress},
    {"filePath", saved_path.empty() ? nlohmann::json(nullptr) : nlohmann::json(saved_path)},
    {"error", error.empty() ? nlohmann::json(nullptr) : nlohmann::json(error)},
    {"createdAt", format_iso8601(created_at)}
  };
  return j;
}

#include "protocol.hpp"

#include "time_utils.hpp"

namespace {

bool read_string(const json& j, const char* key, std::string& out, bool required, std::string& error) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) {
    if(required) error = std::string("missing field '") + key + "'";
    return !required;
  }
  if(!it->is_string()) {
    error = std::string("field '") + key + "' must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

} // namespace

json SendRequest::to_json() const {
  return {
    {"fileName", file_name},
    {"fileSize", file_size},
    {"senderId", sender_id},
    {"senderName", sender_name},
    {"senderIp", sender_ip},
    {"senderPort", sender_port},
    {"senderPlatform", sender_platform},
    {"senderVersion", sender_version}
  };
}

std::optional<SendRequest> SendRequest::from_json(const json& j, std::string& error) {
  if(!j.is_object()) {
    error = "body must be a JSON object";
    return std::nullopt;
  }
  SendRequest req;
  if(!read_string(j, "fileName", req.file_name, true, error)) return std::nullopt;
  if(!read_string(j, "senderId", req.sender_id, true, error)) return std::nullopt;
  if(!read_string(j, "senderName", req.sender_name, true, error)) return std::nullopt;
  if(!read_string(j, "senderIp", req.sender_ip, false, error)) return std::nullopt;
  if(!read_string(j, "senderPlatform", req.sender_platform, false, error)) return std::nullopt;
  if(!read_string(j, "senderVersion", req.sender_version, false, error)) return std::nullopt;
  if(req.file_name.empty()) {
    error = "fileName must not be empty";
    return std::nullopt;
  }

  auto size_it = j.find("fileSize");
  if(size_it == j.end() || !size_it->is_number_integer() || size_it->get<int64_t>() < 0) {
    error = "fileSize must be a non-negative integer";
    return std::nullopt;
  }
  req.file_size = size_it->get<uint64_t>();

  auto port_it = j.find("senderPort");
  if(port_it != j.end() && !port_it->is_null()) {
    if(!port_it->is_number_integer() || port_it->get<int64_t>() <= 0 || port_it->get<int64_t>() > 65535) {
      error = "senderPort must be a valid port";
      return std::nullopt;
    }
    req.sender_port = static_cast<uint16_t>(port_it->get<int64_t>());
  }
  return req;
}

json SendResponse::to_json() const {
  return {{"accepted", accepted}, {"transferId", transfer_id}};
}

std::optional<SendResponse> SendResponse::from_json(const json& j) {
  if(!j.is_object()) return std::nullopt;
  auto accepted = j.find("accepted");
  if(accepted == j.end() || !accepted->is_boolean()) return std::nullopt;
  SendResponse resp;
  resp.accepted = accepted->get<bool>();
  resp.transfer_id = j.value("transferId", "");
  return resp;
}

json UploadResult::to_json() const {
  return {{"status", "completed"}, {"transferId", transfer_id}, {"savePath", save_path}};
}

json ClipboardMessage::to_json() const {
  json j = {
    {"type", kind == ClipboardKind::Image ? "image" : "text"},
    {"sender", sender},
    {"senderDeviceId", sender_device_id},
    {"timestamp", timestamp.empty() ? format_iso8601(WallClock::now()) : timestamp}
  };
  if(kind == ClipboardKind::Image) {
    j["imageBase64"] = image_base64;
  } else {
    j["text"] = text;
  }
  return j;
}

std::optional<ClipboardMessage> ClipboardMessage::from_json(const json& j, std::string& error) {
  if(!j.is_object()) {
    error = "body must be a JSON object";
    return std::nullopt;
  }
  ClipboardMessage msg;
  std::string type = "text";
  if(!read_string(j, "type", type, false, error)) return std::nullopt;
  if(!read_string(j, "sender", msg.sender, false, error)) return std::nullopt;
  if(!read_string(j, "senderDeviceId", msg.sender_device_id, false, error)) return std::nullopt;
  if(!read_string(j, "timestamp", msg.timestamp, false, error)) return std::nullopt;
  if(type == "image") {
    msg.kind = ClipboardKind::Image;
    if(!read_string(j, "imageBase64", msg.image_base64, true, error)) return std::nullopt;
    if(msg.image_base64.empty()) {
      error = "Missing imageBase64";
      return std::nullopt;
    }
  } else if(type == "text") {
    msg.kind = ClipboardKind::Text;
    if(!read_string(j, "text", msg.text, false, error)) return std::nullopt;
    if(msg.text.empty()) {
      error = "Missing text";
      return std::nullopt;
    }
  } else {
    error = "unknown clipboard type '" + type + "'";
    return std::nullopt;
  }
  if(msg.sender.empty()) msg.sender = "Unknown";
  return msg;
}

json SyncDeleteRequest::to_json() const {
  return {{"relativePath", relative_path}, {"senderName", sender_name}, {"senderDeviceId", sender_device_id}};
}

std::optional<SyncDeleteRequest> SyncDeleteRequest::from_json(const json& j, std::string& error) {
  if(!j.is_object()) {
    error = "body must be a JSON object";
    return std::nullopt;
  }
  SyncDeleteRequest req;
  if(!read_string(j, "relativePath", req.relative_path, true, error)) return std::nullopt;
  if(!read_string(j, "senderName", req.sender_name, false, error)) return std::nullopt;
  if(!read_string(j, "senderDeviceId", req.sender_device_id, false, error)) return std::nullopt;
  if(req.relative_path.empty()) {
    error = "Missing relativePath";
    return std::nullopt;
  }
  if(req.sender_name.empty()) req.sender_name = "Unknown";
  return req;
}

json SyncCheckResult::to_json() const {
  return {{"exists", exists}, {"size", size}, {"lastModified", last_modified_ms}};
}

std::optional<SyncCheckResult> SyncCheckResult::from_json(const json& j) {
  if(!j.is_object()) return std::nullopt;
  auto exists = j.find("exists");
  if(exists == j.end() || !exists->is_boolean()) return std::nullopt;
  SyncCheckResult result;
  result.exists = exists->get<bool>();
  if(!result.exists) return result;
  auto size = j.find("size");
  auto modified = j.find("lastModified");
  if(size == j.end() || !size->is_number_integer()) return std::nullopt;
  if(modified == j.end() || !modified->is_number_integer()) return std::nullopt;
  result.size = size->get<uint64_t>();
  result.last_modified_ms = modified->get<int64_t>();
  return result;
}

json make_ping_response() {
  return {{"status", "ok"}, {"timestamp", format_iso8601(WallClock::now())}};
}

json make_error_body(const std::string& message) {
  return {{"error", message}};
}

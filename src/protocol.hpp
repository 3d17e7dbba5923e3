#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kProtocolVersion = "1.0";
inline constexpr uint16_t kDefaultTransferPort = 42017;
inline constexpr uint16_t kDefaultDiscoveryPort = 42018;
inline constexpr const char* kDefaultMulticastGroup = "224.0.0.167";
inline constexpr std::size_t kTransferChunkSize = 64 * 1024;

inline constexpr const char* kSyncPathHeader = "X-Sync-Path";
inline constexpr const char* kDeviceIdHeader = "X-Device-Id";
inline constexpr const char* kDeviceNameHeader = "X-Device-Name";

// POST /api/send-request
struct SendRequest {
  std::string file_name;
  uint64_t file_size = 0;
  std::string sender_id;
  std::string sender_name;
  std::string sender_ip;        // empty: receiver falls back to the peer address
  uint16_t sender_port = kDefaultTransferPort;
  std::string sender_platform;
  std::string sender_version = kProtocolVersion;

  json to_json() const;
  static std::optional<SendRequest> from_json(const json& j, std::string& error);
};

struct SendResponse {
  bool accepted = false;
  std::string transfer_id;

  json to_json() const;
  static std::optional<SendResponse> from_json(const json& j);
};

struct UploadResult {
  std::string transfer_id;
  std::string save_path;

  json to_json() const;
};

enum class ClipboardKind { Text, Image };

// POST /api/clipboard
struct ClipboardMessage {
  ClipboardKind kind = ClipboardKind::Text;
  std::string text;
  std::string image_base64;
  std::string sender;
  std::string sender_device_id;
  std::string timestamp;

  json to_json() const;
  static std::optional<ClipboardMessage> from_json(const json& j, std::string& error);
};

// POST /api/sync/delete
struct SyncDeleteRequest {
  std::string relative_path;
  std::string sender_name = "Unknown";
  std::string sender_device_id;

  json to_json() const;
  static std::optional<SyncDeleteRequest> from_json(const json& j, std::string& error);
};

// GET /api/sync/check
struct SyncCheckResult {
  bool exists = false;
  uint64_t size = 0;
  int64_t last_modified_ms = 0;

  json to_json() const;
  static std::optional<SyncCheckResult> from_json(const json& j);
};

json make_ping_response();
json make_error_body(const std::string& message);

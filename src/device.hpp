#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "time_utils.hpp"

// A device on the LAN. Values are replaced wholesale on every sighting.
struct Device {
  std::string id;
  std::string name;
  std::string ip;
  uint16_t port = 0;
  std::string platform;
  std::string version;
  WallTime last_seen{};

  static Device create_local(std::string name,
                             std::string ip,
                             uint16_t port,
                             std::string platform,
                             std::string id = std::string());

  nlohmann::json to_json() const;
  // nullopt when a required field is missing or has the wrong type.
  static std::optional<Device> from_json(const nlohmann::json& j);

  std::string platform_label() const;
  bool is_online(WallTime now, std::chrono::seconds window = std::chrono::seconds(10)) const;
  std::string base_url() const;
  std::string display() const;

  bool operator==(const Device& other) const { return id == other.id; }
  bool operator!=(const Device& other) const { return !(*this == other); }
};

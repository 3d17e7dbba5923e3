#include "device.hpp"

#include "protocol.hpp"
#include "utils.hpp"

Device Device::create_local(std::string name,
                            std::string ip,
                            uint16_t port,
                            std::string platform,
                            std::string id) {
  Device d;
  d.id = id.empty() ? random_uuid() : std::move(id);
  d.name = std::move(name);
  d.ip = std::move(ip);
  d.port = port;
  d.platform = std::move(platform);
  d.version = kProtocolVersion;
  d.last_seen = WallClock::now();
  return d;
}

nlohmann::json Device::to_json() const {
  return {
    {"id", id},
    {"name", name},
    {"ip", ip},
    {"port", port},
    {"platform", platform},
    {"version", version},
    {"lastSeen", format_iso8601(last_seen)}
  };
}

std::optional<Device> Device::from_json(const nlohmann::json& j) {
  if(!j.is_object()) return std::nullopt;
  auto string_field = [&](const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if(it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
  };

  // id, name and port are required; the rest default when absent
  auto id = string_field("id");
  auto name = string_field("name");
  auto port_it = j.find("port");
  if(!id || id->empty() || !name) return std::nullopt;
  if(port_it == j.end() || !port_it->is_number_integer()) return std::nullopt;
  auto port = port_it->get<int64_t>();
  if(port < 0 || port > 65535) return std::nullopt;

  Device d;
  d.id = std::move(*id);
  d.name = std::move(*name);
  d.ip = string_field("ip").value_or("");
  d.port = static_cast<uint16_t>(port);
  d.platform = string_field("platform").value_or("");
  d.version = string_field("version").value_or(kProtocolVersion);
  d.last_seen = WallClock::now();
  if(auto seen = string_field("lastSeen")) {
    if(auto parsed = parse_iso8601(*seen)) d.last_seen = *parsed;
  }
  return d;
}

std::string Device::platform_label() const {
  if(platform == "android") return "Android";
  if(platform == "android_tv") return "Android TV";
  if(platform == "windows") return "Windows";
  if(platform == "ios") return "iOS";
  if(platform == "linux") return "Linux";
  if(platform == "macos") return "macOS";
  return platform;
}

bool Device::is_online(WallTime now, std::chrono::seconds window) const {
  return now - last_seen < window;
}

std::string Device::base_url() const {
  return "http://" + ip + ":" + std::to_string(port);
}

std::string Device::display() const {
  return name + " (" + ip + ":" + std::to_string(port) + ", " + platform_label() + ")";
}

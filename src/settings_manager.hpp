#pragma once

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Schema of every runtime setting. "restart" marks keys that only take effect
// the next time the engine starts (sockets are bound once).
inline const nlohmann::json ANYWARE_SETTINGS_SCHEMA = nlohmann::json::array({
  {{"key","device_name"},      {"aliases", {"name","n"}},        {"type","string"},    {"default",""},            {"description","Name announced to other devices (hostname when empty)"}},
  {{"key","device_id"},        {"aliases", {"id"}},              {"type","string"},    {"default",""},            {"description","Stable device identifier (random UUID when empty)"}, {"restart", true}},
  {{"key","platform"},         {"aliases", {"os"}},              {"type","string"},    {"default","linux"},       {"description","Platform tag announced in presence packets"}, {"restart", true}},
  {{"key","download_path"},    {"aliases", {"dl","downloads"}},  {"type","path"},      {"default",""},            {"description","Directory for received files (./Downloads when empty)"}},
  {{"key","bind_ip"},          {"aliases", {"ip"}},              {"type","ipv4"},      {"default","0.0.0.0"},     {"description","Interface address the HTTP listener binds"}, {"restart", true}},
  {{"key","transfer_port"},    {"aliases", {"tp","port"}},       {"type","int"},       {"default",42017},         {"min",0}, {"max",65535}, {"description","HTTP transfer port (0 = ephemeral)"}, {"restart", true}},
  {{"key","discovery_port"},   {"aliases", {"dp"}},              {"type","int"},       {"default",42018},         {"min",0}, {"max",65535}, {"description","UDP presence port"}, {"restart", true}},
  {{"key","multicast_group"},  {"aliases", {"mcast","mg"}},      {"type","multicast"}, {"default","224.0.0.167"}, {"description","Multicast group for presence heartbeats"}, {"restart", true}},
  {{"key","discovery"},        {"aliases", {"presence"}},        {"type","bool"},      {"default",true},          {"description","Announce and discover devices on the LAN"}, {"restart", true}},
  {{"key","overwrite_files"},  {"aliases", {"overwrite","ow"}},  {"type","bool"},      {"default",false},         {"description","Overwrite existing files instead of renaming"}},
  {{"key","auto_accept"},      {"aliases", {"accept","aa"}},     {"type","bool"},      {"default",true},          {"description","Accept incoming transfers without asking"}},
  {{"key","max_file_size"},    {"aliases", {"mfs"}},             {"type","int"},       {"default",0},             {"min",0}, {"description","Largest accepted file in MB (0 = unlimited)"}},
  {{"key","max_upload_kbps"},  {"aliases", {"limit","kbps"}},    {"type","int"},       {"default",0},             {"min",0}, {"description","Upload speed cap in KB/s (0 = unlimited)"}},
  {{"key","latency_interval"}, {"aliases", {"li"}},              {"type","int"},       {"default",10},            {"min",1}, {"max",3600}, {"description","Seconds between latency measurements"}, {"restart", true}},
  {{"key","verbose"},          {"aliases", {"v"}},               {"type","bool"},      {"default",false},         {"description","Enable verbose logging"}},
  {{"key","log_file"},         {"aliases", {"log"}},             {"type","path"},      {"default",""},            {"description","Also write log output to this file"}, {"restart", true}},
  {{"key","help"},             {"aliases", {"h","?"}},           {"type","bool"},      {"default",false},         {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},             {"aliases", {"persist"}},         {"type","bool"},      {"default",false},         {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& schema);

  template<typename T>
  T get(const std::string& key) const;
  // Path settings with a leading "~" expanded against $HOME.
  std::filesystem::path get_path(const std::string& key) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);
  // Throws std::invalid_argument when the value is rejected.
  void set(const std::string& key, const nlohmann::json& value);
  void reset_to_defaults();

  bool save() const { return save_to_file(settings_path()); }
  bool load() { return load_from_file(settings_path()); }
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return flag("save"); }
  bool help_requested() const { return flag("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  bool requires_restart(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }
  bool has_settings_path() const { return !settings_path_.empty(); }

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);
  static std::optional<bool> parse_bool(const std::string& value);
  static std::filesystem::path expand_home(const std::string& value);

private:
  enum class Kind { Bool, Int, String, Path, Ipv4, Multicast };

  struct Entry {
    std::string key;
    std::vector<std::string> aliases;
    Kind kind = Kind::String;
    nlohmann::json fallback;
    std::optional<long long> min_value;
    std::optional<long long> max_value;
    std::string description;
    bool persistent = true;
    bool restart = false;
  };

  static Kind parse_kind(const std::string& name);
  static std::vector<Entry> build_entries(const nlohmann::json& schema);
  const Entry* find_entry(const std::string& token) const;
  bool flag(const std::string& key) const { return has(key) && get<bool>(key); }

  bool store(const Entry& entry, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_text(const Entry& entry, const std::string& text, std::string& error) const;

  std::vector<Entry> entries_;
  nlohmann::json values_;
  std::filesystem::path settings_path_;
};

inline SettingsManager::Kind SettingsManager::parse_kind(const std::string& name) {
  if(name == "bool") return Kind::Bool;
  if(name == "int") return Kind::Int;
  if(name == "string") return Kind::String;
  if(name == "path") return Kind::Path;
  if(name == "ipv4") return Kind::Ipv4;
  if(name == "multicast") return Kind::Multicast;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

inline std::vector<SettingsManager::Entry> SettingsManager::build_entries(const nlohmann::json& schema) {
  std::vector<Entry> entries;
  for(const auto& item : schema) {
    Entry entry;
    entry.key = item.at("key").get<std::string>();
    for(const auto& alias : item.value("aliases", std::vector<std::string>{})) {
      entry.aliases.push_back(to_lower(alias));
    }
    entry.kind = parse_kind(item.at("type").get<std::string>());
    entry.fallback = item.at("default");
    if(item.contains("min")) entry.min_value = item.at("min").get<long long>();
    if(item.contains("max")) entry.max_value = item.at("max").get<long long>();
    entry.description = item.value("description", "");
    entry.persistent = item.value("persistent", true);
    entry.restart = item.value("restart", false);
    entries.push_back(std::move(entry));
  }
  return entries;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(ANYWARE_SETTINGS_SCHEMA) {}

inline SettingsManager::SettingsManager(const nlohmann::json& schema)
  : entries_(build_entries(schema)) {
  reset_to_defaults();
}

inline void SettingsManager::reset_to_defaults() {
  values_ = nlohmann::json::object();
  for(const auto& entry : entries_) values_[entry.key] = entry.fallback;
}

// Keys match case-insensitively, with '-' and '_' interchangeable.
inline const SettingsManager::Entry* SettingsManager::find_entry(const std::string& token) const {
  std::string wanted = to_lower(token);
  std::replace(wanted.begin(), wanted.end(), '-', '_');
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry){
    return entry.key == wanted ||
           std::find(entry.aliases.begin(), entry.aliases.end(), wanted) != entry.aliases.end();
  });
  return it == entries_.end() ? nullptr : &*it;
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  for(const auto& entry : entries_) out.push_back(entry.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::string SettingsManager::description(const std::string& key) const {
  const auto* entry = find_entry(key);
  return entry ? entry->description : std::string();
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* entry = find_entry(token);
  if(!entry) return std::nullopt;
  return entry->key;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* entry = find_entry(key);
  return entry && entry->kind == Kind::Bool;
}

inline bool SettingsManager::requires_restart(const std::string& key) const {
  const auto* entry = find_entry(key);
  return entry && entry->restart;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline std::filesystem::path SettingsManager::expand_home(const std::string& value) {
  if(value.empty() || value[0] != '~') return value;
  if(value.size() > 1 && value[1] != '/') return value;
  const char* home = std::getenv("HOME");
  if(!home || !*home) return value;
  return std::filesystem::path(home) / value.substr(value.size() > 1 ? 2 : 1);
}

inline std::filesystem::path SettingsManager::get_path(const std::string& key) const {
  return expand_home(get<std::string>(key));
}

// Unknown keys and rejected values in the file are reported and skipped so a
// stale settings file never blocks startup.
inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* entry = find_entry(item.key());
    if(!entry || !entry->persistent) continue;
    std::string error;
    if(!store(*entry, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    if(persistent_only && !entry.persistent) continue;
    if(values_.contains(entry.key)) doc[entry.key] = values_.at(entry.key);
  }
  return doc;
}

inline bool SettingsManager::store(const Entry& entry, const nlohmann::json& value, std::string& error) {
  switch(entry.kind) {
  case Kind::Bool:
    if(value.is_boolean()) {
      values_[entry.key] = value.get<bool>();
    } else if(value.is_number_integer()) {
      values_[entry.key] = value.get<long long>() != 0;
    } else {
      error = "expected boolean";
      return false;
    }
    return true;

  case Kind::Int: {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto number = value.get<long long>();
    if(entry.min_value && number < *entry.min_value) {
      error = "must be >= " + std::to_string(*entry.min_value);
      return false;
    }
    if(entry.max_value && number > *entry.max_value) {
      error = "must be <= " + std::to_string(*entry.max_value);
      return false;
    }
    values_[entry.key] = static_cast<int>(number);
    return true;
  }

  case Kind::String:
  case Kind::Path:
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    values_[entry.key] = value.get<std::string>();
    return true;

  case Kind::Ipv4:
  case Kind::Multicast: {
    if(!value.is_string()) {
      error = "expected IPv4 address";
      return false;
    }
    auto text = value.get<std::string>();
    in_addr parsed{};
    if(inet_pton(AF_INET, text.c_str(), &parsed) != 1) {
      error = "'" + text + "' is not an IPv4 address";
      return false;
    }
    // 224.0.0.0/4
    if(entry.kind == Kind::Multicast && (ntohl(parsed.s_addr) >> 28) != 0xE) {
      error = "'" + text + "' is not a multicast address";
      return false;
    }
    values_[entry.key] = text;
    return true;
  }
  }
  error = "unsupported type";
  return false;
}

inline std::optional<bool> SettingsManager::parse_bool(const std::string& value) {
  auto lowered = to_lower(trim_copy(value));
  if(lowered == "true" || lowered == "1" || lowered == "on" || lowered == "yes") return true;
  if(lowered == "false" || lowered == "0" || lowered == "off" || lowered == "no") return false;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  return parse_bool(value).has_value();
}

inline nlohmann::json SettingsManager::parse_text(const Entry& entry,
                                                  const std::string& text,
                                                  std::string& error) const {
  std::string clean = trim_copy(text);
  if(entry.kind == Kind::Bool) {
    if(auto parsed = parse_bool(clean)) return *parsed;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(entry.kind == Kind::Int) {
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(clean.c_str(), &end, 10);
    if(clean.empty() || errno == ERANGE || !end || *end != '\0') {
      error = "expected integer";
      return {};
    }
    return parsed;
  }
  return clean;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  error.clear();
  const auto* entry = find_entry(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*entry, value, error);
  if(!error.empty()) return false;
  return store(*entry, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  error.clear();
  const auto* entry = find_entry(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  return store(*entry, value, error);
}

inline void SettingsManager::set(const std::string& key, const nlohmann::json& value) {
  std::string error;
  if(!set_from_json(key, value, error)) {
    throw std::invalid_argument("Failed to set setting " + key + ": " + error);
  }
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) throw std::runtime_error("Unknown setting: " + key);
  return values_.at(key).get<T>();
}

#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys. Options are --key value, --key=value,
// -alias value, bare --flag for booleans and --no-flag to clear one.
// Remaining tokens fill the positional keys in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "anyware",
                             std::vector<std::string> positional_keys = {"device_name", "download_path"},
                             nlohmann::json schema = ANYWARE_SETTINGS_SCHEMA);

  // Returns false and fills `error` on the first bad token; settings applied
  // before it are kept.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  static bool looks_like_option(const std::string& token);
  bool apply_option(const std::vector<std::string>& args, std::size_t& i,
                    SettingsManager& settings, std::string& error, bool& matched) const;

  std::string process_name_;
  std::vector<std::string> positional_keys_;
  nlohmann::json schema_;
};

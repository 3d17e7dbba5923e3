#include "command_line_parser.hpp"

#include <cctype>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional_keys,
                                     nlohmann::json schema)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)),
    schema_(std::move(schema)) {
  SettingsManager lookup(schema_);
  for(auto& key : positional_keys_) {
    auto resolved = lookup.resolve_key(key);
    if(!resolved) throw std::invalid_argument("positional argument refers to unknown setting '" + key + "'");
    key = *resolved;
  }
}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' && std::isalpha(static_cast<unsigned char>(token[1]));
}

// Sets `matched` when args[i] named a setting; `i` is advanced past any value
// it consumed.
bool CommandLineParser::apply_option(const std::vector<std::string>& args, std::size_t& i,
                                     SettingsManager& settings, std::string& error, bool& matched) const {
  const std::string& token = args[i];
  std::string name = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
  std::string value;
  bool has_value = false;
  auto eq = name.find('=');
  if(eq != std::string::npos) {
    value = name.substr(eq + 1);
    name = name.substr(0, eq);
    has_value = true;
  }

  auto key = settings.resolve_key(name);
  if(!key && !has_value && name.rfind("no-", 0) == 0) {
    auto negated = settings.resolve_key(name.substr(3));
    if(negated && settings.is_bool_setting(*negated)) {
      key = negated;
      value = "false";
      has_value = true;
    }
  }
  matched = key.has_value();
  if(!matched) return true;

  if(!has_value) {
    bool next_available = i + 1 < args.size() && !looks_like_option(args[i + 1]);
    if(settings.is_bool_setting(*key)) {
      // booleans only swallow the next token when it reads as one
      if(next_available && SettingsManager::is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else if(i + 1 < args.size()) {
      value = args[++i];
    } else {
      error = "Missing value for option '" + token + "'";
      return false;
    }
  }

  std::string set_error;
  if(!settings.set_from_string(*key, value, set_error)) {
    error = "Invalid value for option '" + name + "': " + set_error;
    return false;
  }
  return true;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(token.size() > 1 && token[0] == '-') {
      bool matched = false;
      if(!apply_option(args, i, settings, error, matched)) return false;
      if(matched) continue;
      if(token.rfind("--", 0) == 0) {
        error = "Unknown option " + token;
        return false;
      }
      // unmatched single-dash tokens such as "-5" are positional
    }

    if(next_positional >= positional_keys_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid value for " + key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - LAN device discovery, file transfer and folder sync", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& item : schema_) {
    auto type = item.at("type").get<std::string>();
    std::string hint = type == "bool" ? "[true|false]" : "<" + type + ">";

    std::string aliases;
    for(const auto& alias : item.value("aliases", std::vector<std::string>{})) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";

    const auto& fallback = item.at("default");
    std::string shown = fallback.is_string() ? fallback.get<std::string>() : fallback.dump();
    if(shown.empty()) shown = "\"\"";

    print_out(nullptr, "  --{:<18} {:<12} {}{} (default: {}{})",
              item.at("key").get<std::string>(),
              hint,
              item.value("description", ""),
              aliases,
              shown,
              item.value("restart", false) ? ", restart to apply" : "");
  }
  print_out(nullptr, "");
}

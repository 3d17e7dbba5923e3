#include "anyware_cli.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "anyware_engine.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

AnywareCLI::AnywareCLI(AnywareEngine& engine, std::shared_ptr<Logger> logger, QuitCallback on_quit)
  : engine_(engine),
    settings_(engine.settings()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("cli")),
    on_quit_(std::move(on_quit)) {
  receiver_subscription_ = engine_.receiver().subscribe([this](const Transfer& transfer){
    if(transfer.status == TransferStatus::Completed) {
      logger_->print("Received {} ({}) from {} -> {}", transfer.file_name, format_size(transfer.file_size),
                     transfer.sender.name, transfer.saved_path);
    } else if(transfer.status == TransferStatus::Failed) {
      logger_->print_err("Receiving {} from {} failed: {}", transfer.file_name, transfer.sender.name, transfer.error);
    }
  });
  clipboard_subscription_ = engine_.clipboard().subscribe([this](const ClipboardEntry& entry){
    if(entry.image_path.empty()) {
      logger_->print("[clipboard from {}] {}", entry.sender_name, entry.text);
    } else {
      logger_->print("[clipboard image from {}] {}", entry.sender_name, entry.image_path);
    }
  });
  sync_subscription_ = engine_.sync().subscribe([this](const SyncJob& job){
    {
      std::lock_guard<std::mutex> lock(phases_mutex_);
      auto it = last_phases_.find(job.id);
      if(it != last_phases_.end() && it->second == job.phase) return;
      last_phases_[job.id] = job.phase;
    }
    logger_->print("[sync {}] {}: {}", job.name, to_string(job.phase), job.status);
  });
}

AnywareCLI::~AnywareCLI() {
  stop();
  engine_.receiver().unsubscribe(receiver_subscription_);
  engine_.clipboard().unsubscribe(clipboard_subscription_);
  engine_.sync().unsubscribe(sync_subscription_);
}

void AnywareCLI::start() {
  if(cli_thread_.joinable()) return;
  running_ = true;
  cli_thread_ = std::thread([this](){ run_loop(); });
}

void AnywareCLI::stop() {
  running_ = false;
  if(cli_thread_.joinable()) {
    if(cli_thread_.get_id() == std::this_thread::get_id()) {
      cli_thread_.detach();
    } else {
      cli_thread_.join();
    }
  }
}

void AnywareCLI::trim(std::string& s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

std::optional<std::string> AnywareCLI::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}

void AnywareCLI::run_loop() {
  while(running_) {
    auto input = read_command_line("> ");
    if(!input) {
      if(on_quit_) on_quit_();
      break;
    }
    if(input->empty()) continue;
    execute_command(*input);
  }
}

void AnywareCLI::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  std::string args;
  std::getline(iss, args);
  trim(args);

  if(cmd.empty()) return;
  if(cmd == "help" || cmd == "h" || cmd == "?") {
    print_help();
  } else if(cmd == "quit" || cmd == "exit") {
    std::cout << "Quitting...\n";
    running_ = false;
    if(on_quit_) on_quit_();
  } else if(cmd == "info") {
    print_info();
  } else if(cmd == "devices" || cmd == "d") {
    list_devices();
  } else if(cmd == "add") {
    add_device(args);
  } else if(cmd == "rescan") {
    if(auto* presence = engine_.presence()) {
      presence->on_network_changed();
      std::cout << "Presence restarted on the current network.\n";
    } else {
      std::cout << "Discovery is disabled.\n";
    }
  } else if(cmd == "forget") {
    if(auto* presence = engine_.presence()) presence->clear_devices();
    std::cout << "Device list cleared.\n";
  } else if(cmd == "send") {
    send_command(args);
  } else if(cmd == "sendfolder" || cmd == "sf") {
    send_folder_command(args);
  } else if(cmd == "cancel") {
    engine_.sender().cancel();
    std::cout << "Cancel requested.\n";
  } else if(cmd == "queue" || cmd == "q") {
    queue_command(args);
  } else if(cmd == "transfers" || cmd == "t") {
    list_transfers();
  } else if(cmd == "history") {
    history_command(args);
  } else if(cmd == "clip") {
    clipboard_command(args);
  } else if(cmd == "sync") {
    sync_command(args);
  } else if(cmd == "latency" || cmd == "ping") {
    latency_command();
  } else if(cmd == "settings" || cmd == "s") {
    handle_settings_command(args.empty() ? "list" : args);
  } else if(cmd == "set") {
    handle_settings_command(args.empty() ? "list" : "set " + args);
  } else if(cmd == "get") {
    handle_settings_command(args.empty() ? "get" : "get " + args);
  } else if(cmd == "save") {
    handle_settings_command("save");
  } else if(cmd == "load") {
    handle_settings_command("load");
  } else {
    print_help();
    std::cout << "Unknown command: " << cmd << "\n";
  }
}

void AnywareCLI::print_help() {
  std::cout << "Available commands:\n";
  std::cout << "  help|h|?                          Show this help message\n";
  std::cout << "  quit                              Exit the application\n";
  std::cout << "  info                              Show this device\n";
  std::cout << "  devices|d                         List devices on the network\n";
  std::cout << "  add <ip[:port]>                   Add a device by address\n";
  std::cout << "  rescan                            Rebind presence after a network change\n";
  std::cout << "  forget                            Drop all known devices\n";
  std::cout << "  send <device> <file>...           Queue files for a device\n";
  std::cout << "  sendfolder|sf <device> <dir>      Send a folder, keeping its layout\n";
  std::cout << "  cancel                            Cancel the send in flight\n";
  std::cout << "  queue|q [clear|history|clearhistory|remove <id>]  Show or edit the send queue\n";
  std::cout << "  transfers|t                       Incoming transfers of this session\n";
  std::cout << "  history [clear]                   Finished transfers\n";
  std::cout << "  clip text <device> <text>         Push text to a device clipboard\n";
  std::cout << "  clip image <device> <png>         Push an image to a device clipboard\n";
  std::cout << "  clip history [clear]              Received clipboard entries\n";
  std::cout << "  sync list                         List sync jobs\n";
  std::cout << "  sync add <dir> <device> [name]    Create a sync job\n";
  std::cout << "  sync start|stop|pause|resume|delete <job>\n";
  std::cout << "  sync show <job>                   Per-file status of a job\n";
  std::cout << "  sync skip <job> <relative path>   Skip one file of the running batch\n";
  std::cout << "  sync rename <job> <name>\n";
  std::cout << "  sync schedule <job> off|interval <min>|daily HH:MM|weekly HH:MM <days>\n";
  std::cout << "  latency|ping                      Round-trip times per device\n";
  std::cout << "  settings [list|get|set|save|load] Manage runtime settings\n";
  std::cout << "  set [key value]                   Shortcut for settings set (lists when empty)\n";
  std::cout << "  get <key>                         Shortcut for settings get\n";
  std::cout << "  save                              Shortcut for settings save\n";
  std::cout << "  load                              Shortcut for settings load\n";
}

void AnywareCLI::print_info() {
  auto local = engine_.local_device();
  std::cout << "Name:      " << local.name << "\n";
  std::cout << "Id:        " << local.id << "\n";
  std::cout << "Address:   " << local.ip << ":" << local.port << "\n";
  std::cout << "Platform:  " << local.platform_label() << "\n";
  std::cout << "Downloads: " << engine_.download_root().string() << "\n";
}

void AnywareCLI::list_devices() {
  auto devices = engine_.devices();
  if(devices.empty()) {
    std::cout << "No devices found.\n";
    return;
  }
  auto now = WallClock::now();
  for(const auto& device : devices) {
    std::optional<int> latency;
    if(auto* prober = engine_.latency()) latency = prober->average(device.id);
    std::cout << "  " << std::left << std::setw(24) << device.name
              << std::setw(22) << (device.ip + ":" + std::to_string(device.port))
              << std::setw(12) << device.platform_label()
              << (device.is_online(now) ? "online " : "stale  ")
              << format_latency(latency) << "\n";
  }
}

void AnywareCLI::add_device(const std::string& args) {
  if(args.empty()) {
    std::cout << "Usage: add <ip[:port]>\n";
    return;
  }
  std::string ip = args;
  uint16_t port = kDefaultTransferPort;
  auto pos = args.rfind(':');
  if(pos != std::string::npos) {
    ip = args.substr(0, pos);
    char* end = nullptr;
    auto value = std::strtol(args.c_str() + pos + 1, &end, 10);
    if(!end || *end != '\0' || value <= 0 || value > 65535) {
      std::cout << "Invalid port in '" << args << "'.\n";
      return;
    }
    port = static_cast<uint16_t>(value);
  }
  std::string error;
  auto device = engine_.add_device_by_address(ip, port, error);
  if(!device) {
    std::cout << "Could not add " << args << ": " << error << "\n";
    return;
  }
  std::cout << "Added " << device->display() << "\n";
}

std::optional<Device> AnywareCLI::require_device(const std::string& token) {
  auto device = engine_.find_device(token);
  if(!device) std::cout << "Unknown device '" << token << "'. Try 'devices'.\n";
  return device;
}

void AnywareCLI::send_command(const std::string& args) {
  std::istringstream iss(args);
  std::string target;
  iss >> target;
  std::vector<std::filesystem::path> files;
  std::string file;
  while(iss >> file) files.emplace_back(file);
  if(target.empty() || files.empty()) {
    std::cout << "Usage: send <device> <file>...\n";
    return;
  }
  auto device = require_device(target);
  if(!device) return;
  for(const auto& item : engine_.queue().enqueue_all(*device, files)) {
    std::cout << "Queued " << item.file_path.filename().string() << " as " << item.id << "\n";
  }
}

void AnywareCLI::send_folder_command(const std::string& args) {
  std::istringstream iss(args);
  std::string target;
  iss >> target;
  std::string folder;
  std::getline(iss, folder);
  trim(folder);
  if(target.empty() || folder.empty()) {
    std::cout << "Usage: sendfolder <device> <dir>\n";
    return;
  }
  auto device = require_device(target);
  if(!device) return;
  try {
    auto results = engine_.sender().send_folder(*device, folder);
    auto completed = std::count_if(results.begin(), results.end(), [](const Transfer& transfer){
      return transfer.status == TransferStatus::Completed;
    });
    std::cout << "Sent " << completed << " of " << results.size() << " files.\n";
    for(const auto& transfer : results) {
      if(transfer.status != TransferStatus::Completed) {
        std::cout << "  " << transfer.file_name << ": " << to_string(transfer.status)
                  << (transfer.error.empty() ? "" : " (" + transfer.error + ")") << "\n";
      }
    }
  } catch(const std::invalid_argument& e) {
    std::cout << e.what() << "\n";
  }
}

void AnywareCLI::queue_command(const std::string& args) {
  auto& queue = engine_.queue();
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  if(action == "clear") {
    queue.clear_pending();
    std::cout << "Pending sends cleared.\n";
    return;
  }
  if(action == "clearhistory") {
    queue.clear_history();
    std::cout << "Queue history cleared.\n";
    return;
  }
  if(action == "remove") {
    std::string id;
    iss >> id;
    std::cout << (queue.remove(id) ? "Removed " + id : "Cannot remove '" + id + "'") << "\n";
    return;
  }
  auto items = action == "history" ? queue.history() : queue.pending();
  if(items.empty()) {
    std::cout << (action == "history" ? "No finished sends.\n" : "Queue is empty.\n");
    return;
  }
  for(const auto& item : items) {
    std::cout << "  " << std::left << std::setw(8) << item.id << std::setw(10) << to_string(item.status)
              << item.file_path.filename().string() << " -> " << item.target.name << "\n";
  }
}

void AnywareCLI::list_transfers() {
  auto transfers = engine_.receiver().transfers();
  if(transfers.empty()) {
    std::cout << "No incoming transfers.\n";
    return;
  }
  for(const auto& transfer : transfers) {
    std::cout << "  " << std::left << std::setw(14) << to_string(transfer.status)
              << std::setw(5) << (std::to_string(transfer.progress_percent()) + "%") << " "
              << transfer.file_name << " (" << format_size(transfer.file_size) << ") from "
              << transfer.sender.name;
    if(!transfer.error.empty()) std::cout << ": " << transfer.error;
    std::cout << "\n";
  }
}

void AnywareCLI::history_command(const std::string& args) {
  auto& history = engine_.history();
  if(args == "clear") {
    history.clear();
    std::cout << "History cleared.\n";
    return;
  }
  auto records = history.records();
  if(records.empty()) {
    std::cout << "No finished transfers.\n";
    return;
  }
  for(const auto& record : records) {
    std::cout << "  " << format_iso8601(record.timestamp) << " "
              << (record.is_sending ? "sent " : "recv ")
              << (record.succeeded ? "ok   " : "FAIL ")
              << record.file_name << " (" << format_size(record.file_size) << ") "
              << (record.is_sending ? "to " : "from ") << record.device_name;
    if(!record.error.empty()) std::cout << ": " << record.error;
    std::cout << "\n";
  }
}

void AnywareCLI::clipboard_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  auto& clipboard = engine_.clipboard();

  if(action == "history") {
    std::string sub;
    iss >> sub;
    if(sub == "clear") {
      clipboard.history().clear();
      std::cout << "Clipboard history cleared.\n";
      return;
    }
    auto entries = clipboard.history().entries();
    if(entries.empty()) std::cout << "Clipboard history is empty.\n";
    for(std::size_t i = 0; i < entries.size(); ++i) {
      const auto& entry = entries[i];
      std::cout << "  [" << i << "] " << entry.sender_name << ": "
                << (entry.image_path.empty() ? entry.text : "image " + entry.image_path) << "\n";
    }
    return;
  }

  std::string target;
  iss >> target;
  std::string payload;
  std::getline(iss, payload);
  trim(payload);
  if((action != "text" && action != "image") || target.empty() || payload.empty()) {
    std::cout << "Usage: clip text <device> <text> | clip image <device> <png> | clip history [clear]\n";
    return;
  }
  auto device = require_device(target);
  if(!device) return;
  std::string error;
  bool ok = action == "text" ? clipboard.send_text(*device, payload, error)
                             : clipboard.send_image(*device, payload, error);
  std::cout << (ok ? "Clipboard sent to " + device->name : "Clipboard push failed: " + error) << "\n";
}

void AnywareCLI::sync_command(const std::string& args) {
  auto& sync = engine_.sync();
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  if(action.empty() || action == "list") {
    auto jobs = sync.jobs();
    if(jobs.empty()) {
      std::cout << "No sync jobs.\n";
      return;
    }
    for(const auto& job : jobs) {
      std::cout << "  " << job.id << "  " << job.name << "  " << job.source_directory << " -> "
                << job.target_device_name << "  [" << to_string(job.phase) << "] ";
      if(job.phase == SyncPhase::Syncing) std::cout << job.progress_percent() << "% ";
      std::cout << job.status;
      if(job.schedule) std::cout << "  (" << to_string(job.schedule->type) << (job.schedule->enabled ? "" : ", off") << ")";
      std::cout << "\n";
    }
    return;
  }

  if(action == "add") {
    std::string dir, target, name;
    iss >> dir >> target;
    std::getline(iss, name);
    trim(name);
    if(dir.empty() || target.empty()) {
      std::cout << "Usage: sync add <dir> <device> [name]\n";
      return;
    }
    auto device = require_device(target);
    if(!device) return;
    std::string error;
    auto job = sync.create_job(name, dir, *device, std::nullopt, error);
    if(!job) {
      std::cout << "Cannot create sync job: " << error << "\n";
      return;
    }
    std::cout << "Created " << job->id << " (" << job->name << ")\n";
    return;
  }

  std::string id;
  iss >> id;
  if(id.empty()) {
    std::cout << "Usage: sync " << action << " <job>\n";
    return;
  }
  auto job = sync.job(id);
  if(!job) {
    // allow the job name instead of its id
    for(const auto& candidate : sync.jobs()) {
      if(candidate.name == id) job = candidate;
    }
  }
  if(!job) {
    std::cout << "Unknown sync job '" << id << "'.\n";
    return;
  }
  id = job->id;
  std::string rest;
  std::getline(iss, rest);
  trim(rest);

  bool ok = true;
  std::string error;
  if(action == "start") {
    ok = sync.start_job(id, error);
  } else if(action == "stop") {
    ok = sync.stop_job(id);
  } else if(action == "pause") {
    ok = sync.pause_job(id);
    if(!ok) error = "job is not syncing";
  } else if(action == "resume") {
    ok = sync.resume_job(id);
    if(!ok) error = "job is not paused";
  } else if(action == "delete") {
    ok = sync.delete_job(id);
  } else if(action == "skip") {
    ok = sync.skip_file(id, rest);
  } else if(action == "rename") {
    ok = sync.rename_job(id, rest);
    if(!ok) error = "name must not be empty";
  } else if(action == "schedule") {
    if(rest == "off" || rest.empty()) {
      ok = sync.update_schedule(id, std::nullopt, error);
    } else {
      auto schedule = parse_schedule(rest, error);
      ok = schedule && sync.update_schedule(id, schedule, error);
      if(ok) {
        if(auto next = sync.scheduler().next_fire(id)) {
          std::cout << "Next run " << format_iso8601(*next) << "\n";
        }
      }
    }
  } else if(action == "show") {
    std::cout << job->name << ": " << to_string(job->phase) << ", " << job->status << "\n";
    std::cout << "  " << job->synced_count << " synced, " << job->skipped_count << " skipped, "
              << job->failed_count << " failed, " << format_size(job->transferred_bytes) << " of "
              << format_size(job->total_bytes) << "\n";
    for(const auto& item : job->file_items) {
      std::cout << "  " << std::left << std::setw(10) << to_string(item.status) << item.relative_path;
      if(!item.error.empty()) std::cout << ": " << item.error;
      std::cout << "\n";
    }
    return;
  } else {
    std::cout << "Unknown sync command '" << action << "'.\n";
    return;
  }
  if(ok) {
    std::cout << "OK\n";
  } else {
    std::cout << "Failed" << (error.empty() ? "" : ": " + error) << "\n";
  }
}

std::optional<SyncSchedule> AnywareCLI::parse_schedule(const std::string& args, std::string& error) {
  std::istringstream iss(args);
  std::string kind;
  iss >> kind;
  auto type = schedule_type_from_string(kind);
  if(!type) {
    error = "Schedule must be interval, daily or weekly";
    return std::nullopt;
  }
  SyncSchedule schedule;
  schedule.type = *type;
  if(schedule.type == ScheduleType::Interval) {
    int minutes = 0;
    if(!(iss >> minutes)) {
      error = "Usage: interval <minutes>";
      return std::nullopt;
    }
    schedule.interval = std::chrono::minutes(minutes);
  } else {
    std::string time;
    iss >> time;
    auto colon = time.find(':');
    if(colon == std::string::npos) {
      error = "Time must be HH:MM";
      return std::nullopt;
    }
    char* end = nullptr;
    schedule.hour = static_cast<int>(std::strtol(time.substr(0, colon).c_str(), &end, 10));
    schedule.minute = static_cast<int>(std::strtol(time.c_str() + colon + 1, &end, 10));
    if(schedule.type == ScheduleType::Weekly) {
      std::string days;
      iss >> days;
      std::istringstream day_stream(days);
      std::string day;
      while(std::getline(day_stream, day, ',')) {
        if(!day.empty()) schedule.week_days.push_back(std::atoi(day.c_str()));
      }
    }
  }
  if(!schedule.validate(error)) return std::nullopt;
  return schedule;
}

void AnywareCLI::latency_command() {
  auto* prober = engine_.latency();
  auto devices = engine_.devices();
  if(devices.empty()) {
    std::cout << "No devices found.\n";
    return;
  }
  for(const auto& device : devices) {
    int ms = prober ? prober->ping_device(device) : -1;
    std::optional<int> sample = ms;
    if(prober) prober->record(device.id, ms);
    std::cout << "  " << std::left << std::setw(24) << device.name << std::setw(10) << format_latency(sample)
              << to_string(latency_quality(sample)) << "\n";
  }
}

void AnywareCLI::handle_settings_command(const std::string& args) {
  if(!settings_) {
    std::cout << "Settings manager unavailable.\n";
    return;
  }

  std::istringstream iss(args);
  std::string action;
  iss >> action;

  if(action.empty() || action == "list") {
    list_settings();
    return;
  }

  if(action == "get") {
    std::string key;
    iss >> key;
    if(key.empty()) {
      std::cout << "Usage: settings get <key>\n";
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      std::cout << "Unknown setting '" << key << "'.\n";
      return;
    }
    std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
    return;
  }

  if(action == "set") {
    std::string key;
    iss >> key;
    std::string value;
    std::getline(iss, value);
    trim(value);
    if(key.empty() || value.empty()) {
      std::cout << "Usage: settings set <key> <value>\n";
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      std::cout << "Unknown setting '" << key << "'.\n";
      return;
    }
    std::string error;
    if(settings_->set_from_string(*resolved, value, error)) {
      engine_.apply_settings();
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved);
      if(settings_->requires_restart(*resolved)) std::cout << " (takes effect after restart)";
      std::cout << "\n";
    } else {
      std::cout << "Failed to set " << *resolved << ": " << error << "\n";
    }
    return;
  }

  if(action == "save") {
    if(settings_->save()) {
      std::cout << "Saved settings to " << settings_->settings_path() << "\n";
    } else {
      std::cout << "Failed to save settings.\n";
    }
    return;
  }

  if(action == "load") {
    if(settings_->load()) {
      engine_.apply_settings();
      std::cout << "Loaded settings from " << settings_->settings_path() << "\n";
    } else {
      std::cout << "No readable settings at " << settings_->settings_path() << "\n";
    }
    return;
  }

  std::cout << "Unknown settings command.\n";
}

void AnywareCLI::list_settings() {
  auto keys = settings_->keys();
  std::sort(keys.begin(), keys.end());
  for(const auto& key : keys) {
    std::cout << "  " << std::left << std::setw(18) << key << std::setw(16) << settings_->value_as_string(key)
              << settings_->description(key) << "\n";
  }
}

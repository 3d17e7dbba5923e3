#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "event_channel.hpp"
#include "log.hpp"
#include "sync_job.hpp"

class AnywareEngine;
class SettingsManager;
struct Device;

// Interactive shell over an engine. Commands can also be fed one line at a
// time through execute_command().
class AnywareCLI {
public:
  using QuitCallback = std::function<void()>;

  AnywareCLI(AnywareEngine& engine, std::shared_ptr<Logger> logger, QuitCallback on_quit = {});
  ~AnywareCLI();

  AnywareCLI(const AnywareCLI&) = delete;
  AnywareCLI& operator=(const AnywareCLI&) = delete;

  void start();
  void stop();

  void execute_command(const std::string& line);

  // "interval 30", "daily 08:30", "weekly 08:30 1,3,5"
  static std::optional<SyncSchedule> parse_schedule(const std::string& args, std::string& error);

private:
  void run_loop();
  std::optional<std::string> read_command_line(const char* prompt);

  void print_help();
  void print_info();
  void list_devices();
  void add_device(const std::string& args);
  void send_command(const std::string& args);
  void send_folder_command(const std::string& args);
  void queue_command(const std::string& args);
  void list_transfers();
  void history_command(const std::string& args);
  void clipboard_command(const std::string& args);
  void sync_command(const std::string& args);
  void latency_command();
  void handle_settings_command(const std::string& args);
  void list_settings();

  std::optional<Device> require_device(const std::string& token);
  static void trim(std::string& s);

  AnywareEngine& engine_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  QuitCallback on_quit_;
  std::atomic<bool> running_{true};
  std::thread cli_thread_;

  SubscriptionHandle receiver_subscription_ = 0;
  SubscriptionHandle clipboard_subscription_ = 0;
  SubscriptionHandle sync_subscription_ = 0;
  std::mutex phases_mutex_;
  std::map<std::string, SyncPhase> last_phases_;
};

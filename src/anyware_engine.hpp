#pragma once

#include <asio.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "clipboard.hpp"
#include "device.hpp"
#include "file_sender.hpp"
#include "http_server.hpp"
#include "latency_prober.hpp"
#include "log.hpp"
#include "presence_service.hpp"
#include "sync_client.hpp"
#include "sync_engine.hpp"
#include "sync_receiver.hpp"
#include "transfer_history.hpp"
#include "transfer_queue.hpp"
#include "transfer_receiver.hpp"

class AnywareCLI;
class SettingsManager;

// Wires one device together: the HTTP listener with every router mounted,
// presence, outbound transfers and folder sync. Socket work runs on a single
// io thread; blocking work runs on the components' own threads.
class AnywareEngine {
public:
  struct Options {
    bool start_cli_thread = false;
    bool enable_latency = true;
    std::filesystem::path workspace_root = std::filesystem::current_path();
    PresenceService::Options presence;
    FileSender::Options sender;
    SyncClient::Options sync_client;
    SyncEngine::Options sync;
  };

  AnywareEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~AnywareEngine();

  void start();
  void run();
  void start_background();
  void stop();

  void execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  struct Stats {
    std::size_t known_devices = 0;
    std::size_t queued_sends = 0;
    std::size_t sync_jobs = 0;
    std::size_t active_sync_jobs = 0;
  };

  Stats stats() const;

  Device local_device() const;
  void set_device_name(const std::string& name);
  uint16_t transfer_port() const { return transfer_port_; }
  std::filesystem::path download_root() const;
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

  std::vector<Device> devices() const;
  // Matches a device id, a case-insensitive name, or an ip.
  std::optional<Device> find_device(const std::string& token) const;
  // Adds a device by address after asking it for /api/info.
  std::optional<Device> add_device_by_address(const std::string& ip, uint16_t port, std::string& error);

  PresenceService* presence() { return presence_.get(); }
  LatencyProber* latency() { return latency_.get(); }
  TransferReceiver& receiver() { return *receiver_; }
  FileSender& sender() { return *sender_; }
  TransferQueue& queue() { return *queue_; }
  TransferHistory& history() { return *history_; }
  ClipboardService& clipboard() { return *clipboard_; }
  SyncReceiver& sync_receiver() { return *sync_receiver_; }
  SyncEngine& sync() { return *sync_; }

  // Re-reads the settings that can change at runtime.
  void apply_settings();

private:
  std::shared_ptr<Logger> component_logger(const std::string& name) const;
  void ensure_workspace() const;
  void start_cli();
  Device make_local_device() const;
  bool accept_transfer(const Transfer& transfer) const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;

  mutable std::mutex local_mutex_;
  Device local_;
  uint16_t transfer_port_ = 0;

  std::unique_ptr<HttpServer> http_server_;
  std::unique_ptr<PresenceService> presence_;
  std::unique_ptr<LatencyProber> latency_;
  std::unique_ptr<TransferReceiver> receiver_;
  std::unique_ptr<FileSender> sender_;
  std::unique_ptr<TransferQueue> queue_;
  std::unique_ptr<TransferHistory> history_;
  std::unique_ptr<ClipboardService> clipboard_;
  std::unique_ptr<SyncReceiver> sync_receiver_;
  std::shared_ptr<SyncClient> sync_client_;
  std::unique_ptr<SyncEngine> sync_;
  std::unique_ptr<AnywareCLI> cli_;
  std::vector<SubscriptionHandle> device_subscriptions_;
  bool started_ = false;
  bool cli_thread_running_ = false;
};

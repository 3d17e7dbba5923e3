#include "anyware_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "anyware_cli.hpp"
#include "http_client.hpp"
#include "net_utils.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

AnywareEngine::AnywareEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("anyware")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

AnywareEngine::~AnywareEngine() {
  stop();
}

std::shared_ptr<Logger> AnywareEngine::component_logger(const std::string& name) const {
  auto logger = std::make_shared<Logger>(name);
  logger->set_parent(logger_);
  return logger;
}

void AnywareEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root / ".config", ec);
}

std::filesystem::path AnywareEngine::download_root() const {
  auto path = settings_->get_path("download_path");
  if(path.empty()) return options_.workspace_root / "Downloads";
  return path.is_absolute() ? path : options_.workspace_root / path;
}

Device AnywareEngine::make_local_device() const {
  auto name = settings_->get<std::string>("device_name");
  if(name.empty()) name = local_hostname();
  std::string ip = settings_->get<std::string>("bind_ip");
  if(ip.empty() || ip == "0.0.0.0") {
    auto iface = pick_lan_interface(list_ipv4_interfaces());
    ip = iface ? iface->address : "127.0.0.1";
  }
  return Device::create_local(name, ip, transfer_port_, settings_->get<std::string>("platform"),
                              settings_->get<std::string>("device_id"));
}

bool AnywareEngine::accept_transfer(const Transfer& transfer) const {
  if(settings_->get<bool>("auto_accept")) return true;
  logger_->print("Declined {} ({}) from {}: auto_accept is off",
                 transfer.file_name, format_size(transfer.file_size), transfer.sender.name);
  return false;
}

void AnywareEngine::start() {
  if(started_) return;
  started_ = true;

  ensure_workspace();
  if(!settings_->has_settings_path()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }

  init(settings_->get<bool>("verbose"));
  auto log_file = settings_->get_path("log_file");
  if(!log_file.empty() && !set_log_file(log_file.string())) {
    logger_->warn("Unable to open log file {}", log_file.string());
  }

  int port_value = settings_->get<int>("transfer_port");
  if(port_value < 0 || port_value > 65535) {
    logger_->error("Invalid transfer_port '{}'", port_value);
    throw std::runtime_error("Invalid transfer_port");
  }
  auto bind_ip = settings_->get<std::string>("bind_ip");
  if(bind_ip.empty()) bind_ip = "0.0.0.0";

  std::error_code ec;
  std::filesystem::create_directories(download_root(), ec);

  auto local_provider = [this]{ return local_device(); };
  auto download_provider = [this]{ return download_root(); };

  http_server_ = std::make_unique<HttpServer>(io_, component_logger("http"));

  TransferReceiver::Options receiver_options;
  receiver_options.download_root = download_root();
  receiver_options.overwrite = settings_->get<bool>("overwrite_files");
  receiver_options.max_file_size = static_cast<uint64_t>(settings_->get<int>("max_file_size")) * 1024 * 1024;
  receiver_ = std::make_unique<TransferReceiver>(local_provider, receiver_options, component_logger("transfer-receiver"));
  receiver_->set_acceptance_policy([this](const Transfer& transfer){ return accept_transfer(transfer); });

  clipboard_ = std::make_unique<ClipboardService>(local_provider, download_provider, ClipboardService::Options{},
                                                  component_logger("clipboard"));
  sync_receiver_ = std::make_unique<SyncReceiver>(download_provider, component_logger("sync-receiver"));

  http_server_->mount(receiver_->router());
  http_server_->mount(clipboard_->router());
  http_server_->mount(sync_receiver_->router());
  transfer_port_ = http_server_->listen(bind_ip, static_cast<uint16_t>(port_value));

  {
    std::lock_guard<std::mutex> lock(local_mutex_);
    local_ = make_local_device();
  }
  logger_->info("{} listening on {}:{} (id {})", local_.name, bind_ip, transfer_port_, local_.id);

  if(settings_->get<bool>("discovery")) {
    auto presence_options = options_.presence;
    presence_options.discovery_port = static_cast<uint16_t>(settings_->get<int>("discovery_port"));
    presence_options.multicast_group = settings_->get<std::string>("multicast_group");
    presence_ = std::make_unique<PresenceService>(io_, local_device(), presence_options, component_logger("presence"));
    if(!presence_->start()) {
      logger_->warn("Presence did not start; devices can still be added by address");
    }
  }

  auto sender_options = options_.sender;
  sender_options.max_upload_kbps = static_cast<uint64_t>(settings_->get<int>("max_upload_kbps"));
  sender_ = std::make_unique<FileSender>(local_provider, sender_options, component_logger("file-sender"));
  queue_ = std::make_unique<TransferQueue>(
    [this](const Device& target, const std::filesystem::path& path){ return sender_->send_file(target, path); },
    component_logger("transfer-queue"));

  history_ = std::make_unique<TransferHistory>(options_.workspace_root / ".config" / "transfer_history.json",
                                               component_logger("history"));
  history_->load();
  receiver_->subscribe([this](const Transfer& transfer){ history_->record(transfer); });
  sender_->subscribe([this](const Transfer& transfer){ history_->record(transfer); });

  sync_client_ = std::make_shared<SyncClient>(local_provider, options_.sync_client, component_logger("sync-client"));
  auto sync_options = options_.sync;
  if(sync_options.jobs_file.empty()) {
    sync_options.jobs_file = options_.workspace_root / ".config" / "sync_jobs.json";
  }
  sync_ = std::make_unique<SyncEngine>(
    sync_client_,
    [this](const std::string& device_id) -> std::optional<Device> {
      if(!presence_) return std::nullopt;
      return presence_->find_device(device_id);
    },
    sync_options,
    component_logger("sync-engine"));
  sync_->start();

  if(options_.enable_latency) {
    LatencyProber::Options latency_options;
    latency_options.interval = std::chrono::seconds(settings_->get<int>("latency_interval"));
    latency_ = std::make_unique<LatencyProber>(latency_options, component_logger("latency"));
    if(presence_) {
      latency_->update_devices(presence_->devices());
      device_subscriptions_.push_back(presence_->subscribe([this](const PresenceService::DeviceList& devices){
        if(latency_) latency_->update_devices(devices);
      }));
    }
    latency_->start();
  }

  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
  cli_ = std::make_unique<AnywareCLI>(*this, logger_, [this]{ io_.stop(); });
  if(options_.start_cli_thread) {
    start_cli();
  }
}

void AnywareEngine::apply_settings() {
  if(!started_) return;
  receiver_->set_overwrite(settings_->get<bool>("overwrite_files"));
  receiver_->set_max_file_size(static_cast<uint64_t>(settings_->get<int>("max_file_size")) * 1024 * 1024);
  receiver_->set_download_root(download_root());
  sender_->set_max_upload_kbps(static_cast<uint64_t>(settings_->get<int>("max_upload_kbps")));
  auto name = settings_->get<std::string>("device_name");
  if(!name.empty()) set_device_name(name);
  init(settings_->get<bool>("verbose"));
}

void AnywareEngine::run() {
  if(!started_) start();
  io_.run();
}

void AnywareEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void AnywareEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }
  if(latency_) latency_->stop();
  if(presence_) {
    for(auto handle : device_subscriptions_) presence_->unsubscribe(handle);
    device_subscriptions_.clear();
  }
  if(sync_) sync_->stop();
  if(sender_) sender_->cancel();
  if(queue_) queue_->stop();
  if(history_) history_->save();
  if(presence_) presence_->stop();
  if(http_server_) http_server_->stop();

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}

LogListenerHandle AnywareEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void AnywareEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void AnywareEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

void AnywareEngine::start_cli() {
  if(!cli_ || cli_thread_running_) return;
  cli_->start();
  cli_thread_running_ = true;
}

void AnywareEngine::execute_command(const std::string& line) {
  if(cli_) {
    cli_->execute_command(line);
  }
}

Device AnywareEngine::local_device() const {
  if(presence_) return presence_->local_device();
  std::lock_guard<std::mutex> lock(local_mutex_);
  return local_;
}

void AnywareEngine::set_device_name(const std::string& name) {
  {
    std::lock_guard<std::mutex> lock(local_mutex_);
    local_.name = name;
  }
  if(presence_) presence_->set_local_name(name);
}

std::vector<Device> AnywareEngine::devices() const {
  if(!presence_) return {};
  return presence_->devices();
}

std::optional<Device> AnywareEngine::find_device(const std::string& token) const {
  if(token.empty()) return std::nullopt;
  auto lowered = to_lower_ascii(token);
  for(const auto& device : devices()) {
    if(device.id == token || device.ip == token || to_lower_ascii(device.name) == lowered) {
      return device;
    }
  }
  return std::nullopt;
}

std::optional<Device> AnywareEngine::add_device_by_address(const std::string& ip, uint16_t port, std::string& error) {
  HttpClient client(ip, port);
  auto result = client.get("/api/info", options_.sender.ping_timeout);
  if(!result.ok()) {
    error = result.describe();
    return std::nullopt;
  }
  auto doc = result.json();
  auto device = doc ? Device::from_json(*doc) : std::nullopt;
  if(!device) {
    error = "Invalid device info from " + ip;
    return std::nullopt;
  }
  if(device->ip.empty()) device->ip = ip;
  device->port = port;
  if(presence_) presence_->add_manual_device(*device);
  return device;
}

AnywareEngine::Stats AnywareEngine::stats() const {
  Stats s;
  s.known_devices = devices().size();
  if(queue_) s.queued_sends = queue_->length();
  if(sync_) {
    auto jobs = sync_->jobs();
    s.sync_jobs = jobs.size();
    s.active_sync_jobs = static_cast<std::size_t>(
      std::count_if(jobs.begin(), jobs.end(), [](const SyncJob& job){ return job.is_active(); }));
  }
  return s;
}

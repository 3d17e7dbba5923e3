#include "presence_service.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <thread>

#include "net_utils.hpp"

namespace {

using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

std::optional<asio::ip::udp::endpoint> parse_target(const std::string& text) {
  auto colon = text.rfind(':');
  if(colon == std::string::npos) return std::nullopt;
  std::error_code ec;
  auto address = asio::ip::make_address(text.substr(0, colon), ec);
  if(ec) return std::nullopt;
  try {
    int port = std::stoi(text.substr(colon + 1));
    if(port <= 0 || port > 65535) return std::nullopt;
    return asio::ip::udp::endpoint(address, static_cast<uint16_t>(port));
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

} // namespace

const char* to_string(PresenceState state) {
  switch(state) {
    case PresenceState::Stopped: return "stopped";
    case PresenceState::Running: return "running";
    case PresenceState::Restarting: return "restarting";
  }
  return "stopped";
}

bool presence_transition_allowed(PresenceState from, PresenceState to) {
  switch(from) {
    case PresenceState::Stopped:
      return to == PresenceState::Running;
    case PresenceState::Running:
      return to == PresenceState::Stopped || to == PresenceState::Restarting;
    case PresenceState::Restarting:
      return to == PresenceState::Running || to == PresenceState::Stopped;
  }
  return false;
}

PresenceService::PresenceService(asio::io_context& io,
                                 Device local,
                                 Options options,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("presence")),
    local_(std::move(local)),
    heartbeat_timer_(io),
    sweep_timer_(io),
    health_timer_(io),
    rejoin_timer_(io),
    restart_timer_(io) {
  options_.bind_attempts = std::max(1, options_.bind_attempts);
  options_.max_send_failures = std::max(1, options_.max_send_failures);
}

PresenceService::~PresenceService() {
  stop();
}

bool PresenceService::transition_locked(PresenceState to) {
  if(!presence_transition_allowed(state_, to)) {
    logger_->debug("Presence transition {} -> {} rejected", to_string(state_), to_string(to));
    return false;
  }
  logger_->debug("Presence {} -> {}", to_string(state_), to_string(to));
  state_ = to;
  return true;
}

bool PresenceService::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(state_ == PresenceState::Running) return true;
  if(state_ == PresenceState::Restarting) return false;

  if(options_.resolve_local_address) {
    if(auto iface = pick_lan_interface(list_ipv4_interfaces())) {
      local_.ip = iface->address;
      broadcast_address_ = iface->broadcast.empty() ? "255.255.255.255" : iface->broadcast;
      logger_->info("Using interface {} ({}) for presence", iface->name, iface->address);
    } else {
      logger_->warn("No LAN interface found; presence limited to loopback");
      broadcast_address_ = "255.255.255.255";
    }
  }

  if(!open_socket_locked(options_.bind_attempts)) {
    logger_->error("Presence could not bind UDP port {}", options_.discovery_port);
    return false;
  }
  transition_locked(PresenceState::Running);
  send_failures_ = 0;
  arm_timers_locked();
  logger_->info("Presence running on UDP {} as '{}' ({})", bound_port_, local_.name, local_.id);
  return true;
}

void PresenceService::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(state_ == PresenceState::Stopped) return;
  transition_locked(PresenceState::Stopped);
  cancel_timers_locked();
  close_socket_locked();
  logger_->info("Presence stopped");
}

bool PresenceService::restart(const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  return restart_locked(reason);
}

bool PresenceService::restart_locked(const std::string& reason) {
  if(!transition_locked(PresenceState::Restarting)) return false;
  logger_->warn("Restarting presence: {}", reason);
  cancel_timers_locked();
  close_socket_locked();
  schedule_restart_attempt_locked(options_.restart_delay);
  return true;
}

void PresenceService::schedule_restart_attempt_locked(std::chrono::milliseconds delay) {
  restart_timer_.expires_after(delay);
  restart_timer_.async_wait([this](const std::error_code& ec){
    if(ec) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if(state_ != PresenceState::Restarting) return;
    if(!open_socket_locked(1)) {
      logger_->warn("Presence restart failed; retrying in {} ms", options_.restart_retry_delay.count());
      schedule_restart_attempt_locked(options_.restart_retry_delay);
      return;
    }
    transition_locked(PresenceState::Running);
    send_failures_ = 0;
    ++restart_count_;
    arm_timers_locked();
    logger_->info("Presence restarted (restart #{})", restart_count_);
  });
}

void PresenceService::on_network_changed() {
  logger_->info("Network change detected; rebuilding presence socket");
  stop();
  start();
}

bool PresenceService::open_socket_locked(int attempts) {
  std::error_code address_ec;
  auto bind_address = asio::ip::make_address(options_.bind_address, address_ec);
  if(address_ec) {
    logger_->error("Invalid presence bind address '{}'", options_.bind_address);
    return false;
  }
  for(int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      auto socket = std::make_unique<udp::socket>(io_);
      socket->open(udp::v4());
      socket->set_option(udp::socket::reuse_address(true));
      std::error_code ec;
      socket->set_option(reuse_port(true), ec);
      socket->set_option(asio::socket_base::broadcast(true));
      socket->bind(udp::endpoint(bind_address, options_.discovery_port));
      if(options_.use_multicast) {
        socket->set_option(asio::ip::multicast::enable_loopback(true), ec);
        if(!local_.ip.empty()) {
          auto local_address = asio::ip::make_address_v4(local_.ip, ec);
          if(!ec) socket->set_option(asio::ip::multicast::outbound_interface(local_address), ec);
        }
      }
      bound_port_ = socket->local_endpoint().port();
      socket_ = std::move(socket);
      ++epoch_;
      last_datagram_at_ = SteadyClock::now();
      if(options_.use_multicast) join_groups_locked();
      return true;
    } catch(const std::system_error& e) {
      logger_->warn("Presence bind attempt {}/{} on port {} failed: {}",
                    attempt, attempts, options_.discovery_port, e.what());
      if(attempt < attempts) std::this_thread::sleep_for(options_.bind_retry_delay);
    }
  }
  return false;
}

void PresenceService::close_socket_locked() {
  ++epoch_;
  if(!socket_) return;
  std::error_code ec;
  socket_->close(ec);
  socket_.reset();
}

void PresenceService::join_groups_locked() {
  if(!socket_) return;
  std::error_code ec;
  auto group = asio::ip::make_address_v4(options_.multicast_group, ec);
  if(ec) {
    logger_->error("Invalid multicast group '{}'", options_.multicast_group);
    return;
  }
  int joined = 0;
  for(const auto& iface : list_ipv4_interfaces()) {
    if(iface.is_loopback) continue;
    auto iface_address = asio::ip::make_address_v4(iface.address, ec);
    if(ec) continue;
    // a rejoin needs the old membership dropped first
    socket_->set_option(asio::ip::multicast::leave_group(group, iface_address), ec);
    socket_->set_option(asio::ip::multicast::join_group(group, iface_address), ec);
    if(ec) {
      logger_->debug("Multicast join on {} ({}) failed: {}", iface.name, iface.address, ec.message());
      continue;
    }
    ++joined;
  }
  if(joined == 0) {
    socket_->set_option(asio::ip::multicast::join_group(group), ec);
    if(ec) {
      logger_->warn("Multicast join failed on every interface: {}", ec.message());
      return;
    }
    joined = 1;
  }
  logger_->debug("Joined {} on {} interface(s)", options_.multicast_group, joined);
}

void PresenceService::arm_timers_locked() {
  start_receive_locked();
  schedule_heartbeat_locked(std::chrono::milliseconds(0));
  schedule_sweep_locked();
  schedule_health_check_locked();
  if(options_.use_multicast) schedule_rejoin_locked();
}

void PresenceService::cancel_timers_locked() {
  heartbeat_timer_.cancel();
  sweep_timer_.cancel();
  health_timer_.cancel();
  rejoin_timer_.cancel();
  restart_timer_.cancel();
}

void PresenceService::start_receive_locked() {
  if(!socket_) return;
  auto epoch = epoch_;
  socket_->async_receive_from(asio::buffer(receive_buffer_), sender_endpoint_,
    [this, epoch](const std::error_code& ec, std::size_t bytes){
      if(ec == asio::error::operation_aborted) return;
      std::string payload;
      std::string source;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if(epoch != epoch_ || !socket_) return;
        if(!ec) {
          payload.assign(receive_buffer_.data(), bytes);
          source = sender_endpoint_.address().to_string();
        } else {
          logger_->debug("Presence receive error: {}", ec.message());
        }
        start_receive_locked();
      }
      if(!payload.empty()) ingest_datagram(payload, source);
    });
}

void PresenceService::schedule_heartbeat_locked(std::chrono::milliseconds delay) {
  auto epoch = epoch_;
  heartbeat_timer_.expires_after(delay);
  heartbeat_timer_.async_wait([this, epoch](const std::error_code& ec){
    if(ec) return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(epoch != epoch_ || state_ != PresenceState::Running) return;
    }
    send_heartbeat();
    std::lock_guard<std::mutex> lock(mutex_);
    if(epoch == epoch_ && state_ == PresenceState::Running) {
      schedule_heartbeat_locked(options_.heartbeat_interval);
    }
  });
}

void PresenceService::schedule_sweep_locked() {
  auto epoch = epoch_;
  sweep_timer_.expires_after(options_.sweep_interval);
  sweep_timer_.async_wait([this, epoch](const std::error_code& ec){
    if(ec) return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(epoch != epoch_) return;
    }
    sweep(WallClock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    if(epoch == epoch_ && state_ == PresenceState::Running) schedule_sweep_locked();
  });
}

void PresenceService::schedule_health_check_locked() {
  auto epoch = epoch_;
  health_timer_.expires_after(options_.health_check_interval);
  health_timer_.async_wait([this, epoch](const std::error_code& ec){
    if(ec) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if(epoch != epoch_ || state_ != PresenceState::Running) return;
    auto silent_for = SteadyClock::now() - last_datagram_at_;
    if(silent_for > options_.silence_limit) {
      auto silent_ms = std::chrono::duration_cast<std::chrono::milliseconds>(silent_for).count();
      restart_locked("no presence traffic for " + std::to_string(silent_ms) + " ms");
      return;
    }
    schedule_health_check_locked();
  });
}

void PresenceService::schedule_rejoin_locked() {
  auto epoch = epoch_;
  rejoin_timer_.expires_after(options_.rejoin_interval);
  rejoin_timer_.async_wait([this, epoch](const std::error_code& ec){
    if(ec) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if(epoch != epoch_ || state_ != PresenceState::Running) return;
    join_groups_locked();
    schedule_rejoin_locked();
  });
}

std::vector<asio::ip::udp::endpoint> PresenceService::heartbeat_targets_locked() const {
  std::vector<udp::endpoint> targets;
  std::error_code ec;
  if(options_.use_multicast) {
    auto group = asio::ip::make_address(options_.multicast_group, ec);
    if(!ec) targets.emplace_back(group, options_.discovery_port);
  }
  if(options_.use_broadcast) {
    auto broadcast = asio::ip::make_address(broadcast_address_, ec);
    if(!ec) targets.emplace_back(broadcast, options_.discovery_port);
  }
  for(const auto& text : options_.unicast_targets) {
    if(auto target = parse_target(text)) targets.push_back(*target);
  }
  return targets;
}

bool PresenceService::send_heartbeat() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(state_ != PresenceState::Running) return false;
  local_.last_seen = WallClock::now();
  auto payload = local_.to_json().dump();

  std::error_code failure;
  for(const auto& target : heartbeat_targets_locked()) {
    std::error_code ec;
    if(datagram_sender_) {
      ec = datagram_sender_(payload, target);
    } else if(socket_) {
      socket_->send_to(asio::buffer(payload), target, 0, ec);
    } else {
      ec = asio::error::not_connected;
    }
    if(ec) {
      // one failure per round; later targets are skipped
      failure = ec;
      logger_->debug("Heartbeat to {}:{} failed: {}", target.address().to_string(), target.port(), ec.message());
      break;
    }
  }
  if(!failure) {
    send_failures_ = 0;
    return true;
  }
  ++send_failures_;
  logger_->warn("Heartbeat failed ({} consecutive): {}", send_failures_, failure.message());
  if(send_failures_ >= options_.max_send_failures) {
    restart_locked(std::to_string(send_failures_) + " consecutive heartbeat failures");
  }
  return false;
}

void PresenceService::ingest_datagram(const std::string& payload, const std::string& source_address) {
  std::string local_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_datagram_at_ = SteadyClock::now();
    local_id = local_.id;
  }
  auto doc = nlohmann::json::parse(payload, nullptr, false);
  if(doc.is_discarded()) return;
  auto device = Device::from_json(doc);
  if(!device) return;
  if(device->id == local_id) return;
  if(device->ip.empty()) device->ip = source_address;
  device->last_seen = WallClock::now();

  bool is_new = false;
  {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    is_new = devices_.find(device->id) == devices_.end();
    devices_[device->id] = *device;
  }
  if(is_new) {
    logger_->info("Discovered {} at {}:{} ({})", device->name, device->ip, device->port, device->platform_label());
  }
  publish_devices();
}

std::size_t PresenceService::sweep(WallTime now) {
  std::vector<std::string> removed;
  {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    for(auto it = devices_.begin(); it != devices_.end();) {
      if(now - it->second.last_seen > options_.device_timeout) {
        removed.push_back(it->second.name);
        it = devices_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if(removed.empty()) return 0;
  for(const auto& name : removed) {
    logger_->info("Device {} went offline", name);
  }
  publish_devices();
  return removed.size();
}

void PresenceService::add_manual_device(Device device) {
  if(device.id.empty()) return;
  device.last_seen = WallClock::now();
  {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    devices_[device.id] = device;
  }
  logger_->info("Added device {} at {}:{}", device.name, device.ip, device.port);
  publish_devices();
}

void PresenceService::clear_devices() {
  {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    devices_.clear();
  }
  publish_devices();
}

PresenceService::DeviceList PresenceService::devices() const {
  DeviceList out;
  {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    out.reserve(devices_.size());
    for(const auto& entry : devices_) out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(), [](const Device& a, const Device& b){
    return a.name == b.name ? a.id < b.id : a.name < b.name;
  });
  return out;
}

std::optional<Device> PresenceService::find_device(const std::string& id) const {
  std::lock_guard<std::mutex> lock(devices_mutex_);
  auto it = devices_.find(id);
  if(it == devices_.end()) return std::nullopt;
  return it->second;
}

Device PresenceService::local_device() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return local_;
}

void PresenceService::set_local_name(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  local_.name = name;
}

void PresenceService::publish_devices() {
  device_events_.publish(devices());
}

SubscriptionHandle PresenceService::subscribe(EventChannel<DeviceList>::Callback callback) {
  return device_events_.subscribe(std::move(callback));
}

void PresenceService::unsubscribe(SubscriptionHandle handle) {
  device_events_.unsubscribe(handle);
}

void PresenceService::set_datagram_sender(DatagramSender sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  datagram_sender_ = std::move(sender);
}

PresenceState PresenceService::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int PresenceService::consecutive_send_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return send_failures_;
}

int PresenceService::restart_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restart_count_;
}

uint16_t PresenceService::bound_port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bound_port_;
}

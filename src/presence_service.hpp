#pragma once

#include <asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device.hpp"
#include "event_channel.hpp"
#include "log.hpp"
#include "protocol.hpp"

enum class PresenceState { Stopped, Running, Restarting };

const char* to_string(PresenceState state);
bool presence_transition_allowed(PresenceState from, PresenceState to);

// UDP heartbeat discovery. Announces the local device on a multicast group and
// the subnet broadcast address, keeps the live device registry, evicts silent
// devices and restarts its own socket when sends keep failing or nothing has
// been heard for too long. All socket and timer work runs on the io_context.
class PresenceService {
public:
  struct Options {
    uint16_t discovery_port = kDefaultDiscoveryPort;
    std::string multicast_group = kDefaultMulticastGroup;
    std::string bind_address = "0.0.0.0";
    bool use_multicast = true;
    bool use_broadcast = true;
    // Extra unicast "ip:port" targets for every heartbeat.
    std::vector<std::string> unicast_targets;
    // Replace the local device ip with the best LAN address on start.
    bool resolve_local_address = true;

    std::chrono::milliseconds heartbeat_interval{3000};
    std::chrono::milliseconds device_timeout{30000};
    std::chrono::milliseconds sweep_interval{5000};
    std::chrono::milliseconds rejoin_interval{120000};
    std::chrono::milliseconds health_check_interval{30000};
    std::chrono::milliseconds silence_limit{60000};
    std::chrono::milliseconds restart_delay{2000};
    std::chrono::milliseconds restart_retry_delay{10000};
    std::chrono::milliseconds bind_retry_delay{2000};
    int bind_attempts = 3;
    int max_send_failures = 3;
  };

  using DeviceList = std::vector<Device>;
  using DatagramSender = std::function<std::error_code(const std::string& payload,
                                                       const asio::ip::udp::endpoint& target)>;

  PresenceService(asio::io_context& io,
                  Device local,
                  Options options,
                  std::shared_ptr<Logger> logger = nullptr);
  ~PresenceService();

  PresenceService(const PresenceService&) = delete;
  PresenceService& operator=(const PresenceService&) = delete;

  // Binds the socket (retrying), joins the group and arms the timers.
  bool start();
  void stop();
  // Running -> Restarting -> Running after restart_delay. Rejected while
  // already restarting or stopped.
  bool restart(const std::string& reason);
  // Full stop/start with address re-resolution.
  void on_network_changed();

  void add_manual_device(Device device);
  void clear_devices();
  void ingest_datagram(const std::string& payload, const std::string& source_address);
  // Removes devices silent for longer than device_timeout. Returns how many.
  std::size_t sweep(WallTime now);
  // One heartbeat round. Returns false when the round counted as a failure.
  bool send_heartbeat();

  DeviceList devices() const;
  std::optional<Device> find_device(const std::string& id) const;
  Device local_device() const;
  void set_local_name(const std::string& name);

  SubscriptionHandle subscribe(EventChannel<DeviceList>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);

  // Replaces socket sends, e.g. to simulate a broken network.
  void set_datagram_sender(DatagramSender sender);

  PresenceState state() const;
  int consecutive_send_failures() const;
  int restart_count() const;
  uint16_t bound_port() const;
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  using udp = asio::ip::udp;
  using SteadyClock = std::chrono::steady_clock;

  bool transition_locked(PresenceState to);
  bool open_socket_locked(int attempts);
  void close_socket_locked();
  void join_groups_locked();
  void arm_timers_locked();
  void cancel_timers_locked();
  void start_receive_locked();
  void schedule_heartbeat_locked(std::chrono::milliseconds delay);
  void schedule_sweep_locked();
  void schedule_health_check_locked();
  void schedule_rejoin_locked();
  bool restart_locked(const std::string& reason);
  void schedule_restart_attempt_locked(std::chrono::milliseconds delay);
  std::vector<udp::endpoint> heartbeat_targets_locked() const;
  void publish_devices();

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  Device local_;
  PresenceState state_ = PresenceState::Stopped;
  std::unique_ptr<udp::socket> socket_;
  udp::endpoint sender_endpoint_;
  std::array<char, 8192> receive_buffer_{};
  asio::steady_timer heartbeat_timer_;
  asio::steady_timer sweep_timer_;
  asio::steady_timer health_timer_;
  asio::steady_timer rejoin_timer_;
  asio::steady_timer restart_timer_;
  uint64_t epoch_ = 0;
  int send_failures_ = 0;
  int restart_count_ = 0;
  uint16_t bound_port_ = 0;
  std::string broadcast_address_ = "255.255.255.255";
  SteadyClock::time_point last_datagram_at_{};
  DatagramSender datagram_sender_;

  mutable std::mutex devices_mutex_;
  std::map<std::string, Device> devices_;
  EventChannel<DeviceList> device_events_;
};

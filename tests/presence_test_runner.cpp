#include "device.hpp"
#include "presence_service.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using anyware::test::TestCase;
using anyware::test::TestContext;
using namespace std::chrono_literals;

namespace {

struct IoThread {
  asio::io_context io;
  asio::executor_work_guard<asio::io_context::executor_type> work{asio::make_work_guard(io)};
  std::thread thread;

  void start() { thread = std::thread([this]{ io.run(); }); }
  ~IoThread() {
    work.reset();
    io.stop();
    if(thread.joinable()) thread.join();
  }
};

Device make_device(const std::string& id, const std::string& name, const std::string& ip = "127.0.0.1") {
  return Device::create_local(name, ip, kDefaultTransferPort, "linux", id);
}

// Loopback-only presence: no multicast, no broadcast, ephemeral port.
PresenceService::Options loopback_options() {
  PresenceService::Options options;
  options.discovery_port = 0;
  options.bind_address = "127.0.0.1";
  options.use_multicast = false;
  options.use_broadcast = false;
  options.resolve_local_address = false;
  options.heartbeat_interval = 50ms;
  options.restart_delay = 100ms;
  options.bind_retry_delay = 10ms;
  return options;
}

bool test_ignores_own_heartbeat(TestContext& ctx) {
  asio::io_context io;
  auto local = make_device("self", "Self");
  PresenceService presence(io, local, loopback_options());
  ctx.logs.attach(presence.logger());

  presence.ingest_datagram(local.to_json().dump(), "127.0.0.1");
  if(!presence.devices().empty()) return false;

  presence.ingest_datagram(make_device("peer", "Peer").to_json().dump(), "127.0.0.1");
  presence.ingest_datagram("not json", "127.0.0.1");
  presence.ingest_datagram("{\"id\":\"x\"}", "127.0.0.1");
  auto devices = presence.devices();
  return devices.size() == 1 && devices.front().id == "peer" && ctx.logs.contains("Discovered Peer");
}

bool test_ip_falls_back_to_source(TestContext&) {
  asio::io_context io;
  PresenceService presence(io, make_device("self", "Self"), loopback_options());
  auto peer = make_device("peer", "Peer", "");
  presence.ingest_datagram(peer.to_json().dump(), "10.1.2.3");
  auto found = presence.find_device("peer");
  if(!found || found->ip != "10.1.2.3") return false;

  // a packet without ip, platform or version still registers
  presence.ingest_datagram(R"({"id":"bare","name":"Bare","port":42017})", "10.1.2.4");
  auto bare = presence.find_device("bare");
  return bare && bare->ip == "10.1.2.4" && bare->port == 42017 &&
         bare->platform.empty() && bare->version == kProtocolVersion;
}

bool test_sighting_replaces_record(TestContext&) {
  asio::io_context io;
  PresenceService presence(io, make_device("self", "Self"), loopback_options());
  presence.ingest_datagram(make_device("peer", "Old Name", "10.0.0.5").to_json().dump(), "10.0.0.5");
  presence.ingest_datagram(make_device("peer", "New Name", "10.0.0.6").to_json().dump(), "10.0.0.6");
  auto devices = presence.devices();
  return devices.size() == 1 && devices.front().name == "New Name" && devices.front().ip == "10.0.0.6";
}

bool test_eviction_published_once(TestContext& ctx) {
  asio::io_context io;
  PresenceService presence(io, make_device("self", "Self"), loopback_options());
  ctx.logs.attach(presence.logger());

  std::vector<std::size_t> published;
  presence.subscribe([&](const PresenceService::DeviceList& list){ published.push_back(list.size()); });
  presence.ingest_datagram(make_device("a", "Alpha").to_json().dump(), "127.0.0.1");
  presence.ingest_datagram(make_device("b", "Beta").to_json().dump(), "127.0.0.1");
  if(published.size() != 2 || published.back() != 2) return false;

  auto now = WallClock::now();
  if(presence.sweep(now) != 0 || published.size() != 2) return false;

  auto later = now + 31s;
  if(presence.sweep(later) != 2) return false;
  if(published.size() != 3 || published.back() != 0) return false;
  if(presence.sweep(later) != 0 || published.size() != 3) return false;
  return ctx.logs.contains("Device Alpha went offline");
}

bool test_manual_device(TestContext&) {
  asio::io_context io;
  PresenceService presence(io, make_device("self", "Self"), loopback_options());
  int events = 0;
  presence.subscribe([&](const PresenceService::DeviceList&){ ++events; });

  Device manual = make_device("tv", "Bedroom TV", "192.168.1.44");
  manual.last_seen = WallClock::now() - 1h;
  presence.add_manual_device(manual);
  auto found = presence.find_device("tv");
  // added devices are fresh and take part in the normal timeout
  if(!found || !found->is_online(WallClock::now()) || events != 1) return false;

  presence.add_manual_device(Device{});
  if(events != 1 || presence.devices().size() != 1) return false;

  presence.clear_devices();
  return presence.devices().empty() && events == 2;
}

bool test_transition_table(TestContext&) {
  using S = PresenceState;
  struct Case { S from; S to; bool allowed; };
  std::vector<Case> cases = {
    {S::Stopped, S::Running, true},
    {S::Running, S::Restarting, true},
    {S::Restarting, S::Running, true},
    {S::Running, S::Stopped, true},
    {S::Restarting, S::Stopped, true},
    {S::Stopped, S::Restarting, false},
    {S::Restarting, S::Restarting, false},
  };
  for(const auto& c : cases) {
    if(presence_transition_allowed(c.from, c.to) != c.allowed) return false;
  }
  return true;
}

bool test_restart_rejected_when_stopped(TestContext&) {
  asio::io_context io;
  PresenceService presence(io, make_device("self", "Self"), loopback_options());
  return !presence.restart("manual") && presence.state() == PresenceState::Stopped;
}

bool test_restart_after_send_failures(TestContext& ctx) {
  IoThread runner;
  auto options = loopback_options();
  options.unicast_targets = {"127.0.0.1:9"};
  PresenceService presence(runner.io, make_device("self", "Self"), options);
  ctx.logs.attach(presence.logger());

  // three failed rounds, then a healthy network
  std::atomic<int> calls{0};
  presence.set_datagram_sender([&](const std::string&, const asio::ip::udp::endpoint&){
    return ++calls <= 3 ? std::make_error_code(std::errc::network_unreachable) : std::error_code();
  });
  if(!presence.start()) return false;
  runner.start();

  bool restarted = anyware::test::wait_for_condition([&]{
    return presence.restart_count() == 1 && presence.state() == PresenceState::Running;
  }, 5s);
  if(!restarted) return false;
  bool healthy = anyware::test::wait_for_condition([&]{
    return calls.load() > 4 && presence.consecutive_send_failures() == 0;
  }, 5s);
  presence.stop();
  return healthy && ctx.logs.contains("3 consecutive heartbeat failures") &&
         presence.restart_count() == 1;
}

bool test_loopback_discovery(TestContext& ctx) {
  IoThread runner;
  PresenceService listener(runner.io, make_device("listener", "Listener"), loopback_options());
  ctx.logs.attach(listener.logger(), "listener");
  if(!listener.start()) return false;

  auto options = loopback_options();
  options.unicast_targets = {"127.0.0.1:" + std::to_string(listener.bound_port())};
  PresenceService announcer(runner.io, make_device("announcer", "Announcer"), options);
  if(!announcer.start()) return false;
  runner.start();

  bool discovered = anyware::test::wait_for_condition([&]{
    return listener.find_device("announcer").has_value();
  }, 5s);
  announcer.stop();
  listener.stop();
  return discovered && listener.state() == PresenceState::Stopped;
}

bool test_network_change_rebinds(TestContext& ctx) {
  IoThread runner;
  PresenceService presence(runner.io, make_device("self", "Self"), loopback_options());
  ctx.logs.attach(presence.logger());
  if(!presence.start()) return false;
  runner.start();
  presence.ingest_datagram(make_device("peer", "Peer").to_json().dump(), "127.0.0.1");

  presence.on_network_changed();
  bool running = presence.state() == PresenceState::Running && presence.bound_port() != 0;
  // known devices survive a rebind; they age out through the normal timeout
  bool kept = presence.find_device("peer").has_value();
  presence.stop();
  return running && kept && ctx.logs.contains("rebuilding presence socket");
}

bool test_silence_triggers_restart(TestContext& ctx) {
  IoThread runner;
  auto options = loopback_options();
  options.health_check_interval = 50ms;
  options.silence_limit = 150ms;

  // a peer heartbeating at the listener keeps it out of the health check
  PresenceService heard(runner.io, make_device("heard", "Heard"), options);
  if(!heard.start()) return false;
  auto announcer_options = loopback_options();
  announcer_options.unicast_targets = {"127.0.0.1:" + std::to_string(heard.bound_port())};
  PresenceService announcer(runner.io, make_device("announcer", "Announcer"), announcer_options);
  if(!announcer.start()) return false;

  PresenceService quiet(runner.io, make_device("quiet", "Quiet"), options);
  ctx.logs.attach(quiet.logger());
  if(!quiet.start()) return false;
  runner.start();

  bool restarted = anyware::test::wait_for_condition([&]{ return quiet.restart_count() >= 1; }, 5s);
  int heard_restarts = heard.restart_count();
  quiet.stop();
  announcer.stop();
  heard.stop();
  return restarted && heard_restarts == 0 && ctx.logs.contains("no presence traffic for");
}

bool test_three_peers_three_entries(TestContext& ctx) {
  IoThread runner;
  PresenceService listener(runner.io, make_device("listener", "Listener"), loopback_options());
  ctx.logs.attach(listener.logger(), "listener");
  if(!listener.start()) return false;

  auto options = loopback_options();
  options.unicast_targets = {"127.0.0.1:" + std::to_string(listener.bound_port())};
  std::vector<std::unique_ptr<PresenceService>> peers;
  for(const char* name : {"Alpha", "Beta", "Gamma"}) {
    peers.push_back(std::make_unique<PresenceService>(runner.io, make_device(name, name), options));
    if(!peers.back()->start()) return false;
  }
  runner.start();

  bool all_seen = anyware::test::wait_for_condition([&]{ return listener.devices().size() == 3; }, 5s);
  // repeated heartbeats refresh the same three records
  std::this_thread::sleep_for(300ms);
  auto devices = listener.devices();
  for(auto& peer : peers) peer->stop();
  listener.stop();
  if(!all_seen || devices.size() != 3) return false;
  for(const char* id : {"Alpha", "Beta", "Gamma"}) {
    if(std::count_if(devices.begin(), devices.end(),
                     [&](const Device& d){ return d.id == id; }) != 1) return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"ignores_own_heartbeat", test_ignores_own_heartbeat},
    {"ip_falls_back_to_source", test_ip_falls_back_to_source},
    {"sighting_replaces_record", test_sighting_replaces_record},
    {"eviction_published_once", test_eviction_published_once},
    {"manual_device", test_manual_device},
    {"transition_table", test_transition_table},
    {"restart_rejected_when_stopped", test_restart_rejected_when_stopped},
    {"restart_after_send_failures", test_restart_after_send_failures},
    {"loopback_discovery", test_loopback_discovery},
    {"network_change_rebinds", test_network_change_rebinds},
    {"silence_triggers_restart", test_silence_triggers_restart},
    {"three_peers_three_entries", test_three_peers_three_entries},
  };
  return anyware::test::run_tests("presence", tests, argc, argv);
}

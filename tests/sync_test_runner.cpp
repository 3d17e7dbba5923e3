#include "device.hpp"
#include "http_client.hpp"
#include "multipart.hpp"
#include "protocol.hpp"
#include "sync_client.hpp"
#include "sync_engine.hpp"
#include "sync_job.hpp"
#include "sync_receiver.hpp"
#include "test_runner_utils.hpp"
#include "transfer_receiver.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using anyware::test::LoopbackServer;
using anyware::test::TestCase;
using anyware::test::TestContext;
using namespace std::chrono_literals;

namespace {

Device laptop() {
  return Device::create_local("Laptop", "127.0.0.1", kDefaultTransferPort, "linux", "laptop-id");
}

// A sync target: ping plus the /api/sync routes on a loopback port.
class SyncPeer {
public:
  explicit SyncPeer(const std::filesystem::path& downloads)
    : downloads_(downloads),
      logger_(std::make_shared<Logger>("nas")),
      receiver_([this]{ return device_; }, TransferReceiver::Options{downloads, false, 0}, logger_),
      sync_([this]{ return downloads_; }, logger_),
      server_(logger_) {
    sync_.subscribe([this](const SyncActivity& activity){
      std::lock_guard<std::mutex> lock(mutex_);
      activity_.push_back(activity);
    });
    server_.mount(receiver_.router());
    server_.mount(sync_.router());
    auto port = server_.start();
    device_ = Device::create_local("NAS", "127.0.0.1", port, "linux", "nas-id");
  }

  const Device& device() const { return device_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  SyncReceiver& sync() { return sync_; }
  // Takes the target off the network; later connections are refused.
  void go_offline() { server_.stop(); }

  std::filesystem::path mirrored(const std::string& relative) const {
    return downloads_ / "Sync" / "Laptop" / relative;
  }

  std::size_t count(SyncActivity::Kind kind, const std::string& relative = std::string()) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for(const auto& a : activity_) {
      if(a.kind == kind && (relative.empty() || a.relative_path == relative)) ++n;
    }
    return n;
  }

private:
  std::filesystem::path downloads_;
  std::shared_ptr<Logger> logger_;
  Device device_;
  TransferReceiver receiver_;
  SyncReceiver sync_;
  mutable std::mutex mutex_;
  std::vector<SyncActivity> activity_;
  LoopbackServer server_;
};

SyncEngine::Options quick_engine_options(const std::filesystem::path& jobs_file = {}) {
  SyncEngine::Options options;
  options.jobs_file = jobs_file;
  options.initial_debounce = 50ms;
  options.change_debounce = 100ms;
  options.retry_base_delay = 10ms;
  options.reconnect_delays = {50ms};
  options.pause_poll = 20ms;
  return options;
}

std::shared_ptr<SyncClient> make_client(std::shared_ptr<Logger> logger = nullptr) {
  SyncClient::Options options;
  options.ping_timeout = 1000ms;
  options.check_timeout = 2000ms;
  options.delete_timeout = 2000ms;
  return std::make_shared<SyncClient>(laptop, options, std::move(logger));
}

SyncEngine::DeviceResolver no_registry() {
  return [](const std::string&) -> std::optional<Device> { return std::nullopt; };
}

bool wait_for_phase(SyncEngine& engine, const std::string& id, SyncPhase phase,
                    std::chrono::milliseconds timeout = 10s) {
  return anyware::test::wait_for_condition([&]{
    auto job = engine.job(id);
    return job && job->phase == phase;
  }, timeout);
}

bool test_receiver_upload_check_delete(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_receiver");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());
  auto source = root / "src" / "Docs" / "my notes.txt";
  anyware::test::write_file(source, "sync me");

  auto client = make_client();
  auto before = client->check(peer.device(), "Docs/my notes.txt");
  if(!before || before->exists) return false;

  std::string error;
  if(!client->upload(peer.device(), source, "Docs/my notes.txt", error)) return false;
  if(anyware::test::read_file(peer.mirrored("Docs/my notes.txt")) != "sync me") return false;
  if(peer.count(SyncActivity::Kind::Received, "Docs/my notes.txt") != 1) return false;

  auto after = client->check(peer.device(), "Docs/my notes.txt");
  if(!after || !after->exists || after->size != 7 || after->last_modified_ms <= 0) return false;

  // a second upload overwrites in place
  anyware::test::write_file(source, "sync me again");
  if(!client->upload(peer.device(), source, "Docs/my notes.txt", error)) return false;
  if(anyware::test::read_file(peer.mirrored("Docs/my notes.txt")) != "sync me again") return false;

  if(!client->remove(peer.device(), "Docs", error)) return false;
  std::error_code ec;
  if(std::filesystem::exists(peer.mirrored("Docs"), ec)) return false;
  if(peer.count(SyncActivity::Kind::Deleted, "Docs") != 1) return false;
  // deleting something already gone still succeeds
  return client->remove(peer.device(), "Docs", error);
}

bool test_receiver_rejects_bad_requests(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_reject");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());
  HttpClient client("127.0.0.1", peer.device().port);

  auto envelope = MultipartEnvelope::for_file("file", "x.txt", "B0UND");
  auto body = envelope.preamble + "evil" + envelope.epilogue;
  HttpHeaders traversal{{"content-type", envelope.content_type()},
                        {"x-sync-path", url_encode("../../outside.txt")},
                        {"x-device-name", "Laptop"}};
  if(client.request("POST", "/api/sync/upload", traversal, body, 2000ms).status != 403) return false;

  HttpHeaders bad_sender{{"content-type", envelope.content_type()},
                         {"x-sync-path", "x.txt"},
                         {"x-device-name", url_encode("..")}};
  if(client.request("POST", "/api/sync/upload", bad_sender, body, 2000ms).status != 403) return false;

  HttpHeaders no_path{{"content-type", envelope.content_type()}};
  if(client.request("POST", "/api/sync/upload", no_path, body, 2000ms).status != 400) return false;

  HttpHeaders not_multipart{{"content-type", "application/octet-stream"}, {"x-sync-path", "x.txt"}};
  if(client.request("POST", "/api/sync/upload", not_multipart, "evil", 2000ms).status != 400) return false;

  if(client.get("/api/sync/check?path=..%2Fescape", 2000ms).status != 403) return false;
  if(client.get("/api/sync/check", 2000ms).status != 400) return false;
  if(client.post_json("/api/sync/delete", {{"relativePath", "../../etc"}, {"senderName", "Laptop"}}, 2000ms).status != 403) {
    return false;
  }

  // an upload without a sender lands under "Unknown"
  HttpHeaders anonymous{{"content-type", envelope.content_type()}, {"x-sync-path", "x.txt"}};
  auto stored = client.request("POST", "/api/sync/upload", anonymous, body, 2000ms);
  std::error_code ec;
  return stored.status == 200 &&
         anyware::test::read_file(root / "downloads" / "Sync" / "Unknown" / "x.txt") == "evil" &&
         !std::filesystem::exists(root / "outside.txt", ec);
}

bool test_receiver_drops_partial_upload(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_partial");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());

  auto envelope = MultipartEnvelope::for_file("file", "big.bin", "B0UND");
  HttpHeaders headers{{"content-type", envelope.content_type()},
                      {"x-sync-path", "big.bin"},
                      {"x-device-name", "Laptop"}};
  {
    HttpClient client("127.0.0.1", peer.device().port);
    if(client.begin("POST", "/api/sync/upload", headers, envelope.total_size(4096), 2000ms)) return false;
    std::string partial = envelope.preamble + std::string(100, 'z');
    if(client.write(partial.data(), partial.size(), 2000ms)) return false;
    client.close();
  }
  bool logged = ctx.logs.wait_for_substring("dropped after", 5s);
  std::error_code ec;
  return logged && !std::filesystem::exists(peer.mirrored("big.bin"), ec) &&
         !std::filesystem::exists(peer.mirrored("big.bin.tmp"), ec);
}

bool test_engine_mirrors_and_skips_unchanged(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_engine_mirror");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());
  anyware::test::write_file(root / "src" / "a.txt", "alpha");
  anyware::test::write_file(root / "src" / "sub" / "b.txt", "bravo");

  auto logger = std::make_shared<Logger>("sync-engine");
  ctx.logs.attach(logger);
  SyncEngine engine(make_client(logger), no_registry(), quick_engine_options(), logger);
  std::string error;
  auto job = engine.create_job("Docs", root / "src", peer.device(), std::nullopt, error);
  if(!job || job->id.rfind("sync_", 0) != 0) return false;
  if(engine.create_job("Again", root / "src", peer.device(), std::nullopt, error)) return false;

  if(!engine.start_job(job->id, error)) return false;
  bool watching = anyware::test::wait_for_condition([&]{
    auto current = engine.job(job->id);
    return current && current->phase == SyncPhase::Watching && current->synced_count == 2;
  }, 10s);
  if(!watching) return false;
  if(anyware::test::read_file(peer.mirrored("sub/b.txt")) != "bravo") return false;
  auto finished = engine.job(job->id);
  if(!finished->last_sync_time || finished->progress_percent() != 100) return false;

  // a second full run finds everything already on the target
  if(!engine.stop_job(job->id)) return false;
  if(engine.job(job->id)->phase != SyncPhase::Idle) return false;
  if(!engine.start_job(job->id, error)) return false;
  bool skipped = anyware::test::wait_for_condition([&]{
    auto current = engine.job(job->id);
    return current && current->phase == SyncPhase::Watching && current->skipped_count == 2;
  }, 10s);
  engine.stop();
  return skipped && peer.count(SyncActivity::Kind::Received) == 2 &&
         engine.job(job->id)->synced_count == 0;
}

bool test_engine_follows_changes_and_deletes(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_engine_watch");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());
  anyware::test::write_file(root / "src" / "keep.txt", "keep");

  SyncEngine engine(make_client(), no_registry(), quick_engine_options());
  std::string error;
  auto job = engine.create_job("Watch", root / "src", peer.device(), std::nullopt, error);
  if(!job || !engine.start_job(job->id, error)) return false;
  if(!wait_for_phase(engine, job->id, SyncPhase::Watching)) return false;

  anyware::test::write_file(root / "src" / "fresh.txt", "new content");
  bool uploaded = anyware::test::wait_for_condition([&]{
    return peer.count(SyncActivity::Kind::Received, "fresh.txt") >= 1;
  }, 10s);
  if(!uploaded || anyware::test::read_file(peer.mirrored("fresh.txt")) != "new content") return false;

  std::filesystem::remove(root / "src" / "keep.txt");
  bool deleted = anyware::test::wait_for_condition([&]{
    return peer.count(SyncActivity::Kind::Deleted, "keep.txt") == 1;
  }, 10s);
  std::error_code ec;
  bool gone = !std::filesystem::exists(peer.mirrored("keep.txt"), ec);
  engine.stop();
  return deleted && gone;
}

bool test_engine_pause_and_resume(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_engine_pause");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());
  anyware::test::write_file(root / "src" / "one.txt", "1");
  anyware::test::write_file(root / "src" / "two.txt", "2");

  auto options = quick_engine_options();
  options.initial_debounce = 300ms;
  SyncEngine engine(make_client(), no_registry(), options);
  std::string error;
  auto job = engine.create_job("Pausable", root / "src", peer.device(), std::nullopt, error);
  if(!job || !engine.start_job(job->id, error)) return false;

  // still inside the initial debounce, nothing has been sent yet
  if(!engine.pause_job(job->id)) return false;
  if(engine.pause_job(job->id)) return false;
  std::this_thread::sleep_for(600ms);
  auto paused = engine.job(job->id);
  if(!paused || paused->phase != SyncPhase::Paused || peer.count(SyncActivity::Kind::Received) != 0) return false;

  if(!engine.resume_job(job->id)) return false;
  bool done = anyware::test::wait_for_condition([&]{
    auto current = engine.job(job->id);
    return current && current->phase == SyncPhase::Watching && current->synced_count == 2;
  }, 10s);
  engine.stop();
  return done && peer.count(SyncActivity::Kind::Received) == 2 &&
         engine.job(job->id)->phase == SyncPhase::Idle;
}

bool test_engine_skip_request(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_engine_skip");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());
  anyware::test::write_file(root / "src" / "wanted.txt", "w");
  anyware::test::write_file(root / "src" / "unwanted.txt", "u");

  auto options = quick_engine_options();
  options.initial_debounce = 200ms;
  SyncEngine engine(make_client(), no_registry(), options);
  std::string error;
  auto job = engine.create_job("Skip", root / "src", peer.device(), std::nullopt, error);
  if(!job || !engine.start_job(job->id, error)) return false;
  if(!engine.skip_file(job->id, "unwanted.txt")) return false;

  bool done = anyware::test::wait_for_condition([&]{
    auto current = engine.job(job->id);
    return current && current->phase == SyncPhase::Watching;
  }, 10s);
  auto finished = engine.job(job->id);
  engine.stop();
  std::error_code ec;
  return done && finished->synced_count == 1 && finished->skipped_count == 1 &&
         !std::filesystem::exists(peer.mirrored("unwanted.txt"), ec);
}

bool test_engine_unreachable_target(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_engine_unreachable");
  anyware::test::write_file(root / "src" / "a.txt", "a");
  uint16_t port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }
  auto ghost = Device::create_local("Ghost", "127.0.0.1", port, "linux", "ghost-id");

  auto logger = std::make_shared<Logger>("sync-engine");
  ctx.logs.attach(logger);
  SyncEngine engine(make_client(logger), no_registry(), quick_engine_options(), logger);
  std::string error;
  auto job = engine.create_job("Ghost", root / "src", ghost, std::nullopt, error);
  if(!job) return false;
  if(engine.start_job(job->id, error) || error != "Target device is not reachable") return false;
  auto failed = engine.job(job->id);
  if(!failed || failed->phase != SyncPhase::Error) return false;

  // the registry's live address wins over the stale one
  SyncPeer peer(root / "downloads");
  SyncEngine rerouted(make_client(), [&](const std::string& id) -> std::optional<Device> {
    if(id == "ghost-id") {
      auto live = peer.device();
      live.id = id;
      return live;
    }
    return std::nullopt;
  }, quick_engine_options());
  auto moved = rerouted.create_job("Moved", root / "src", ghost, std::nullopt, error);
  if(!moved || !rerouted.start_job(moved->id, error)) return false;
  bool synced = wait_for_phase(rerouted, moved->id, SyncPhase::Watching);
  rerouted.stop();
  return synced && rerouted.job(moved->id)->target_device_ip == "127.0.0.1";
}

bool test_engine_target_lost_mid_batch(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_engine_lost");
  SyncPeer peer(root / "downloads");
  ctx.logs.attach(peer.logger());
  for(const char* name : {"1.txt", "2.txt", "3.txt", "4.txt"}) {
    anyware::test::write_file(root / "src" / name, name);
  }

  auto options = quick_engine_options();
  options.liveness_every = 2;
  options.liveness_interval = 0ms;
  options.reconnect_delays = {40ms, 80ms, 160ms};
  auto logger = std::make_shared<Logger>("sync-engine");
  ctx.logs.attach(logger);
  SyncEngine engine(make_client(logger), no_registry(), options, logger);

  // the target disappears once the first file has landed
  std::atomic<bool> offline{false};
  engine.subscribe([&](const SyncJob& job) {
    if(job.synced_count == 1 && !offline.exchange(true)) peer.go_offline();
  });

  std::string error;
  auto job = engine.create_job("Lost", root / "src", peer.device(), std::nullopt, error);
  if(!job || !engine.start_job(job->id, error)) return false;
  auto started = std::chrono::steady_clock::now();
  if(!wait_for_phase(engine, job->id, SyncPhase::Error)) return false;
  auto elapsed = std::chrono::steady_clock::now() - started;

  auto failed = engine.job(job->id);
  engine.stop();
  // every rung of the reconnect ladder is waited out before giving up
  return failed->status == "Target device is not reachable" &&
         failed->synced_count == 1 &&
         elapsed >= 280ms &&
         peer.count(SyncActivity::Kind::Received) == 1 &&
         ctx.logs.contains("not responding, pinging again in 160 ms");
}

bool test_schedule_skips_missing_source(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_schedule_missing");
  anyware::test::write_file(root / "src" / "a.txt", "a");
  auto logger = std::make_shared<Logger>("sync-engine");
  ctx.logs.attach(logger);
  SyncEngine engine(make_client(logger), no_registry(), quick_engine_options(), logger);

  SyncSchedule schedule;
  schedule.type = ScheduleType::Interval;
  schedule.interval = std::chrono::minutes(30);
  std::string error;
  auto job = engine.create_job("Nightly", root / "src", laptop(), schedule, error);
  if(!job || !engine.scheduler().next_fire(job->id)) return false;

  std::filesystem::remove_all(root / "src");
  std::vector<std::string> statuses;
  engine.subscribe([&](const SyncJob& j){ statuses.push_back(j.status); });
  engine.on_schedule_fire(job->id);

  auto after = engine.job(job->id);
  if(!after || after->phase != SyncPhase::Idle) return false;
  if(after->status != "Scheduled sync skipped: source directory not found") return false;
  if(statuses.empty() || statuses.back() != after->status) return false;

  std::string start_error;
  return !engine.start_job(job->id, start_error) &&
         start_error.find("Source directory does not exist") == 0 &&
         ctx.logs.contains("source directory not found");
}

bool test_jobs_survive_restart(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("sync_persist");
  std::filesystem::create_directories(root / "photos");
  auto jobs_file = root / ".config" / "sync_jobs.json";

  SyncSchedule schedule;
  schedule.type = ScheduleType::Daily;
  schedule.hour = 3;
  schedule.minute = 15;
  std::string id;
  {
    SyncEngine engine(make_client(), no_registry(), quick_engine_options(jobs_file));
    std::string error;
    auto job = engine.create_job("", root / "photos", laptop(), schedule, error);
    if(!job || job->name != "photos") return false;
    if(!engine.rename_job(job->id, "Photos")) return false;
    SyncSchedule bad;
    bad.type = ScheduleType::Weekly;
    if(engine.update_schedule(job->id, bad, error)) return false;
    id = job->id;
  }

  auto logger = std::make_shared<Logger>("sync-engine");
  ctx.logs.attach(logger);
  SyncEngine reloaded(make_client(), no_registry(), quick_engine_options(jobs_file), logger);
  reloaded.start();
  auto job = reloaded.job(id);
  if(!job || job->name != "Photos" || job->phase != SyncPhase::Idle || job->status != "Ready") return false;
  if(!job->schedule || job->schedule->type != ScheduleType::Daily || job->schedule->minute != 15) return false;
  if(job->target_device_id != "laptop-id" || job->target_device_ip != "127.0.0.1") return false;
  if(!reloaded.scheduler().next_fire(id)) return false;

  std::string error;
  if(!reloaded.update_schedule(id, std::nullopt, error) || reloaded.scheduler().next_fire(id)) return false;
  if(!reloaded.delete_job(id) || reloaded.delete_job(id)) return false;
  reloaded.stop();

  SyncEngine empty(make_client(), no_registry(), quick_engine_options(jobs_file));
  empty.load();
  return empty.jobs().empty() && ctx.logs.contains("Loaded 1 sync jobs");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"receiver_upload_check_delete", test_receiver_upload_check_delete},
    {"receiver_rejects_bad_requests", test_receiver_rejects_bad_requests},
    {"receiver_drops_partial_upload", test_receiver_drops_partial_upload},
    {"engine_mirrors_and_skips_unchanged", test_engine_mirrors_and_skips_unchanged},
    {"engine_follows_changes_and_deletes", test_engine_follows_changes_and_deletes},
    {"engine_pause_and_resume", test_engine_pause_and_resume},
    {"engine_skip_request", test_engine_skip_request},
    {"engine_unreachable_target", test_engine_unreachable_target},
    {"engine_target_lost_mid_batch", test_engine_target_lost_mid_batch},
    {"schedule_skips_missing_source", test_schedule_skips_missing_source},
    {"jobs_survive_restart", test_jobs_survive_restart},
  };
  return anyware::test::run_tests("sync", tests, argc, argv);
}

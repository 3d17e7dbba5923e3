#include "clipboard.hpp"
#include "device.hpp"
#include "file_sender.hpp"
#include "http_client.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "transfer.hpp"
#include "transfer_queue.hpp"
#include "transfer_receiver.hpp"
#include "utils.hpp"

#include <algorithm>
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

// One receiving device: transfer and clipboard routes on a loopback port.
class ReceiverPeer {
public:
  ReceiverPeer(const std::string& name, const std::filesystem::path& downloads,
               HttpServer::Options server_options = HttpServer::Options{})
    : downloads_(downloads),
      logger_(std::make_shared<Logger>(name)),
      receiver_([this]{ return device_; }, TransferReceiver::Options{downloads, false, 0}, logger_),
      clipboard_([this]{ return device_; }, [this]{ return downloads_; }, ClipboardService::Options{}, logger_),
      server_(logger_, server_options) {
    server_.mount(receiver_.router());
    server_.mount(clipboard_.router());
    auto port = server_.start();
    device_ = Device::create_local(name, "127.0.0.1", port, "linux");
  }

  const Device& device() const { return device_; }
  const std::filesystem::path& downloads() const { return downloads_; }
  TransferReceiver& receiver() { return receiver_; }
  ClipboardService& clipboard() { return clipboard_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  std::filesystem::path downloads_;
  std::shared_ptr<Logger> logger_;
  Device device_;
  TransferReceiver receiver_;
  ClipboardService clipboard_;
  LoopbackServer server_;
};

FileSender::Options quick_sender_options() {
  FileSender::Options options;
  options.ping_timeout = 2000ms;
  options.handshake_timeout = 5000ms;
  options.retry_base_delay = 10ms;
  options.max_attempts = 2;
  options.chunk_size = 4096;
  return options;
}

Device sender_device() {
  return Device::create_local("Sender", "127.0.0.1", kDefaultTransferPort, "linux", "sender-id");
}

std::string pattern_bytes(std::size_t size) {
  std::string out(size, '\0');
  for(std::size_t i = 0; i < size; ++i) out[i] = static_cast<char>('a' + (i * 7) % 26);
  return out;
}

bool no_temp_files(const std::filesystem::path& dir) {
  std::error_code ec;
  for(auto it = std::filesystem::recursive_directory_iterator(dir, ec);
      !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if(it->path().extension() == ".tmp") return false;
  }
  return true;
}

// Answers ping normally and send-request with a scripted status per call;
// once the script runs out every call gets the last entry.
class ScriptedHandshakePeer {
public:
  ScriptedHandshakePeer(std::shared_ptr<Logger> logger, std::vector<int> statuses)
    : statuses_(std::move(statuses)),
      server_(std::move(logger)) {
    auto router = std::make_shared<HttpRouter>();
    router->get("/api/ping", [](const HttpRequest&, const RouteParams&){
      return HttpResponse::json(200, make_ping_response());
    });
    router->post("/api/send-request", [this](const HttpRequest&, const RouteParams&){
      std::size_t call = calls_++;
      int status = statuses_[std::min(call, statuses_.size() - 1)];
      if(status != 200) return HttpResponse::json(status, make_error_body("busy"));
      SendResponse declined;
      declined.accepted = false;
      declined.transfer_id = "scripted-1";
      return HttpResponse::json(200, declined.to_json());
    });
    server_.mount(router);
    auto port = server_.start();
    device_ = Device::create_local("Scripted", "127.0.0.1", port, "linux", "scripted-id");
  }

  const Device& device() const { return device_; }
  std::size_t calls() const { return calls_.load(); }

private:
  std::vector<int> statuses_;
  std::atomic<std::size_t> calls_{0};
  Device device_;
  LoopbackServer server_;
};

bool test_send_to_three_peers(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("send_three");
  auto source = root / "outbox" / "report.bin";
  auto payload = pattern_bytes(100 * 1024 + 17);
  anyware::test::write_file(source, payload);

  std::vector<std::unique_ptr<ReceiverPeer>> peers;
  for(const char* name : {"Alpha", "Beta", "Gamma"}) {
    peers.push_back(std::make_unique<ReceiverPeer>(name, root / name));
    ctx.logs.attach(peers.back()->logger());
  }

  auto sender_logger = std::make_shared<Logger>("sender");
  ctx.logs.attach(sender_logger);
  FileSender sender(sender_device, quick_sender_options(), sender_logger);
  TransferQueue queue([&](const Device& target, const std::filesystem::path& path){
    return sender.send_file(target, path);
  });
  for(const auto& peer : peers) queue.enqueue(peer->device(), source);

  bool drained = anyware::test::wait_for_condition([&]{
    return queue.history().size() == peers.size();
  }, 20s);
  if(!drained) return false;
  for(const auto& item : queue.history()) {
    if(item.status != QueueStatus::Completed) return false;
  }
  for(const auto& peer : peers) {
    if(anyware::test::read_file(peer->downloads() / "report.bin") != payload) return false;
    auto transfers = peer->receiver().transfers();
    if(transfers.size() != 1 || transfers.front().status != TransferStatus::Completed) return false;
    if(transfers.front().sender.name != "Sender") return false;
  }
  return true;
}

bool test_rejected_transfer_uploads_nothing(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("rejected");
  auto source = root / "secret.txt";
  anyware::test::write_file(source, "do not send");

  ReceiverPeer peer("Picky", root / "downloads");
  ctx.logs.attach(peer.logger());
  peer.receiver().set_acceptance_policy([](const Transfer& t){ return t.file_name != "secret.txt"; });

  FileSender sender(sender_device, quick_sender_options());
  auto result = sender.send_file(peer.device(), source);
  if(result.status != TransferStatus::Rejected) return false;

  std::error_code ec;
  if(std::filesystem::exists(peer.downloads() / "secret.txt", ec)) return false;
  auto stored = peer.receiver().transfer(result.id);
  if(!stored || stored->status != TransferStatus::Rejected) return false;

  // the upload route refuses a transfer that was never accepted
  HttpClient client("127.0.0.1", peer.device().port);
  auto upload = client.request("POST", "/api/upload/" + result.id, {}, "do not send", 2000ms);
  return upload.status == 403;
}

bool test_size_mismatch_fails_and_cleans_up(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("mismatch");
  ReceiverPeer peer("Strict", root / "downloads");
  ctx.logs.attach(peer.logger());

  SendRequest request;
  request.file_name = "short.bin";
  request.file_size = 10;
  request.sender_id = "sender-id";
  request.sender_name = "Sender";

  HttpClient handshake("127.0.0.1", peer.device().port);
  auto response = handshake.post_json("/api/send-request", request.to_json(), 2000ms);
  auto doc = response.json();
  if(!response.ok() || !doc) return false;
  auto send = SendResponse::from_json(*doc);
  if(!send || !send->accepted) return false;

  HttpClient upload("127.0.0.1", peer.device().port);
  auto result = upload.request("POST", "/api/upload/" + send->transfer_id, {}, "12345", 2000ms);
  if(result.status != 500) return false;

  auto stored = peer.receiver().transfer(send->transfer_id);
  if(!stored || stored->status != TransferStatus::Failed) return false;
  std::error_code ec;
  return !std::filesystem::exists(peer.downloads() / "short.bin", ec) && no_temp_files(peer.downloads());
}

bool test_dropped_upload_fails_and_cleans_up(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("dropped");
  ReceiverPeer peer("Dropped", root / "downloads");
  ctx.logs.attach(peer.logger());

  SendRequest request;
  request.file_name = "big.bin";
  request.file_size = 1000;
  request.sender_id = "sender-id";
  request.sender_name = "Sender";
  HttpClient handshake("127.0.0.1", peer.device().port);
  auto doc = handshake.post_json("/api/send-request", request.to_json(), 2000ms).json();
  if(!doc) return false;
  auto send = SendResponse::from_json(*doc);
  if(!send || !send->accepted) return false;

  {
    HttpClient upload("127.0.0.1", peer.device().port);
    if(upload.begin("POST", "/api/upload/" + send->transfer_id, {}, 1000, 2000ms)) return false;
    auto part = pattern_bytes(100);
    if(upload.write(part.data(), part.size(), 2000ms)) return false;
    upload.close();
  }

  bool failed = anyware::test::wait_for_condition([&]{
    auto stored = peer.receiver().transfer(send->transfer_id);
    return stored && stored->status == TransferStatus::Failed;
  }, 5s);
  std::error_code ec;
  return failed && no_temp_files(peer.downloads()) &&
         !std::filesystem::exists(peer.downloads() / "big.bin", ec);
}

bool test_stalled_upload_times_out(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("stalled");
  HttpServer::Options server_options;
  server_options.idle_timeout = 300ms;
  ReceiverPeer peer("Stalled", root / "downloads", server_options);
  ctx.logs.attach(peer.logger());

  SendRequest request;
  request.file_name = "half.bin";
  request.file_size = 1000;
  request.sender_id = "sender-id";
  request.sender_name = "Sender";
  HttpClient handshake("127.0.0.1", peer.device().port);
  auto doc = handshake.post_json("/api/send-request", request.to_json(), 2000ms).json();
  if(!doc) return false;
  auto send = SendResponse::from_json(*doc);
  if(!send || !send->accepted) return false;

  // half the body, then the sender goes quiet with the socket still open
  HttpClient upload("127.0.0.1", peer.device().port);
  if(upload.begin("POST", "/api/upload/" + send->transfer_id, {}, 1000, 2000ms)) return false;
  auto part = pattern_bytes(500);
  if(upload.write(part.data(), part.size(), 2000ms)) return false;

  bool failed = anyware::test::wait_for_condition([&]{
    auto stored = peer.receiver().transfer(send->transfer_id);
    return stored && stored->status == TransferStatus::Failed;
  }, 5s);
  upload.close();
  std::error_code ec;
  return failed && no_temp_files(peer.downloads()) &&
         !std::filesystem::exists(peer.downloads() / "half.bin", ec) &&
         ctx.logs.contains("stalled after 500 of 1000 bytes");
}

bool test_progress_is_monotonic(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("progress");
  auto source = root / "movie.bin";
  anyware::test::write_file(source, pattern_bytes(256 * 1024));
  ReceiverPeer peer("Watcher", root / "downloads");
  ctx.logs.attach(peer.logger());

  std::mutex mutex;
  std::vector<std::pair<double, TransferStatus>> sent_events;
  std::vector<std::pair<double, TransferStatus>> received_events;

  FileSender sender(sender_device, quick_sender_options());
  sender.subscribe([&](const Transfer& t){
    std::lock_guard<std::mutex> lock(mutex);
    sent_events.emplace_back(t.progress, t.status);
  });
  peer.receiver().subscribe([&](const Transfer& t){
    std::lock_guard<std::mutex> lock(mutex);
    received_events.emplace_back(t.progress, t.status);
  });

  auto result = sender.send_file(peer.device(), source);
  if(result.status != TransferStatus::Completed || result.progress != 1.0) return false;
  if(anyware::test::read_file(peer.downloads() / "movie.bin").size() != 256 * 1024) return false;

  std::lock_guard<std::mutex> lock(mutex);
  for(const auto* events : {&sent_events, &received_events}) {
    double last = 0.0;
    for(const auto& event : *events) {
      if(event.first < last) return false;
      if(event.first >= 1.0 && event.second != TransferStatus::Completed) return false;
      last = event.first;
    }
    if(events->empty() || events->back().second != TransferStatus::Completed) return false;
  }
  return true;
}

bool test_unreachable_device_fails(TestContext&) {
  auto root = anyware::test::fresh_directory("unreachable");
  auto source = root / "a.txt";
  anyware::test::write_file(source, "x");

  // grab a free port and release it so nothing listens there
  uint16_t port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }
  auto target = Device::create_local("Ghost", "127.0.0.1", port, "linux");
  auto options = quick_sender_options();
  options.ping_timeout = 500ms;
  FileSender sender(sender_device, options);
  auto result = sender.send_file(target, source);
  return result.status == TransferStatus::Failed && result.error == "Device is not reachable";
}

bool test_handshake_retries_server_errors(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("handshake_retry");
  auto source = root / "a.txt";
  anyware::test::write_file(source, "retry me");

  auto logger = std::make_shared<Logger>("sender");
  ctx.logs.attach(logger);
  ScriptedHandshakePeer peer(logger, {503, 502, 200});
  auto options = quick_sender_options();
  options.max_attempts = 3;
  options.retry_base_delay = 50ms;
  FileSender sender(sender_device, options, logger);

  auto started = std::chrono::steady_clock::now();
  auto result = sender.send_file(peer.device(), source);
  auto elapsed = std::chrono::steady_clock::now() - started;
  // waits 50 ms then 100 ms between the three attempts
  return result.status == TransferStatus::Rejected &&
         result.id == "scripted-1" &&
         peer.calls() == 3 &&
         elapsed >= 150ms &&
         ctx.logs.contains("Send request attempt 2 failed");
}

bool test_handshake_client_error_not_retried(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("handshake_client_error");
  auto source = root / "a.txt";
  anyware::test::write_file(source, "no retry");

  auto logger = std::make_shared<Logger>("sender");
  ctx.logs.attach(logger);
  ScriptedHandshakePeer peer(logger, {400});
  auto options = quick_sender_options();
  options.max_attempts = 3;
  FileSender sender(sender_device, options, logger);

  auto result = sender.send_file(peer.device(), source);
  return result.status == TransferStatus::Failed &&
         result.error.rfind("Could not reach device: ", 0) == 0 &&
         peer.calls() == 1 &&
         !ctx.logs.contains("Send request attempt 1 failed");
}

bool test_cancel_interrupts_retry_wait(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("cancel_backoff");
  auto source = root / "a.txt";
  anyware::test::write_file(source, "never sent");

  auto logger = std::make_shared<Logger>("sender");
  ctx.logs.attach(logger);
  ScriptedHandshakePeer peer(logger, {503});
  auto options = quick_sender_options();
  options.max_attempts = 3;
  options.retry_base_delay = 30s;
  FileSender sender(sender_device, options, logger);

  std::vector<TransferStatus> statuses;
  std::mutex statuses_mutex;
  sender.subscribe([&](const Transfer& t){
    std::lock_guard<std::mutex> lock(statuses_mutex);
    statuses.push_back(t.status);
  });

  Transfer result;
  std::thread sending([&]{ result = sender.send_file(peer.device(), source); });
  bool first_attempt = anyware::test::wait_for_condition([&]{ return peer.calls() == 1; }, 5s);
  std::this_thread::sleep_for(50ms);
  auto cancelled_at = std::chrono::steady_clock::now();
  sender.cancel();
  sending.join();
  auto waited = std::chrono::steady_clock::now() - cancelled_at;

  std::lock_guard<std::mutex> lock(statuses_mutex);
  return first_attempt &&
         result.status == TransferStatus::Cancelled &&
         waited < 5s &&
         peer.calls() == 1 &&
         !statuses.empty() && statuses.back() == TransferStatus::Cancelled;
}

bool test_folder_send_keeps_structure(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("folder_send");
  anyware::test::write_file(root / "Album" / "one.jpg", "1");
  anyware::test::write_file(root / "Album" / "nested" / "two.jpg", "22");
  ReceiverPeer peer("Gallery", root / "downloads");
  ctx.logs.attach(peer.logger());

  FileSender sender(sender_device, quick_sender_options());
  auto results = sender.send_folder(peer.device(), root / "Album");
  if(results.size() != 2) return false;
  for(const auto& t : results) {
    if(t.status != TransferStatus::Completed) return false;
  }
  if(anyware::test::read_file(peer.downloads() / "Album" / "nested" / "two.jpg") != "22") return false;

  std::filesystem::create_directories(root / "Empty");
  try {
    sender.send_folder(peer.device(), root / "Empty");
    return false;
  } catch(const std::invalid_argument&) {
  }
  return true;
}

bool test_receiver_route_errors(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("route_errors");
  ReceiverPeer peer("Routes", root / "downloads");
  ctx.logs.attach(peer.logger());
  HttpClient client("127.0.0.1", peer.device().port);

  if(client.get("/api/status/nope", 2000ms).status != 404) return false;
  if(client.request("POST", "/api/upload/nope", {}, "abc", 2000ms).status != 404) return false;
  if(client.request("POST", "/api/send-request", {}, "{not json", 2000ms).status != 400) return false;
  if(client.post_json("/api/send-request", {{"fileName", "a"}}, 2000ms).status != 400) return false;
  if(client.get("/api/unknown", 2000ms).status != 404) return false;

  auto info = client.get("/api/info", 2000ms).json();
  auto device = info ? Device::from_json(*info) : std::nullopt;
  if(!device || device->name != "Routes") return false;
  auto ping = client.get("/api/ping", 2000ms).json();
  return ping && (*ping)["status"] == "ok";
}

bool test_traversal_file_name_rejected(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("traversal");
  ReceiverPeer peer("Guarded", root / "downloads");
  ctx.logs.attach(peer.logger());

  SendRequest request;
  request.file_name = "../escape.txt";
  request.file_size = 3;
  request.sender_id = "s";
  request.sender_name = "Sender";
  HttpClient client("127.0.0.1", peer.device().port);
  auto doc = client.post_json("/api/send-request", request.to_json(), 2000ms).json();
  auto send = doc ? SendResponse::from_json(*doc) : std::nullopt;
  if(!send) return false;
  auto upload = client.request("POST", "/api/upload/" + send->transfer_id, {}, "abc", 2000ms);
  std::error_code ec;
  return upload.status == 400 && !std::filesystem::exists(root / "escape.txt", ec);
}

bool test_clipboard_push(TestContext& ctx) {
  auto root = anyware::test::fresh_directory("clipboard");
  ReceiverPeer peer("Desk", root / "downloads");
  ctx.logs.attach(peer.logger());

  std::vector<ClipboardEntry> received;
  std::mutex mutex;
  peer.clipboard().subscribe([&](const ClipboardEntry& entry){
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(entry);
  });

  ClipboardService local([]{ return sender_device(); }, [root]{ return root / "local"; }, ClipboardService::Options{});
  std::string error;
  if(!local.send_text(peer.device(), "hello desk", error)) return false;
  if(local.send_text(peer.device(), "", error) || error.empty()) return false;

  auto image = root / "pixel.png";
  anyware::test::write_file(image, "\x89PNG fake");
  if(!local.send_image(peer.device(), image, error)) return false;

  HttpClient client("127.0.0.1", peer.device().port);
  auto bad = client.post_json("/api/clipboard", {{"type", "image"}, {"imageBase64", "@@@"}}, 2000ms);
  if(bad.status != 400) return false;

  std::lock_guard<std::mutex> lock(mutex);
  if(received.size() != 2) return false;
  if(received[0].text != "hello desk" || received[0].sender_name != "Sender") return false;
  if(received[1].kind != ClipboardKind::Image) return false;
  if(anyware::test::read_file(received[1].image_path) != "\x89PNG fake") return false;
  return peer.clipboard().history().entries().size() == 2;
}

bool test_queue_is_fifo_and_serial(TestContext&) {
  std::atomic<int> in_flight{0};
  std::atomic<bool> overlapped{false};
  std::mutex mutex;
  std::vector<std::string> order;

  TransferQueue queue([&](const Device&, const std::filesystem::path& path){
    if(++in_flight > 1) overlapped = true;
    std::this_thread::sleep_for(20ms);
    {
      std::lock_guard<std::mutex> lock(mutex);
      order.push_back(path.filename().string());
    }
    --in_flight;
    Transfer t;
    t.status = path.filename() == "bad.txt" ? TransferStatus::Failed : TransferStatus::Completed;
    return t;
  });

  auto target = sender_device();
  std::vector<std::filesystem::path> files = {"a.txt", "b.txt", "bad.txt", "c.txt"};
  auto items = queue.enqueue_all(target, files);
  auto removable = queue.enqueue(target, "removed.txt");
  if(!queue.remove(removable.id)) return false;
  if(queue.remove("q_missing")) return false;

  bool drained = anyware::test::wait_for_condition([&]{
    return queue.history().size() == files.size() && !queue.is_processing();
  }, 5s);
  if(!drained || overlapped) return false;

  std::lock_guard<std::mutex> lock(mutex);
  if(order != std::vector<std::string>{"a.txt", "b.txt", "bad.txt", "c.txt"}) return false;
  auto history = queue.history();
  return history[0].id == items[0].id && history[2].status == QueueStatus::Failed &&
         history[3].status == QueueStatus::Completed && queue.length() == 0;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"send_to_three_peers", test_send_to_three_peers},
    {"rejected_transfer_uploads_nothing", test_rejected_transfer_uploads_nothing},
    {"size_mismatch_fails_and_cleans_up", test_size_mismatch_fails_and_cleans_up},
    {"dropped_upload_fails_and_cleans_up", test_dropped_upload_fails_and_cleans_up},
    {"stalled_upload_times_out", test_stalled_upload_times_out},
    {"progress_is_monotonic", test_progress_is_monotonic},
    {"unreachable_device_fails", test_unreachable_device_fails},
    {"handshake_retries_server_errors", test_handshake_retries_server_errors},
    {"handshake_client_error_not_retried", test_handshake_client_error_not_retried},
    {"cancel_interrupts_retry_wait", test_cancel_interrupts_retry_wait},
    {"folder_send_keeps_structure", test_folder_send_keeps_structure},
    {"receiver_route_errors", test_receiver_route_errors},
    {"traversal_file_name_rejected", test_traversal_file_name_rejected},
    {"clipboard_push", test_clipboard_push},
    {"queue_is_fifo_and_serial", test_queue_is_fifo_and_serial},
  };
  return anyware::test::run_tests("transfer", tests, argc, argv);
}

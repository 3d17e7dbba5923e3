#include "transfer_receiver.hpp"

#include <algorithm>
#include <fstream>

#include "protocol.hpp"
#include "utils.hpp"

class ReceiverUploadSink : public UploadSink {
public:
  ReceiverUploadSink(TransferReceiver& receiver,
                     std::string transfer_id,
                     uint64_t expected_size,
                     std::filesystem::path final_path,
                     bool overwrite)
    : receiver_(receiver),
      transfer_id_(std::move(transfer_id)),
      expected_size_(expected_size),
      final_path_(std::move(final_path)),
      temp_path_(final_path_.string() + ".tmp"),
      overwrite_(overwrite) {}

  bool open() {
    out_.open(temp_path_, std::ios::binary | std::ios::trunc);
    return static_cast<bool>(out_);
  }

  bool write(const char* data, std::size_t size) override {
    out_.write(data, static_cast<std::streamsize>(size));
    if(!out_) {
      receiver_.logger_->error("Write to {} failed", temp_path_.string());
      return false;
    }
    received_ += size;
    // 1.0 is reserved for a verified, renamed file
    if(expected_size_ > 0 && received_ < expected_size_) {
      double progress = static_cast<double>(received_) / static_cast<double>(expected_size_);
      receiver_.update(transfer_id_, [progress](Transfer& t){
        if(progress > t.progress) t.progress = progress;
      });
    }
    return true;
  }

  HttpResponse finish(uint64_t received, bool complete) override {
    out_.close();
    std::error_code ec;
    if(!complete || received != expected_size_ || received_ != expected_size_) {
      std::filesystem::remove(temp_path_, ec);
      auto message = "Incomplete transfer: received " + std::to_string(received) +
                     " of " + std::to_string(expected_size_) + " bytes";
      receiver_.fail(transfer_id_, message);
      return HttpResponse::json(500, make_error_body("Incomplete transfer"));
    }

    auto destination = final_path_;
    if(!overwrite_) destination = unique_destination(final_path_);
    std::filesystem::rename(temp_path_, destination, ec);
    if(ec) {
      std::error_code ignored;
      std::filesystem::remove(temp_path_, ignored);
      receiver_.fail(transfer_id_, "Could not save file: " + ec.message());
      return HttpResponse::json(500, make_error_body("Could not save file"));
    }

    receiver_.update(transfer_id_, [&](Transfer& t){
      t.status = TransferStatus::Completed;
      t.progress = 1.0;
      t.saved_path = destination.string();
      t.error.clear();
    });
    receiver_.logger_->info("Received {} ({}) -> {}", final_path_.filename().string(),
                            format_size(expected_size_), destination.string());
    UploadResult result{transfer_id_, destination.string()};
    return HttpResponse::json(200, result.to_json());
  }

private:
  TransferReceiver& receiver_;
  std::string transfer_id_;
  uint64_t expected_size_ = 0;
  std::filesystem::path final_path_;
  std::filesystem::path temp_path_;
  bool overwrite_ = false;
  std::ofstream out_;
  uint64_t received_ = 0;
};

TransferReceiver::TransferReceiver(LocalDeviceProvider local_device,
                                   Options options,
                                   std::shared_ptr<Logger> logger)
  : local_device_(std::move(local_device)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer-receiver")),
    options_(std::move(options)) {}

std::shared_ptr<HttpRouter> TransferReceiver::router() {
  auto router = std::make_shared<HttpRouter>();
  router->get("/api/ping", [](const HttpRequest&, const RouteParams&){
    return HttpResponse::json(200, make_ping_response());
  });
  router->get("/api/info", [this](const HttpRequest&, const RouteParams&){
    return HttpResponse::json(200, local_device_().to_json());
  });
  router->post("/api/send-request", [this](const HttpRequest& request, const RouteParams&){
    return handle_send_request(request);
  });
  router->post_stream("/api/upload/{transferId}", [this](const HttpRequest& request, const RouteParams& params){
    return begin_upload(params.at("transferId"), request);
  });
  router->get("/api/status/{transferId}", [this](const HttpRequest&, const RouteParams& params){
    return handle_status(params.at("transferId"));
  });
  return router;
}

void TransferReceiver::set_acceptance_policy(AcceptancePolicy policy) {
  std::lock_guard<std::mutex> lock(mutex_);
  policy_ = std::move(policy);
}

void TransferReceiver::set_overwrite(bool overwrite) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.overwrite = overwrite;
}

void TransferReceiver::set_max_file_size(uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.max_file_size = bytes;
}

void TransferReceiver::set_download_root(const std::filesystem::path& root) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.download_root = root;
}

std::filesystem::path TransferReceiver::download_root() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return options_.download_root;
}

HttpResponse TransferReceiver::handle_send_request(const HttpRequest& request) {
  auto doc = nlohmann::json::parse(request.body, nullptr, false);
  if(doc.is_discarded()) {
    return HttpResponse::json(400, make_error_body("Invalid JSON body"));
  }
  std::string error;
  auto req = SendRequest::from_json(doc, error);
  if(!req) {
    return HttpResponse::json(400, make_error_body(error));
  }

  Transfer transfer;
  transfer.id = random_uuid();
  transfer.file_name = req->file_name;
  transfer.file_size = req->file_size;
  transfer.sender.id = req->sender_id;
  transfer.sender.name = req->sender_name;
  transfer.sender.ip = req->sender_ip.empty() ? request.remote_address : req->sender_ip;
  transfer.sender.port = req->sender_port;
  transfer.sender.platform = req->sender_platform;
  transfer.sender.version = req->sender_version;
  transfer.sender.last_seen = WallClock::now();
  transfer.receiver = local_device_();
  transfer.status = TransferStatus::Pending;
  transfer.is_sending = false;

  AcceptancePolicy policy;
  uint64_t max_size = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_[transfer.id] = transfer;
    policy = policy_;
    max_size = options_.max_file_size;
  }
  events_.publish(transfer);
  logger_->info("Incoming {} ({}) from {} [{}]", transfer.file_name, format_size(transfer.file_size),
                transfer.sender.name, transfer.sender.ip);

  bool accepted = true;
  std::string reason;
  if(max_size > 0 && transfer.file_size > max_size) {
    accepted = false;
    reason = "File exceeds the " + format_size(max_size) + " limit";
  } else if(policy) {
    try {
      accepted = policy(transfer);
      if(!accepted) reason = "Declined by receiver";
    } catch(const std::exception& e) {
      accepted = false;
      reason = std::string("Acceptance check failed: ") + e.what();
      logger_->error("Acceptance policy failed for {}: {}", transfer.file_name, e.what());
    }
  }

  update(transfer.id, [&](Transfer& t){
    t.status = accepted ? TransferStatus::Accepted : TransferStatus::Rejected;
    t.error = reason;
  });
  if(!accepted) {
    logger_->info("Rejected {} from {}: {}", transfer.file_name, transfer.sender.name, reason);
  }
  return HttpResponse::json(200, SendResponse{accepted, transfer.id}.to_json());
}

StreamStart TransferReceiver::begin_upload(const std::string& transfer_id, const HttpRequest& request) {
  StreamStart start;
  Transfer snapshot;
  Options options;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if(it == transfers_.end()) {
      start.response = HttpResponse::json(404, make_error_body("Transfer not found"));
      return start;
    }
    if(it->second.status != TransferStatus::Accepted) {
      start.response = HttpResponse::json(403, make_error_body(
        std::string("Transfer is ") + to_string(it->second.status)));
      return start;
    }
    snapshot = it->second;
    options = options_;
  }

  auto destination = resolve_under(options.download_root, snapshot.file_name);
  if(!destination) {
    fail(transfer_id, "Invalid file name");
    start.response = HttpResponse::json(400, make_error_body("Invalid file name"));
    return start;
  }
  std::error_code ec;
  std::filesystem::create_directories(destination->parent_path(), ec);
  if(ec) {
    fail(transfer_id, "Could not create " + destination->parent_path().string() + ": " + ec.message());
    start.response = HttpResponse::json(500, make_error_body("Could not create download directory"));
    return start;
  }

  auto final_path = options.overwrite ? *destination : unique_destination(*destination);
  auto sink = std::make_shared<ReceiverUploadSink>(*this, transfer_id, snapshot.file_size,
                                                   final_path, options.overwrite);
  if(!sink->open()) {
    fail(transfer_id, "Could not open " + final_path.string() + ".tmp");
    start.response = HttpResponse::json(500, make_error_body("Could not open destination file"));
    return start;
  }

  if(auto length = request.content_length(); length && *length != snapshot.file_size) {
    logger_->warn("Upload {} announces {} bytes but the request declared {}",
                  transfer_id, *length, snapshot.file_size);
  }
  update(transfer_id, [](Transfer& t){
    t.status = TransferStatus::Transferring;
  });
  start.sink = std::move(sink);
  return start;
}

HttpResponse TransferReceiver::handle_status(const std::string& transfer_id) const {
  auto found = transfer(transfer_id);
  if(!found) return HttpResponse::json(404, make_error_body("Transfer not found"));
  return HttpResponse::json(200, found->to_json());
}

std::optional<Transfer> TransferReceiver::update(const std::string& id,
                                                 const std::function<void(Transfer&)>& fn) {
  Transfer copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if(it == transfers_.end()) return std::nullopt;
    fn(it->second);
    copy = it->second;
  }
  events_.publish(copy);
  return copy;
}

void TransferReceiver::fail(const std::string& id, const std::string& error) {
  logger_->error("Transfer {} failed: {}", id, error);
  update(id, [&](Transfer& t){
    t.status = TransferStatus::Failed;
    t.error = error;
  });
}

std::optional<Transfer> TransferReceiver::transfer(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transfers_.find(id);
  if(it == transfers_.end()) return std::nullopt;
  return it->second;
}

std::vector<Transfer> TransferReceiver::transfers() const {
  std::vector<Transfer> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& entry : transfers_) out.push_back(entry.second);
  std::sort(out.begin(), out.end(), [](const Transfer& a, const Transfer& b){
    return a.created_at > b.created_at;
  });
  return out;
}

SubscriptionHandle TransferReceiver::subscribe(EventChannel<Transfer>::Callback callback) {
  return events_.subscribe(std::move(callback));
}

void TransferReceiver::unsubscribe(SubscriptionHandle handle) {
  events_.unsubscribe(handle);
}
